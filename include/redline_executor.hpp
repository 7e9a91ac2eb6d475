// redline_executor.hpp - Redline Document Patch Engine - Patch Executor
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef REDLINE_EXECUTOR_HPP
#define REDLINE_EXECUTOR_HPP

#include "redline_locator.hpp"
#include "redline_table.hpp"

#include <set>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace redline
{
//========================================================================
// Execution state machine
//========================================================================

    enum class exec_state
    {
        pending,
        locating,
        applying,
        applied,
        failed,
    };

    inline std::string_view to_string(exec_state state)
    {
        switch (state)
        {
            case exec_state::pending:  return "Pending";
            case exec_state::locating: return "Locating";
            case exec_state::applying: return "Applying";
            case exec_state::applied:  return "Applied";
            case exec_state::failed:   return "Failed";
        }
        return "Unknown";
    }

    // Pending -> Locating -> Applying -> {Applied | Failed}. Locating may also
    // fail, and Failed re-enters Locating only on a retry.
    class execution_state
    {
    public:
        exec_state current() const noexcept { return current_; }

        void transition(exec_state next, bool via_retry = false)
        {
            bool legal = false;
            switch (current_)
            {
                case exec_state::pending:  legal = next == exec_state::locating; break;
                case exec_state::locating: legal = next == exec_state::applying || next == exec_state::failed; break;
                case exec_state::applying: legal = next == exec_state::applied || next == exec_state::failed; break;
                case exec_state::failed:   legal = next == exec_state::locating && via_retry; break;
                case exec_state::applied:  legal = false; break;
            }

            if (!legal)
                throw std::logic_error("illegal execution transition " + std::string(to_string(current_)) + " -> " + std::string(to_string(next)));

            current_ = next;
        }

    private:
        exec_state current_ = exec_state::pending;
    };

//========================================================================
// Results
//========================================================================

    enum class exec_status
    {
        applied,
        failed,
    };

    inline std::string_view to_string(exec_status status)
    {
        return status == exec_status::applied ? "Applied" : "Failed";
    }

    struct execution_result
    {
        std::string                operation_id;
        std::string                kind;          // "REPLACE_TEXT", or the producer's name when malformed
        std::string                description;
        exec_status                status = exec_status::failed;
        std::optional<patch_error> error;
        std::string                detail;
        std::string                strategy;      // the attempt that succeeded
        size_t                     attempts    = 0;
        size_t                     occurrences = 0;
        std::optional<block_ref>   site;          // handle of the edited block, for annotation
        bool                       annotate = true;

        bool applied() const noexcept { return status == exec_status::applied; }
    };

    inline execution_result make_result(operation const & op)
    {
        execution_result r;
        r.operation_id = op.id;
        r.kind         = std::string(to_string(op.kind()));
        r.description  = op.description;
        r.annotate     = op.annotate;
        return r;
    }

    inline execution_result make_result(malformed_operation const & bad)
    {
        execution_result r;
        r.operation_id = bad.id;
        r.kind         = bad.kind;
        if (auto k = detail::parse_operation_kind(bad.kind))
            r.kind = std::string(to_string(*k));
        r.description  = bad.description;
        r.error        = bad.error;
        r.detail       = bad.error.message;
        r.annotate     = false;
        return r;
    }

    struct attempt_config
    {
        match_mode                               mode = match_mode::exact;
        std::optional<std::pair<size_t, size_t>> block_range;
        bool                                     stemmed_keywords = false;
        std::string                              label = "exact";
    };

//========================================================================
// Executor
//========================================================================

    class patch_executor
    {
    public:
        patch_executor(document & doc, patch_options const & opts, comment_sink & sink, llm_assist * assist = nullptr)
            : doc_(doc)
            , opts_(opts)
            , sink_(sink)
            , assist_(assist)
        {}

        // One Locating -> Applying cycle. The state is Pending, or Failed when
        // this is a retry.
        void attempt(operation const & op, attempt_config const & cfg, execution_state & state, execution_result & result);

        // A single attempt with the primary mode.
        execution_result execute(operation const & op);

        // Body position of the most recent edit, resolved from its handle now.
        std::optional<size_t> last_location() const;

        // Only operations that search for free text benefit from weaker matching.
        static bool retryable(operation const & op);

    private:
        document &            doc_;
        patch_options const & opts_;
        comment_sink &        sink_;
        llm_assist *          assist_;

        std::optional<block_ref> last_site_;

        selection find_target(std::string const & text, operation const & op, attempt_config const & cfg,
                              match_scope scope, std::optional<std::string> const & item_number) const;

        std::optional<block_ref> neighbour_of(size_t first, size_t last) const;

        std::optional<patch_error> apply(replace_text const & body, operation const & op, attempt_config const & cfg, execution_state & state, execution_result & result);
        std::optional<patch_error> apply(replace_point_text const & body, operation const & op, attempt_config const & cfg, execution_state & state, execution_result & result);
        std::optional<patch_error> apply(delete_paragraph const & body, operation const & op, attempt_config const & cfg, execution_state & state, execution_result & result);
        std::optional<patch_error> apply(insert_paragraph const & body, operation const & op, attempt_config const & cfg, execution_state & state, execution_result & result);
        std::optional<patch_error> apply(insert_section const & body, operation const & op, attempt_config const & cfg, execution_state & state, execution_result & result);
        std::optional<patch_error> apply(insert_table const & body, operation const & op, attempt_config const & cfg, execution_state & state, execution_result & result);
        std::optional<patch_error> apply(add_comment const & body, operation const & op, attempt_config const & cfg, execution_state & state, execution_result & result);
    };

//================================================================================================================
//
// Executor implementations
//
//================================================================================================================

    namespace detail
    {
        // Non-blank lines, trimmed.
        inline std::vector<std::string> text_lines(std::string_view text)
        {
            std::vector<std::string> out;
            size_t pos = 0;
            while (pos <= text.size())
            {
                size_t nl = text.find('\n', pos);
                auto line = trim_sv(text.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos));
                if (!line.empty())
                    out.emplace_back(line);
                if (nl == std::string_view::npos)
                    break;
                pos = nl + 1;
            }
            return out;
        }

        inline std::string quoted(std::string_view s)
        {
            return "\"" + std::string(s) + "\"";
        }
    }

    inline void patch_executor::attempt(operation const & op, attempt_config const & cfg, execution_state & state, execution_result & result)
    {
        state.transition(exec_state::locating, state.current() == exec_state::failed);
        ++result.attempts;

        auto failure = std::visit([&](auto const & body)
        {
            return this->apply(body, op, cfg, state, result);
        }, op.body);

        if (failure)
        {
            state.transition(exec_state::failed);
            result.status = exec_status::failed;
            result.detail = failure->message;
            result.error  = std::move(failure);
            spdlog::debug("{} attempt [{}] failed: {}", op.id, cfg.label, result.detail);
            return;
        }

        state.transition(exec_state::applied);
        result.status   = exec_status::applied;
        result.error.reset();
        result.strategy = cfg.label;
        if (result.site)
            last_site_ = result.site;
    }

    inline execution_result patch_executor::execute(operation const & op)
    {
        execution_state  state;
        execution_result result = make_result(op);

        attempt_config cfg;
        cfg.mode  = opts_.primary_mode;
        cfg.label = std::string(to_string(opts_.primary_mode));

        attempt(op, cfg, state, result);
        return result;
    }

    inline std::optional<size_t> patch_executor::last_location() const
    {
        if (!last_site_)
            return std::nullopt;
        return doc_.index_of(*last_site_);
    }

    inline bool patch_executor::retryable(operation const & op)
    {
        if (op.is<replace_point_text>())
            return false;
        return !detail::parse_item_number(target_text(op)).has_value();
    }

    // Item numbers resolve to their item; everything else goes through the
    // locator under the attempt's mode.
    inline selection patch_executor::find_target(std::string const & text, operation const & op, attempt_config const & cfg,
                                                 match_scope scope, std::optional<std::string> const & item_number) const
    {
        locator loc(doc_, opts_, assist_);
        selection out;

        std::optional<std::string> number;
        if (!op.is<replace_text>())
            number = detail::parse_item_number(text);

        if (number)
        {
            auto item = loc.find_item(*number);
            if (!item)
            {
                out.error = patch_error{ patch_error_kind::target_not_found, "item " + *number + " not found" };
                return out;
            }

            match_candidate c;
            c.block_index = item->block_index;
            c.row         = item->row;
            c.col         = item->row ? std::optional<size_t>(0) : std::nullopt;
            c.paragraph   = item->paragraph;
            c.begin       = 0;
            c.end         = item->prefix_end;
            c.kind        = item->row ? location_kind::table_cell : item->heading ? location_kind::heading : location_kind::paragraph;
            c.mode        = match_mode::numbered_item;
            c.confidence  = confidence_of(match_mode::numbered_item);
            out.chosen.push_back(c);
            return out;
        }

        locate_hint hint;
        hint.description      = op.description;
        hint.scope            = scope;
        hint.item_number      = item_number;
        hint.block_range      = cfg.block_range;
        hint.stemmed_keywords = cfg.stemmed_keywords;

        out = loc.resolve(text, cfg.mode, hint);
        if (out.chosen.empty() && !out.error)
            out.error = patch_error{ patch_error_kind::target_not_found, detail::quoted(text) + " not found (" + cfg.label + ")" };

        return out;
    }

    // The block that stays next to [first, last) once it is gone.
    inline std::optional<block_ref> patch_executor::neighbour_of(size_t first, size_t last) const
    {
        if (first > 0)
            return doc_.block(first - 1);
        if (last < doc_.block_count())
            return doc_.block(last);
        return std::nullopt;
    }

//------------------------------------------------------------------------

    inline std::optional<patch_error> patch_executor::apply(replace_text const & body, operation const & op, attempt_config const & cfg, execution_state & state, execution_result & result)
    {
        using namespace detail;

        if (auto number = parse_item_number(body.target))
        {
            if (locator(doc_, opts_, assist_).find_item(*number))
                return patch_error{ patch_error_kind::structural_conflict,
                    "target " + quoted(body.target) + " is only an item number; use a full-item replace or delete" };
        }

        auto found = find_target(body.target, op, cfg, body.scope, body.item_number);
        if (found.error)
            return found.error;

        state.transition(exec_state::applying);

        editor         ed(doc_);
        table_analyzer analyzer(opts_, assist_);

        bool   multi_word  = split_words(body.replacement).size() > 1;
        size_t count       = 0;
        size_t distributed = 0;
        std::set<std::pair<size_t, size_t>> rows_done;   // (table, row)

        result.site = doc_.block(found.chosen.front().block_index);

        // Back to front so earlier spans in the same paragraph stay valid
        for (auto it = found.chosen.rbegin(); it != found.chosen.rend(); ++it)
        {
            auto const & c = *it;

            if (c.row)
            {
                auto t = doc_.table_at(c.block_index);
                if (!t)
                    return patch_error{ patch_error_kind::structural_conflict, "matched table is gone" };

                table_id tid = t->id();
                if (rows_done.contains({ tid.val, *c.row }))
                    continue;

                auto text       = doc_.paragraph_text(c.paragraph);
                bool whole_cell = t->cell_paragraphs(*c.row, *c.col).size() == 1
                               && trim_sv(text) == trim_sv(std::string_view(text).substr(c.begin, c.end - c.begin));

                if (whole_cell && multi_word)
                {
                    auto roles = analyzer.infer_roles(doc_, tid);
                    if (*c.col < roles.size() && roles[*c.col] == column_role::key)
                    {
                        auto mapping = analyzer.distribute(body.replacement, roles);
                        mapping = analyzer.review(t->row_texts(*c.row), std::move(mapping));

                        if (!analyzer.apply(doc_, tid, *c.row, mapping))
                            return patch_error{ patch_error_kind::structural_conflict, "could not write table row " + std::to_string(*c.row) };

                        spdlog::debug("{}: distributed over {} column(s) of row {}", op.id, mapping.size(), *c.row);
                        rows_done.insert({ tid.val, *c.row });
                        ++distributed;
                        ++count;
                        continue;
                    }
                }
            }

            if (!ed.replace_span(c.paragraph, c.begin, c.end, body.replacement))
                return patch_error{ patch_error_kind::structural_conflict, "matched span is no longer valid" };
            ++count;
        }

        result.occurrences = count;
        result.detail = count == 1
            ? "replaced " + quoted(body.target)
            : "replaced " + std::to_string(count) + " occurrences of " + quoted(body.target);
        if (distributed > 0)
            result.detail += ", distributed over " + std::to_string(distributed) + " table row(s)";

        return std::nullopt;
    }

//------------------------------------------------------------------------

    inline std::optional<patch_error> patch_executor::apply(replace_point_text const & body, operation const & op, attempt_config const &, execution_state & state, execution_result & result)
    {
        using namespace detail;

        locator loc(doc_, opts_, assist_);
        auto item = loc.find_item(body.item_number, body.within);
        if (!item)
            return patch_error{ patch_error_kind::target_not_found,
                "item " + body.item_number + (body.within ? " of item " + *body.within : std::string{}) + " not found" };

        auto lines = text_lines(body.replacement);
        if (lines.empty())
            return patch_error{ patch_error_kind::malformed_operation, "replacement has no text" };

        state.transition(exec_state::applying);

        editor ed(doc_);

        // The replacement may restate the number; otherwise the number stays.
        auto lead     = leading_item_number(lines.front());
        bool restates = lead && lead->number == body.item_number;

        if (item->row)
        {
            auto t = doc_.table_at(item->block_index);
            if (!t)
                return patch_error{ patch_error_kind::structural_conflict, "item table is gone" };

            table_id tid  = t->id();
            auto     text = join(lines, " ");
            result.site   = doc_.block(item->block_index);

            if (item->number_col)
            {
                if (restates)
                    text = std::string(trim_sv(std::string_view(text).substr(lead->prefix_end)));

                table_analyzer analyzer(opts_, assist_);
                auto roles = analyzer.infer_roles(doc_, tid);
                if (*item->number_col < roles.size())
                    roles[*item->number_col] = column_role::number;

                auto mapping = analyzer.review(t->row_texts(*item->row), analyzer.distribute(text, roles));
                if (!analyzer.apply(doc_, tid, *item->row, mapping))
                    return patch_error{ patch_error_kind::structural_conflict, "could not write table row " + std::to_string(*item->row) };
            }
            else
            {
                auto current = doc_.paragraph_text(item->paragraph);
                if (!ed.replace_span(item->paragraph, restates ? 0 : item->prefix_end, current.size(), text))
                    return patch_error{ patch_error_kind::structural_conflict, "could not rewrite item " + body.item_number };
            }

            result.occurrences = 1;
            result.detail = "rewrote item " + body.item_number + " in table row " + std::to_string(*item->row);
            return std::nullopt;
        }

        auto   current = doc_.paragraph_text(item->paragraph);
        size_t from    = restates ? 0 : item->prefix_end;
        auto   first   = lines.front();
        if (!restates && from == current.size() && !current.empty() && current.back() != ' ')
            first = " " + first;

        if (!ed.replace_span(item->paragraph, from, current.size(), first))
            return patch_error{ patch_error_kind::structural_conflict, "could not rewrite item " + body.item_number };

        size_t b = item->block_index;
        result.site = doc_.block(b);

        if (lines.size() > 1)
        {
            // Extra lines replace the item's body
            size_t end = item->heading ? section_end(doc_, b) : item_end(doc_, b);
            size_t removed = ed.erase_blocks(b + 1, end);

            auto style = item->heading ? std::string("Normal") : std::string(doc_.paragraph(item->paragraph)->style());
            for (size_t k = 1; k < lines.size(); ++k)
                ed.insert_paragraph_after(b + k - 1, style, { run{ lines[k], {} } });

            spdlog::debug("{}: item {} body replaced ({} block(s) out, {} in)", op.id, body.item_number, removed, lines.size() - 1);
        }

        result.occurrences = 1;
        result.detail = "rewrote item " + body.item_number;
        return std::nullopt;
    }

//------------------------------------------------------------------------

    inline std::optional<patch_error> patch_executor::apply(delete_paragraph const & body, operation const & op, attempt_config const & cfg, execution_state & state, execution_result & result)
    {
        auto found = find_target(body.target, op, cfg, match_scope::local, std::nullopt);
        if (found.error)
            return found.error;

        state.transition(exec_state::applying);

        editor ed(doc_);
        auto const & c = found.chosen.front();

        if (c.row)
        {
            auto t = doc_.table_at(c.block_index);
            if (!t)
                return patch_error{ patch_error_kind::structural_conflict, "matched table is gone" };

            bool last_row = t->row_count() == 1;
            result.site = last_row ? neighbour_of(c.block_index, c.block_index + 1) : std::optional<block_ref>(doc_.block(c.block_index));

            if (!ed.erase_row(t->id(), *c.row))
                return patch_error{ patch_error_kind::structural_conflict, "could not remove table row " + std::to_string(*c.row) };

            result.occurrences = 1;
            result.detail = last_row ? "removed the table" : "removed table row " + std::to_string(*c.row);
            return std::nullopt;
        }

        size_t first = c.block_index;
        size_t last  = c.kind == location_kind::heading ? section_end(doc_, first) : first + 1;

        result.site = neighbour_of(first, last);
        size_t removed = ed.erase_blocks(first, last);

        result.occurrences = removed;
        result.detail = removed == 1 ? "removed 1 block" : "removed " + std::to_string(removed) + " blocks";
        return std::nullopt;
    }

//------------------------------------------------------------------------

    inline std::optional<patch_error> patch_executor::apply(insert_paragraph const & body, operation const & op, attempt_config const & cfg, execution_state & state, execution_result & result)
    {
        auto lines = detail::text_lines(body.text);
        if (lines.empty())
            return patch_error{ patch_error_kind::malformed_operation, "text has no content" };

        auto found = find_target(body.anchor, op, cfg, match_scope::local, std::nullopt);
        if (found.error)
            return found.error;

        state.transition(exec_state::applying);

        editor ed(doc_);
        size_t b     = found.chosen.front().block_index;
        auto   style = body.style.value_or("Normal");

        for (size_t k = 0; k < lines.size(); ++k)
        {
            auto id = ed.insert_paragraph_after(b + k, style, { run{ lines[k], {} } });
            if (k == 0)
                result.site = block_ref{ id };
        }

        result.occurrences = lines.size();
        result.detail = "inserted " + std::to_string(lines.size()) + " paragraph(s)";
        return std::nullopt;
    }

    inline std::optional<patch_error> patch_executor::apply(insert_section const & body, operation const & op, attempt_config const & cfg, execution_state & state, execution_result & result)
    {
        auto found = find_target(body.anchor, op, cfg, match_scope::local, std::nullopt);
        if (found.error)
            return found.error;

        state.transition(exec_state::applying);

        editor ed(doc_);
        size_t b = found.chosen.front().block_index;

        auto heading = ed.insert_paragraph_after(b, "Heading " + std::to_string(body.level), { run{ body.heading, {} } });
        result.site = block_ref{ heading };

        size_t at = b + 1;
        for (auto const & entry : body.body)
            for (auto const & line : detail::text_lines(entry))
                ed.insert_paragraph_after(at++, "Normal", { run{ line, {} } });

        result.occurrences = 1;
        result.detail = "inserted section " + detail::quoted(body.heading) + " with " + std::to_string(at - b - 1) + " paragraph(s)";
        return std::nullopt;
    }

    inline std::optional<patch_error> patch_executor::apply(insert_table const & body, operation const & op, attempt_config const & cfg, execution_state & state, execution_result & result)
    {
        auto found = find_target(body.anchor, op, cfg, match_scope::local, std::nullopt);
        if (found.error)
            return found.error;

        state.transition(exec_state::applying);

        editor ed(doc_);
        auto id = ed.insert_table_after(found.chosen.front().block_index, body.style.value_or("Table Grid"), body.rows);
        if (!valid(id))
            return patch_error{ patch_error_kind::structural_conflict, "could not insert the table" };

        result.site = block_ref{ id };
        result.occurrences = 1;
        result.detail = "inserted a " + std::to_string(body.rows.size()) + "-row table";
        return std::nullopt;
    }

    inline std::optional<patch_error> patch_executor::apply(add_comment const & body, operation const & op, attempt_config const & cfg, execution_state & state, execution_result & result)
    {
        auto found = find_target(body.anchor, op, cfg, match_scope::local, std::nullopt);
        if (found.error)
            return found.error;

        state.transition(exec_state::applying);

        size_t b = found.chosen.front().block_index;
        result.site = doc_.block(b);

        bool placed = false;
        try
        {
            placed = sink_.insert(doc_, b, body.note);
        }
        catch (std::exception const & e)
        {
            return patch_error{ patch_error_kind::structural_conflict, std::string("comment sink failed: ") + e.what() };
        }

        if (!placed)
            return patch_error{ patch_error_kind::structural_conflict, "could not place the comment" };

        result.occurrences = 1;
        result.detail = "comment added";
        return std::nullopt;
    }

} // namespace redline

#endif // REDLINE_EXECUTOR_HPP
