// redline_locator.hpp - Redline Document Patch Engine - Locator and Matcher
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef REDLINE_LOCATOR_HPP
#define REDLINE_LOCATOR_HPP

#include "redline_operation.hpp"
#include "redline_ports.hpp"

#include <set>

#include <spdlog/spdlog.h>

namespace redline
{
//========================================================================
// Candidates
//========================================================================

    enum class location_kind
    {
        paragraph,
        heading,
        toc_entry,
        table_cell,
    };

    inline std::string_view to_string(location_kind kind)
    {
        switch (kind)
        {
            case location_kind::paragraph:  return "paragraph";
            case location_kind::heading:    return "heading";
            case location_kind::toc_entry:  return "toc_entry";
            case location_kind::table_cell: return "table_cell";
        }
        return "paragraph";
    }

    // A matched span. paragraph is the stable handle; block_index is only
    // valid until the next structural edit.
    struct match_candidate
    {
        size_t                block_index = npos();
        std::optional<size_t> row;
        std::optional<size_t> col;
        paragraph_id          paragraph;
        size_t                begin = 0;   // byte span in the paragraph text
        size_t                end   = 0;
        location_kind         kind  = location_kind::paragraph;
        match_mode            mode  = match_mode::exact;
        double                confidence = 0;
        double                score      = 0;
    };

    struct locate_hint
    {
        std::string                              description;
        match_scope                              scope = match_scope::local;
        std::optional<std::string>               item_number;
        std::optional<std::pair<size_t, size_t>> block_range;   // inclusive
        bool                                     stemmed_keywords = false;
    };

    // A numbered item: a body paragraph or a table row whose leading text is
    // the item number.
    struct item_location
    {
        size_t                block_index = npos();
        std::optional<size_t> row;
        std::optional<size_t> number_col;   // cell holding the number, for rows
        paragraph_id          paragraph;    // the numbered paragraph or the number cell's paragraph
        size_t                prefix_end = 0;
        bool                  heading    = false;
    };

    struct selection
    {
        std::vector<match_candidate> chosen;
        std::optional<patch_error>   error;
    };

    inline double confidence_of(match_mode mode)
    {
        switch (mode)
        {
            case match_mode::exact:                 return 1.0;
            case match_mode::whitespace_normalized: return 0.9;
            case match_mode::case_insensitive:      return 0.8;
            case match_mode::keyword_subset:        return 0.5;
            case match_mode::numbered_item:         return 0.85;
        }
        return 0;
    }

//========================================================================
// Document structure queries
//========================================================================

    // One past the last block of the section a heading opens: the next heading
    // of equal or higher level, or the end of the body. A non-heading block
    // is its own section.
    inline size_t section_end(document const & doc, size_t block_index)
    {
        auto p = doc.paragraph_at(block_index);
        if (!p || !p->is_heading())
            return block_index + 1;

        int level = *p->heading_level();
        for (size_t i = block_index + 1; i < doc.block_count(); ++i)
        {
            auto next = doc.paragraph_at(i);
            if (next && !next->is_toc_entry() && next->is_heading() && *next->heading_level() <= level)
                return i;
        }
        return doc.block_count();
    }

    // One past the last block of a numbered item: a heading's section, or a
    // numbered paragraph followed by its unnumbered continuation paragraphs.
    inline size_t item_end(document const & doc, size_t block_index)
    {
        auto p = doc.paragraph_at(block_index);
        if (!p)
            return block_index + 1;
        if (p->is_heading())
            return section_end(doc, block_index);

        size_t i = block_index + 1;
        for (; i < doc.block_count(); ++i)
        {
            auto next = doc.paragraph_at(i);
            if (!next || next->is_heading() || next->is_toc_entry())
                break;
            if (detail::leading_item_number(next->text()))
                break;
        }
        return i;
    }

//========================================================================
// Locator
//========================================================================

    class locator
    {
    public:
        locator(document const & doc, patch_options const & opts, llm_assist * assist = nullptr)
            : doc_(doc)
            , opts_(opts)
            , assist_(assist)
        {}

        // Every match of target under one mode, in document order.
        std::vector<match_candidate> locate(std::string_view target, match_mode mode, locate_hint const & hint = {}) const;

        // Global scope keeps every candidate; local scope keeps the best one.
        selection resolve(std::string_view target, match_mode mode, locate_hint const & hint = {}) const;

        selection select(std::vector<match_candidate> candidates, std::string_view target, locate_hint const & hint) const;

        double score(match_candidate const & c, std::string_view target, std::string_view description) const;

        // TOC entries only count when nothing else carries the number.
        std::optional<item_location> find_item(std::string_view number, std::optional<std::string> const & within = std::nullopt) const;

    private:
        document const &      doc_;
        patch_options const & opts_;
        llm_assist *          assist_;

        struct searchable
        {
            size_t                block_index;
            std::optional<size_t> row;
            std::optional<size_t> col;
            paragraph_id          paragraph;
            location_kind         kind;
            size_t                from = 0;   // search starts at this byte
        };

        std::vector<searchable> searchables(std::optional<std::pair<size_t, size_t>> range) const;
        std::vector<searchable> item_searchables(item_location const & item) const;

        static std::vector<std::pair<size_t, size_t>> find_spans(std::string_view text, std::string_view target, match_mode mode, size_t from, bool stemmed, patch_options const & opts);

        bool starts_item(match_candidate const & c) const;
        std::string own_text(match_candidate const & c) const;
        std::string neighbour_text(match_candidate const & c) const;
        void restrict_tables(std::vector<match_candidate> & candidates, std::string_view description) const;
    };

//================================================================================================================
//
// Locator implementations
//
//================================================================================================================

    inline std::vector<locator::searchable> locator::searchables(std::optional<std::pair<size_t, size_t>> range) const
    {
        std::vector<searchable> out;

        size_t first = range ? range->first : 0;
        size_t last  = range ? std::min(range->second + 1, doc_.block_count()) : doc_.block_count();

        for (size_t i = first; i < last; ++i)
        {
            if (auto p = doc_.paragraph_at(i))
            {
                location_kind kind = p->is_toc_entry() ? location_kind::toc_entry
                                   : p->is_heading()   ? location_kind::heading
                                   :                     location_kind::paragraph;
                out.push_back({ i, std::nullopt, std::nullopt, p->id(), kind });
                continue;
            }

            auto t = doc_.table_at(i);
            if (!t)
                continue;

            for (size_t r = 0; r < t->row_count(); ++r)
                for (size_t c = 0; c < t->column_count(r); ++c)
                    for (auto pid : t->cell_paragraphs(r, c))
                        out.push_back({ i, r, c, pid, location_kind::table_cell });
        }

        return out;
    }

    // The item's own text minus its number, then its continuation blocks.
    inline std::vector<locator::searchable> locator::item_searchables(item_location const & item) const
    {
        std::vector<searchable> out;

        if (item.row)
        {
            auto t = doc_.table_at(item.block_index);
            if (!t)
                return out;

            size_t r = *item.row;
            for (size_t c = 0; c < t->column_count(r); ++c)
            {
                if (item.number_col && c == *item.number_col)
                    continue;
                for (auto pid : t->cell_paragraphs(r, c))
                    out.push_back({ item.block_index, r, c, pid, location_kind::table_cell, pid == item.paragraph ? item.prefix_end : 0 });
            }
            return out;
        }

        auto all = searchables(std::make_pair(item.block_index, item_end(doc_, item.block_index) - 1));
        for (auto & s : all)
        {
            if (s.paragraph == item.paragraph)
                s.from = item.prefix_end;
            out.push_back(s);
        }
        return out;
    }

    inline std::vector<std::pair<size_t, size_t>> locator::find_spans(std::string_view text, std::string_view target, match_mode mode, size_t from, bool stemmed, patch_options const & opts)
    {
        using namespace detail;

        std::vector<std::pair<size_t, size_t>> spans;
        if (target.empty() || from >= text.size())
            return spans;

        switch (mode)
        {
            case match_mode::exact:
            {
                for (size_t pos = text.find(target, from); pos != std::string_view::npos; pos = text.find(target, pos + target.size()))
                    spans.emplace_back(pos, pos + target.size());
                break;
            }

            case match_mode::whitespace_normalized:
            case match_mode::case_insensitive:
            case match_mode::numbered_item:
            {
                bool fold_letters = mode != match_mode::whitespace_normalized;
                auto needle = fold(target, true, fold_letters).text;
                if (needle.empty())
                    break;

                auto hay = fold(text, true, fold_letters);
                for (size_t pos = hay.text.find(needle); pos != std::string::npos; pos = hay.text.find(needle, pos + needle.size()))
                {
                    auto span = hay.source_span(pos, pos + needle.size());
                    if (span.first >= from)
                        spans.push_back(span);
                }
                break;
            }

            case match_mode::keyword_subset:
            {
                auto keys = significant_tokens(target, opts.min_token_length);
                if (keys.size() > opts.keyword_count)
                    keys.resize(opts.keyword_count);
                if (keys.empty())
                    break;

                // Stemmed comparison lets inflected forms match
                auto same = [stemmed](std::string const & a, std::string const & b)
                {
                    return stemmed ? stem(a) == stem(b) : a == b;
                };

                auto words = tokenize(text);
                size_t i = 0;
                while (i < words.size())
                {
                    if (words[i].begin < from || !same(words[i].text, keys[0].text))
                    {
                        ++i;
                        continue;
                    }

                    size_t k = 1;
                    size_t j = i + 1;
                    size_t last = i;
                    for (; j < words.size() && k < keys.size(); ++j)
                        if (same(words[j].text, keys[k].text))
                        {
                            last = j;
                            ++k;
                        }

                    if (k < keys.size())
                        break;

                    spans.emplace_back(words[i].begin, words[last].end);
                    i = last + 1;
                }
                break;
            }
        }

        return spans;
    }

    inline std::vector<match_candidate> locator::locate(std::string_view target, match_mode mode, locate_hint const & hint) const
    {
        std::vector<match_candidate> out;

        std::vector<searchable> space;

        if (mode == match_mode::numbered_item)
        {
            if (!hint.item_number)
                return out;

            auto item = find_item(*hint.item_number);
            if (!item)
            {
                spdlog::debug("item {} not found", *hint.item_number);
                return out;
            }
            space = item_searchables(*item);
        }
        else
            space = searchables(hint.block_range);

        for (auto const & s : space)
        {
            auto text = doc_.paragraph_text(s.paragraph);
            for (auto [b, e] : find_spans(text, target, mode, s.from, hint.stemmed_keywords, opts_))
            {
                match_candidate c;
                c.block_index = s.block_index;
                c.row         = s.row;
                c.col         = s.col;
                c.paragraph   = s.paragraph;
                c.begin       = b;
                c.end         = e;
                c.kind        = s.kind;
                c.mode        = mode;
                c.confidence  = confidence_of(mode);
                out.push_back(c);
            }
        }

        spdlog::debug("locate \"{}\" [{}]: {} candidate(s)", target, to_string(mode), out.size());
        return out;
    }

    inline selection locator::resolve(std::string_view target, match_mode mode, locate_hint const & hint) const
    {
        return select(locate(target, mode, hint), target, hint);
    }

    inline selection locator::select(std::vector<match_candidate> candidates, std::string_view target, locate_hint const & hint) const
    {
        selection out;
        if (candidates.empty())
            return out;

        restrict_tables(candidates, hint.description);

        if (hint.scope == match_scope::global)
        {
            out.chosen = std::move(candidates);
            return out;
        }

        // A table-of-contents line mirrors a heading; edit the heading.
        bool has_content = std::any_of(candidates.begin(), candidates.end(),
            [](auto const & c) { return c.kind != location_kind::toc_entry; });
        if (has_content)
            std::erase_if(candidates, [](auto const & c) { return c.kind == location_kind::toc_entry; });

        if (candidates.size() == 1)
        {
            out.chosen = std::move(candidates);
            return out;
        }

        for (auto & c : candidates)
        {
            c.score = score(c, target, hint.description);
            spdlog::debug("candidate block {} [{}] score {:.3f}", c.block_index, to_string(c.kind), c.score);
        }

        double best = candidates.front().score;
        size_t best_index = 0;
        for (size_t i = 1; i < candidates.size(); ++i)
            if (candidates[i].score > best)
            {
                best = candidates[i].score;
                best_index = i;
            }

        size_t tied = static_cast<size_t>(std::count_if(candidates.begin(), candidates.end(),
            [best](auto const & c) { return c.score == best; }));

        if (tied > 1)
        {
            if (opts_.tie_break == tie_break_policy::reject)
            {
                out.error = patch_error{ patch_error_kind::target_ambiguous,
                    std::to_string(tied) + " equally likely locations for \"" + std::string(target) + "\"" };
                return out;
            }
            spdlog::warn("{} locations tie for \"{}\"; taking the first", tied, target);
        }

        out.chosen.push_back(candidates[best_index]);
        return out;
    }

    inline double locator::score(match_candidate const & c, std::string_view target, std::string_view description) const
    {
        using namespace detail;

        std::set<std::string> target_stems;
        for (auto const & t : significant_tokens(target, opts_.min_token_length))
            target_stems.insert(stem(t.text));

        std::set<std::string> wanted;
        for (auto const & t : significant_tokens(description, opts_.min_token_length))
        {
            auto s = stem(t.text);
            if (!target_stems.contains(s))
                wanted.insert(s);
        }

        auto stems_of = [this](std::string const & text)
        {
            std::set<std::string> out;
            for (auto const & t : significant_tokens(text, opts_.min_token_length))
                out.insert(stem(t.text));
            return out;
        };

        auto own        = stems_of(own_text(c));
        auto neighbours = stems_of(neighbour_text(c));

        size_t own_overlap = 0, neighbour_overlap = 0;
        for (auto const & s : wanted)
        {
            if (own.contains(s))
                ++own_overlap;
            else if (neighbours.contains(s))
                ++neighbour_overlap;
        }

        // Neighbour words stay below one own-block word: 3 + 5 + 1 < 10
        double context    = static_cast<double>(std::min<size_t>(neighbour_overlap, 3));
        double structural = starts_item(c) ? 5.0 : 0.0;
        double recency    = 1.0 / (1.0 + static_cast<double>(c.block_index));

        return static_cast<double>(own_overlap) * 10.0 + context + structural + recency;
    }

    // The candidate's own paragraph, or its own row inside a table.
    inline std::string locator::own_text(match_candidate const & c) const
    {
        if (c.row)
        {
            auto t = doc_.table_at(c.block_index);
            return t ? detail::join(t->row_texts(*c.row), " ") : std::string{};
        }
        return doc_.block_text(c.block_index);
    }

    // One block either side; inside a table, one row either side.
    inline std::string locator::neighbour_text(match_candidate const & c) const
    {
        std::string out;

        if (c.row)
        {
            auto t = doc_.table_at(c.block_index);
            if (!t)
                return out;

            size_t first = *c.row > 0 ? *c.row - 1 : 0;
            size_t last  = std::min(*c.row + 2, t->row_count());
            for (size_t r = first; r < last; ++r)
            {
                if (r == *c.row)
                    continue;
                out += detail::join(t->row_texts(r), " ");
                out += '\n';
            }
            return out;
        }

        size_t first = c.block_index > 0 ? c.block_index - 1 : 0;
        size_t last  = std::min(c.block_index + 2, doc_.block_count());
        for (size_t i = first; i < last; ++i)
        {
            if (i == c.block_index)
                continue;
            out += doc_.block_text(i);
            out += '\n';
        }
        return out;
    }

    inline bool locator::starts_item(match_candidate const & c) const
    {
        if (c.row)
        {
            auto t = doc_.table_at(c.block_index);
            return t && t->column_count(*c.row) > 0
                && detail::leading_item_number(t->cell_text(*c.row, 0)).has_value();
        }
        return detail::leading_item_number(doc_.paragraph_text(c.paragraph)).has_value();
    }

    inline void locator::restrict_tables(std::vector<match_candidate> & candidates, std::string_view description) const
    {
        if (!assist_)
            return;

        std::vector<table_id> tables;
        for (auto const & c : candidates)
        {
            if (!c.row)
                continue;
            auto t = doc_.table_at(c.block_index);
            if (t && std::find(tables.begin(), tables.end(), t->id()) == tables.end())
                tables.push_back(t->id());
        }

        if (tables.size() < 2)
            return;

        std::vector<candidate_table> offered;
        for (auto id : tables)
        {
            auto t = doc_.table(id);
            offered.push_back({ id, t->row_count() > 0 ? t->row_texts(0) : std::vector<std::string>{}, t->row_count() });
        }

        std::vector<table_id> named;
        try
        {
            named = assist_->classify_target_table(description, offered);
        }
        catch (std::exception const & e)
        {
            spdlog::warn("table classification failed, keeping all tables: {}", e.what());
            return;
        }

        std::erase_if(named, [&](table_id id) { return std::find(tables.begin(), tables.end(), id) == tables.end(); });
        if (named.empty())
            return;

        std::erase_if(candidates, [&](match_candidate const & c)
        {
            if (!c.row)
                return false;
            auto t = doc_.table_at(c.block_index);
            return t && std::find(named.begin(), named.end(), t->id()) == named.end();
        });

        spdlog::debug("table classification kept {} of {} tables", named.size(), tables.size());
    }

    inline std::optional<item_location> locator::find_item(std::string_view number, std::optional<std::string> const & within) const
    {
        using namespace detail;

        auto wanted = parse_item_number(number);
        if (!wanted)
            return std::nullopt;

        size_t first = 0;
        size_t last  = doc_.block_count();

        if (within)
        {
            auto parent = find_item(*within);
            if (!parent)
                return std::nullopt;

            if (parent->row)
                return std::nullopt;

            first = parent->block_index + 1;
            last  = item_end(doc_, parent->block_index);

            // A numbered paragraph's sub-items ("1)", "5.1") run up to the next
            // peer item or heading.
            if (auto p = doc_.paragraph_at(parent->block_index); p && !p->is_heading())
            {
                auto parent_number = parse_item_number(*within).value_or("");
                auto depth = std::count(parent_number.begin(), parent_number.end(), '.');

                for (last = first; last < doc_.block_count(); ++last)
                {
                    auto next = doc_.paragraph_at(last);
                    if (!next)
                        continue;
                    if (next->is_heading())
                        break;

                    auto text = next->text();
                    auto n = leading_item_number(text);
                    if (!n)
                        continue;

                    bool sub_item = trim_sv(text).substr(n->number.size()).starts_with(")");
                    if (!sub_item && std::count(n->number.begin(), n->number.end(), '.') <= depth)
                        break;
                }
            }
        }

        std::optional<item_location> toc;

        for (size_t i = first; i < last; ++i)
        {
            if (auto p = doc_.paragraph_at(i))
            {
                auto n = leading_item_number(p->text());
                if (!n || n->number != *wanted)
                    continue;

                item_location loc{ i, std::nullopt, std::nullopt, p->id(), n->prefix_end, p->is_heading() };
                if (!p->is_toc_entry())
                    return loc;
                if (!toc)
                    toc = loc;
                continue;
            }

            auto t = doc_.table_at(i);
            if (!t)
                continue;

            for (size_t r = 0; r < t->row_count(); ++r)
            {
                if (t->column_count(r) == 0)
                    continue;

                auto cell = t->cell_text(r, 0);
                auto n = leading_item_number(cell);
                if (!n || n->number != *wanted)
                    continue;

                auto paras = t->cell_paragraphs(r, 0);
                paragraph_id pid = paras.empty() ? invalid_id<paragraph_tag>() : paras.front();

                // A cell holding only the number is excluded from the item's text
                bool number_only = trim_sv(std::string_view(cell).substr(n->prefix_end)).empty();
                return item_location{ i, r, number_only ? std::optional<size_t>(0) : std::nullopt, pid, number_only ? cell.size() : n->prefix_end, false };
            }
        }

        return toc;
    }

} // namespace redline

#endif // REDLINE_LOCATOR_HPP
