// redline_operation.hpp - Redline Document Patch Engine - Operations and Validation
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef REDLINE_OPERATION_HPP
#define REDLINE_OPERATION_HPP

#include "redline_options.hpp"

namespace redline
{
//========================================================================
// Operations
//========================================================================

    enum class match_scope
    {
        local,
        global,
    };

    struct replace_text
    {
        std::string                target;
        std::string                replacement;
        match_scope                scope = match_scope::local;
        std::optional<std::string> item_number;   // anchors the numbered-item locator mode
    };

    struct replace_point_text
    {
        std::string                item_number;
        std::string                replacement;
        std::optional<std::string> within;        // parent item of a sub-item, e.g. "2)" of item 5
    };

    struct delete_paragraph
    {
        std::string target;
    };

    struct insert_paragraph
    {
        std::string                anchor;
        std::string                text;
        std::optional<std::string> style;
    };

    struct insert_section
    {
        std::string              anchor;
        std::string              heading;
        std::vector<std::string> body;
        int                      level = 2;
    };

    struct insert_table
    {
        std::string                anchor;
        table_rows                 rows;
        std::optional<std::string> style;
    };

    struct add_comment
    {
        std::string anchor;
        std::string note;
    };

    using operation_body = std::variant<
        replace_text,
        replace_point_text,
        delete_paragraph,
        insert_paragraph,
        insert_section,
        insert_table,
        add_comment
    >;

    enum class operation_kind
    {
        replace_text,
        replace_point_text,
        delete_paragraph,
        insert_paragraph,
        insert_section,
        insert_table,
        add_comment,
    };

    inline std::string_view to_string(operation_kind kind)
    {
        switch (kind)
        {
            case operation_kind::replace_text:       return "REPLACE_TEXT";
            case operation_kind::replace_point_text: return "REPLACE_POINT_TEXT";
            case operation_kind::delete_paragraph:   return "DELETE_PARAGRAPH";
            case operation_kind::insert_paragraph:   return "INSERT_PARAGRAPH";
            case operation_kind::insert_section:     return "INSERT_SECTION";
            case operation_kind::insert_table:       return "INSERT_TABLE";
            case operation_kind::add_comment:        return "ADD_COMMENT";
        }
        return "UNKNOWN";
    }

    struct operation
    {
        std::string    id;
        std::string    description;
        bool           annotate = true;
        operation_body body;

        operation_kind kind() const noexcept
        {
            return static_cast<operation_kind>(body.index());
        }

        template <typename T>
        bool is() const noexcept { return std::holds_alternative<T>(body); }

        template <typename T>
        T const & as() const { return std::get<T>(body); }
    };

    inline bool is_global(operation const & op)
    {
        auto const * rt = std::get_if<replace_text>(&op.body);
        return rt && rt->scope == match_scope::global;
    }

    // The text an operation searches for: a target, an anchor or an item number.
    inline std::string const & target_text(operation const & op)
    {
        return std::visit([](auto const & body) -> std::string const &
        {
            using T = std::decay_t<decltype(body)>;
            if constexpr (std::is_same_v<T, replace_text> || std::is_same_v<T, delete_paragraph>)
                return body.target;
            else if constexpr (std::is_same_v<T, replace_point_text>)
                return body.item_number;
            else
                return body.anchor;
        }, op.body);
    }

    // The text an operation writes into the document.
    inline std::string payload_text(operation const & op)
    {
        return std::visit([](auto const & body) -> std::string
        {
            using T = std::decay_t<decltype(body)>;
            if constexpr (std::is_same_v<T, replace_text> || std::is_same_v<T, replace_point_text>)
                return body.replacement;
            else if constexpr (std::is_same_v<T, delete_paragraph>)
                return {};
            else if constexpr (std::is_same_v<T, insert_paragraph>)
                return body.text;
            else if constexpr (std::is_same_v<T, insert_section>)
                return body.heading + "\n" + detail::join(body.body, "\n");
            else if constexpr (std::is_same_v<T, insert_table>)
            {
                std::vector<std::string> lines;
                for (auto const & row : body.rows)
                    lines.push_back(detail::join(row, " "));
                return detail::join(lines, "\n");
            }
            else
                return body.note;
        }, op.body);
    }

//========================================================================
// Producer-shaped operations
//========================================================================

    // An operation as the producer wrote it: a kind name and loose fields.
    // Repeated keys keep their order.
    struct raw_operation
    {
        std::string                             id;
        std::string                             kind;
        std::multimap<std::string, std::string> fields;

        raw_operation & set(std::string key, std::string value)
        {
            fields.emplace(std::move(key), std::move(value));
            return *this;
        }

        bool has(std::string const & key) const
        {
            return fields.find(key) != fields.end();
        }

        std::optional<std::string> get(std::string const & key) const
        {
            auto it = fields.find(key);
            if (it == fields.end())
                return std::nullopt;
            return it->second;
        }

        // First present key of a list of aliases.
        std::optional<std::string> get_any(std::initializer_list<char const *> keys) const
        {
            for (auto key : keys)
                if (auto v = get(key))
                    return v;
            return std::nullopt;
        }

        std::vector<std::string> get_all(std::string const & key) const
        {
            std::vector<std::string> out;
            auto [first, last] = fields.equal_range(key);
            for (auto it = first; it != last; ++it)
                out.push_back(it->second);
            return out;
        }
    };

    struct malformed_operation
    {
        std::string id;
        std::string kind;
        std::string description;
        patch_error error;
    };

    using validation_result = std::variant<operation, malformed_operation>;

//========================================================================
// Validator
//========================================================================

    namespace detail
    {
        inline std::string change_id(size_t position)
        {
            std::string n = std::to_string(position);
            return "CHG-" + std::string(n.size() < 3 ? 3 - n.size() : 0, '0') + n;
        }

        inline std::optional<operation_kind> parse_operation_kind(std::string_view name)
        {
            auto v = to_lower(std::string(trim_sv(name)));
            std::replace(v.begin(), v.end(), '-', '_');
            std::replace(v.begin(), v.end(), ' ', '_');

            for (auto k : { operation_kind::replace_text, operation_kind::replace_point_text, operation_kind::delete_paragraph,
                            operation_kind::insert_paragraph, operation_kind::insert_section, operation_kind::insert_table,
                            operation_kind::add_comment })
                if (to_lower(std::string(to_string(k))) == v)
                    return k;

            return std::nullopt;
        }

        inline bool has_phrase(std::string_view text, std::initializer_list<std::string_view> phrases)
        {
            for (auto p : phrases)
                if (contains_folded(text, p))
                    return true;
            return false;
        }

        inline bool has_global_phrasing(std::string_view description)
        {
            return has_phrase(description, {
                "по всему тексту", "по всему документу", "во всем документе", "во всём документе",
                "во всем тексте", "во всём тексте", "везде",
                "throughout the document", "throughout the text", "all occurrences", "everywhere", "globally"
            });
        }

        inline bool has_full_item_phrasing(std::string_view description)
        {
            return has_phrase(description, {
                "в редакции", "изложить", "в новой редакции",
                "in the following wording", "in the following edition", "replace item", "replace point"
            });
        }

        // "в пункте 5", "пункта 5.2", "п. 3", "in item 7", "point 3". "подпункт"
        // names a sub-item and is skipped in favour of its parent.
        inline std::optional<std::string> item_hint(std::string_view description)
        {
            for (auto const & t : tokenize(description))
            {
                bool keyword = t.text.rfind("пункт", 0) == 0 || t.text == "п" || t.text == "item" || t.text == "point";
                if (!keyword)
                    continue;

                size_t pos = t.end;
                while (pos < description.size())
                {
                    size_t next = pos;
                    char32_t cp = decode_utf8(description, next);
                    if (!is_space(cp) && cp != U'.' && cp != 0x2116)   // №
                        break;
                    pos = next;
                }

                if (auto scanned = scan_item_number(description, pos, false))
                    return scanned->first;
            }
            return std::nullopt;
        }

        inline std::optional<std::string> required(raw_operation const & raw, std::initializer_list<char const *> keys, bool allow_empty = false)
        {
            auto v = raw.get_any(keys);
            if (!v || (!allow_empty && trim_sv(*v).empty()))
                return std::nullopt;
            return v;
        }

        inline table_rows parse_rows(std::vector<std::string> const & lines)
        {
            table_rows rows;
            for (auto const & line : lines)
            {
                std::vector<std::string> cells;
                size_t pos = 0;
                while (true)
                {
                    size_t bar = line.find('|', pos);
                    cells.emplace_back(trim_sv(std::string_view(line).substr(pos, bar == std::string::npos ? std::string::npos : bar - pos)));
                    if (bar == std::string::npos)
                        break;
                    pos = bar + 1;
                }
                rows.push_back(std::move(cells));
            }
            return rows;
        }
    }

    // Turns one producer operation into a typed operation, filling defaults
    // and repairing what can be repaired. position is 1-based.
    inline validation_result validate(raw_operation const & raw, size_t position)
    {
        using namespace detail;

        std::string id = std::string(trim_sv(raw.id));
        if (id.empty())
            id = change_id(position);

        std::string description = std::string(trim_sv(raw.get("description").value_or("")));
        if (description.empty())
            description = "Change " + std::to_string(position);

        auto fail = [&](patch_error_kind kind, std::string message) -> validation_result
        {
            return malformed_operation{ id, raw.kind, description, patch_error{ kind, std::move(message) } };
        };

        auto missing = [&](char const * field) -> validation_result
        {
            return fail(patch_error_kind::malformed_operation, std::string("missing required field \"") + field + "\"");
        };

        if (trim_sv(raw.kind).empty())
            return missing("kind");

        auto kind = parse_operation_kind(raw.kind);
        if (!kind)
            return fail(patch_error_kind::unsupported_operation, "unsupported operation kind \"" + raw.kind + "\"");

        operation op;
        op.id          = id;
        op.description = description;

        if (auto annotate = raw.get_any({ "annotate", "annotation" }))
        {
            auto b = parse_bool(*annotate);
            if (!b)
                return fail(patch_error_kind::malformed_operation, "annotate must be true or false, got \"" + *annotate + "\"");
            op.annotate = *b;
        }

        switch (*kind)
        {
            case operation_kind::replace_text:
            {
                auto target = required(raw, { "target", "text", "old_text" });
                if (!target) return missing("target");

                auto replacement = required(raw, { "replacement", "new_text" }, true);
                if (!replacement) return missing("replacement");

                // A bare number is plain text here; the executor refuses it
                // when it names an existing item.
                if (auto number = parse_item_number(*target); number && has_full_item_phrasing(description))
                {
                    op.body = replace_point_text{ *number, *replacement, std::nullopt };
                    break;
                }

                replace_text rt;
                rt.target      = *target;
                rt.replacement = *replacement;

                bool global = has_global_phrasing(description);
                if (auto scope = raw.get("scope"))
                {
                    auto s = to_lower(std::string(trim_sv(*scope)));
                    if (s == "global")     global = true;
                    else if (s == "local") global = false;
                    else return fail(patch_error_kind::malformed_operation, "scope must be global or local, got \"" + *scope + "\"");
                }
                if (auto all = raw.get("replace_all"))
                {
                    auto b = parse_bool(*all);
                    if (!b)
                        return fail(patch_error_kind::malformed_operation, "replace_all must be true or false, got \"" + *all + "\"");
                    global = global || *b;
                }
                rt.scope = global ? match_scope::global : match_scope::local;

                if (auto item = raw.get_any({ "item", "point_num", "item_number" }))
                    rt.item_number = parse_item_number(*item);
                if (!rt.item_number)
                    rt.item_number = item_hint(description);

                op.body = std::move(rt);
                break;
            }

            case operation_kind::replace_point_text:
            {
                auto item = required(raw, { "item_number", "item", "target", "text" });
                if (!item) return missing("item_number");

                auto number = parse_item_number(*item);
                if (!number)
                    return fail(patch_error_kind::malformed_operation, "\"" + *item + "\" is not an item number");

                auto replacement = required(raw, { "replacement", "new_text" });
                if (!replacement) return missing("replacement");

                replace_point_text rp{ *number, *replacement, std::nullopt };
                if (auto within = raw.get_any({ "within", "point_num" }))
                {
                    auto parent = parse_item_number(*within);
                    if (!parent)
                        return fail(patch_error_kind::malformed_operation, "\"" + *within + "\" is not an item number");
                    if (*parent != *number)
                        rp.within = parent;
                }

                op.body = std::move(rp);
                break;
            }

            case operation_kind::delete_paragraph:
            {
                auto target = required(raw, { "target", "text" });
                if (!target) return missing("target");

                op.body = delete_paragraph{ *target };
                break;
            }

            case operation_kind::insert_paragraph:
            {
                auto anchor = required(raw, { "anchor", "after_text", "after_heading" });
                if (!anchor) return missing("anchor");

                auto text = required(raw, { "text", "new_text" });
                if (!text) return missing("text");

                op.body = insert_paragraph{ *anchor, *text, raw.get("style") };
                break;
            }

            case operation_kind::insert_section:
            {
                auto anchor = required(raw, { "anchor", "after_heading", "after_text" });
                if (!anchor) return missing("anchor");

                auto heading = required(raw, { "heading", "title" });
                if (!heading) return missing("heading");

                insert_section is{ *anchor, *heading, raw.get_all("body"), 2 };
                if (auto level = raw.get("level"))
                {
                    auto n = parse_count(*level);
                    if (!n || *n < 1 || *n > 9)
                        return fail(patch_error_kind::malformed_operation, "level must be 1..9, got \"" + *level + "\"");
                    is.level = static_cast<int>(*n);
                }

                op.body = std::move(is);
                break;
            }

            case operation_kind::insert_table:
            {
                auto anchor = required(raw, { "anchor", "after_text", "after_heading" });
                if (!anchor) return missing("anchor");

                auto rows = parse_rows(raw.get_all("row"));
                if (rows.empty()) return missing("rows");

                op.body = insert_table{ *anchor, std::move(rows), raw.get("style") };
                break;
            }

            case operation_kind::add_comment:
            {
                auto anchor = required(raw, { "anchor", "target", "after_text" });
                if (!anchor) return missing("anchor");

                auto note = required(raw, { "note", "comment", "text" });
                if (!note) return missing("note");

                op.body = add_comment{ *anchor, *note };
                break;
            }
        }

        return op;
    }

} // namespace redline

#endif // REDLINE_OPERATION_HPP
