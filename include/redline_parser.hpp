// redline_parser.hpp - Redline Document Patch Engine - Document Text Parser
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef REDLINE_PARSER_HPP
#define REDLINE_PARSER_HPP

#include "redline_editor.hpp"

#include <sstream>
#include <cctype>

namespace redline
{
//========================================================================
// PARSER API
//========================================================================

    enum class parse_error_kind
    {
        unknown_directive,
        malformed_run,
        invalid_attribute,
        run_outside_paragraph,
        comment_outside_paragraph,
        row_outside_table,
        cell_outside_row,
        paragraph_outside_cell,
        nested_table,
        unmatched_end,
        unterminated_table,
    };

    using parse_error   = error<parse_error_kind>;
    using parse_context = context<document, parse_error>;

    // Errors carry "line N: " in their message. Parsing never stops at an
    // error; the offending line is skipped and the document is still built.
    inline parse_context parse(std::string_view input);

//========================================================================
// Implementation details
//========================================================================

    namespace
    {
        using namespace detail;

        struct parser_impl
        {
            parse_context ctx;
            editor        ed{ ctx.result };

            // Active context
            paragraph_id active_paragraph { invalid_id<paragraph_tag>() };
            table_id     active_table     { invalid_id<table_tag>() };
            size_t       active_row       { npos() };
            size_t       active_cell      { npos() };
            size_t       line_no          { 0 };

            void parse(std::string_view input);
            void add_error(parse_error_kind kind, std::string const & message);

            void parse_line(std::string_view line);

            void open_paragraph(std::string_view style);
            void add_run(std::string_view body);
            void add_comment(std::string_view body);

            void open_table(std::string_view style);
            void open_row();
            void open_cell();
            void close_cell();
            void close_table();

            std::optional<run_format> parse_attributes(std::string_view attrs);
        };

//---------------------------------------------------------------------------

        void parser_impl::parse(std::string_view input)
        {
            std::istringstream ss{ std::string(input) };
            std::string line;

            while (std::getline(ss, line) && line_no < MAX_LINES)
            {
                ++line_no;
                if (!line.empty() && line.back() == '\r')
                    line.pop_back();
                parse_line(line);
            }

            if (valid(active_table))
            {
                add_error(parse_error_kind::unterminated_table, "table is not closed with @end");
                close_table();
            }
        }

//---------------------------------------------------------------------------

        void parser_impl::add_error(parse_error_kind kind, std::string const & message)
        {
            ctx.errors.push_back(parse_error{
                kind,
                "line " + std::to_string(line_no) + ": " + message
            });
        }

//---------------------------------------------------------------------------

        void parser_impl::parse_line(std::string_view line)
        {
            size_t start = line.find_first_not_of(" \t");
            if (start == std::string_view::npos)
                return;

            line = line.substr(start);

            if (line.starts_with("//"))
                return;

            if (line.front() == '~')
            {
                add_run(line.substr(1));
                return;
            }

            if (line.front() == '!')
            {
                add_comment(line.substr(1));
                return;
            }

            if (line.front() != '@')
            {
                add_error(parse_error_kind::unknown_directive, "unrecognised line \"" + std::string(line) + "\"");
                return;
            }

            auto space = line.find(' ');
            auto directive = line.substr(0, space);
            auto argument  = space == std::string_view::npos ? std::string_view{} : trim_sv(line.substr(space + 1));

            if (directive == "@para")
                open_paragraph(argument);
            else if (directive == "@table")
                open_table(argument);
            else if (directive == "@row")
                open_row();
            else if (directive == "@cell")
                open_cell();
            else if (directive == "@end")
                close_table();
            else
                add_error(parse_error_kind::unknown_directive, "unknown directive \"" + std::string(directive) + "\"");
        }

//---------------------------------------------------------------------------

        void parser_impl::open_paragraph(std::string_view style)
        {
            if (style.empty())
                style = "Normal";

            if (!valid(active_table))
            {
                active_paragraph = ed.append_paragraph(style, {});
                return;
            }

            if (active_cell == npos())
            {
                add_error(parse_error_kind::paragraph_outside_cell, "@para inside a table but outside a @cell");
                active_paragraph = invalid_id<paragraph_tag>();
                return;
            }

            active_paragraph = ed.append_cell_paragraph(active_table, active_row, active_cell, style, {});
        }

//---------------------------------------------------------------------------

        void parser_impl::add_run(std::string_view body)
        {
            if (!valid(active_paragraph))
            {
                add_error(parse_error_kind::run_outside_paragraph, "run outside a paragraph");
                return;
            }

            auto bar = body.find('|');
            if (bar == std::string_view::npos)
            {
                add_error(parse_error_kind::malformed_run, "run is missing the '|' separator");
                return;
            }

            auto format = parse_attributes(body.substr(0, bar));
            if (!format)
                return;

            ed.append_run(active_paragraph, run{ unescape(body.substr(bar + 1)), std::move(*format) });
        }

//---------------------------------------------------------------------------

        void parser_impl::add_comment(std::string_view body)
        {
            if (!valid(active_paragraph))
            {
                add_error(parse_error_kind::comment_outside_paragraph, "comment outside a paragraph");
                return;
            }

            auto bar = body.find('|');
            if (bar == std::string_view::npos)
            {
                ed.attach_comment(active_paragraph, comment{ {}, unescape(body) });
                return;
            }

            ed.attach_comment(active_paragraph, comment{
                std::string(trim_sv(body.substr(0, bar))),
                unescape(body.substr(bar + 1))
            });
        }

//---------------------------------------------------------------------------

        std::optional<run_format> parser_impl::parse_attributes(std::string_view attrs)
        {
            run_format format;

            size_t pos = 0;
            while (pos <= attrs.size())
            {
                size_t comma = attrs.find(',', pos);
                auto item = trim_sv(attrs.substr(pos, comma == std::string_view::npos ? std::string_view::npos : comma - pos));
                pos = comma == std::string_view::npos ? attrs.size() + 1 : comma + 1;

                if (item.empty())
                    continue;

                if (item == "b") { format.bold = true; continue; }
                if (item == "i") { format.italic = true; continue; }
                if (item == "u") { format.underline = true; continue; }

                auto eq = item.find('=');
                if (eq == std::string_view::npos)
                {
                    add_error(parse_error_kind::invalid_attribute, "unknown run attribute \"" + std::string(item) + "\"");
                    return std::nullopt;
                }

                auto key = trim_sv(item.substr(0, eq));
                auto val = std::string(trim_sv(item.substr(eq + 1)));

                if (key == "color")
                {
                    bool hex = val.size() == 6 && std::all_of(val.begin(), val.end(), [](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; });
                    if (!hex)
                    {
                        add_error(parse_error_kind::invalid_attribute, "color must be RRGGBB, got \"" + val + "\"");
                        return std::nullopt;
                    }
                    format.color = val;
                }
                else if (key == "size")
                {
                    char* end = nullptr;
                    double size = std::strtod(val.c_str(), &end);
                    if (val.empty() || end != val.c_str() + val.size() || size <= 0)
                    {
                        add_error(parse_error_kind::invalid_attribute, "size must be a positive number, got \"" + val + "\"");
                        return std::nullopt;
                    }
                    format.size = size;
                }
                else if (key == "font")
                    format.font = val;
                else
                {
                    add_error(parse_error_kind::invalid_attribute, "unknown run attribute \"" + std::string(key) + "\"");
                    return std::nullopt;
                }
            }

            return format;
        }

//---------------------------------------------------------------------------

        void parser_impl::open_table(std::string_view style)
        {
            if (valid(active_table))
            {
                add_error(parse_error_kind::nested_table, "tables cannot nest; closing the open table");
                close_table();
            }

            active_table     = ed.append_table(style);
            active_row       = npos();
            active_cell      = npos();
            active_paragraph = invalid_id<paragraph_tag>();
        }

        void parser_impl::open_row()
        {
            if (!valid(active_table))
            {
                add_error(parse_error_kind::row_outside_table, "@row outside a table");
                return;
            }

            close_cell();
            active_row  = ed.append_row(active_table);
            active_cell = npos();
        }

        void parser_impl::open_cell()
        {
            if (!valid(active_table) || active_row == npos())
            {
                add_error(parse_error_kind::cell_outside_row, "@cell outside a table row");
                return;
            }

            close_cell();
            active_cell = ed.append_cell(active_table, active_row);
        }

        // A cell always owns at least one paragraph.
        void parser_impl::close_cell()
        {
            if (valid(active_table) && active_row != npos() && active_cell != npos())
            {
                auto tv = ctx.result.table(active_table);
                if (tv && tv->cell_paragraphs(active_row, active_cell).empty())
                    ed.append_cell_paragraph(active_table, active_row, active_cell, "Normal", {});
            }

            active_cell      = npos();
            active_paragraph = invalid_id<paragraph_tag>();
        }

        void parser_impl::close_table()
        {
            if (!valid(active_table))
            {
                add_error(parse_error_kind::unmatched_end, "@end without an open table");
                return;
            }

            close_cell();
            active_table = invalid_id<table_tag>();
            active_row   = npos();
        }

    } // anon ns


//========================================================================
// Parser API implementation
//========================================================================

    inline parse_context parse(std::string_view input)
    {
        parser_impl p;
        p.parse(input);
        return std::move(p.ctx);
    }

} // namespace redline

#endif // REDLINE_PARSER_HPP
