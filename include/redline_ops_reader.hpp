// redline_ops_reader.hpp - Redline Document Patch Engine - Operation List Reader
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef REDLINE_OPS_READER_HPP
#define REDLINE_OPS_READER_HPP

#include "redline_operation.hpp"

#include <sstream>

namespace redline
{
//========================================================================
// OPERATION LIST READER API
//========================================================================
//
//  op CHG-001 replace_text
//      description = Заменить ДРМ по всему тексту
//      target = ДРМ
//      replacement = ДКР
//  /op
//
// The id may be left out ("op replace_text"). Values take "\n" and "\\"
// escapes; repeated keys accumulate in order.

    enum class ops_error_kind
    {
        malformed_line,
        field_outside_operation,
        unexpected_close,
        unterminated_operation,
    };

    using ops_error   = error<ops_error_kind>;
    using ops_context = context<std::vector<raw_operation>, ops_error>;

    inline ops_context read_operations(std::string_view text)
    {
        using namespace detail;

        ops_context out;
        std::optional<raw_operation> current;

        std::istringstream ss{ std::string(text) };
        std::string raw;
        size_t line_no = 0;

        auto report = [&](ops_error_kind kind, std::string message)
        {
            out.errors.push_back({ kind, "line " + std::to_string(line_no) + ": " + std::move(message) });
        };

        while (std::getline(ss, raw) && line_no < MAX_LINES)
        {
            ++line_no;
            auto line = trim_sv(raw);
            if (line.empty() || line.starts_with("//") || line.starts_with("#"))
                continue;

            if (line == "/op")
            {
                if (!current)
                {
                    report(ops_error_kind::unexpected_close, "/op without an open operation");
                    continue;
                }
                out.result.push_back(std::move(*current));
                current.reset();
                continue;
            }

            if (line.starts_with("op ") || line == "op")
            {
                if (current)
                {
                    report(ops_error_kind::unterminated_operation, "operation not closed with /op before the next one");
                    out.result.push_back(std::move(*current));
                }

                auto words = split_words(line.substr(2));
                current = raw_operation{};
                if (words.size() == 1)
                    current->kind = words[0];
                else if (words.size() >= 2)
                {
                    current->id   = words[0];
                    current->kind = join(words, " ", 1);
                }
                continue;
            }

            auto kv = split_key_value(line);
            if (!kv)
            {
                report(ops_error_kind::malformed_line, "expected key = value, got \"" + std::string(line) + "\"");
                continue;
            }

            if (!current)
            {
                report(ops_error_kind::field_outside_operation, "field \"" + kv->first + "\" outside an operation");
                continue;
            }

            current->set(kv->first, unescape(kv->second));
        }

        if (current)
        {
            report(ops_error_kind::unterminated_operation, "last operation not closed with /op");
            out.result.push_back(std::move(*current));
        }

        return out;
    }

} // namespace redline

#endif // REDLINE_OPS_READER_HPP
