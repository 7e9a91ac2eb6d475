// redline_table.hpp - Redline Document Patch Engine - Table Structure Analyzer
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef REDLINE_TABLE_HPP
#define REDLINE_TABLE_HPP

#include "redline_options.hpp"
#include "redline_ports.hpp"

#include <spdlog/spdlog.h>

namespace redline
{
    class table_analyzer
    {
    public:
        explicit table_analyzer(patch_options const & opts, llm_assist * assist = nullptr)
            : opts_(opts)
            , assist_(assist)
        {}

        // Column roles by majority vote over the rows; a header row that names
        // its columns decides directly.
        std::vector<column_role> infer_roles(table_rows const & sample_rows) const;

        // Samples the first rows of a table.
        std::vector<column_role> infer_roles(document const & doc, table_id table) const;

        // Roles named by a header row, if the row reads as one.
        static std::optional<std::vector<std::optional<column_role>>> header_roles(std::vector<std::string> const & row);

        // Splits new text over the non-number columns. Number columns never
        // appear in the mapping.
        column_mapping distribute(std::string_view new_text, std::vector<column_role> const & roles) const;

        // Lets the assist replace the mapping when it is confident enough.
        column_mapping review(std::vector<std::string> const & row, column_mapping proposed) const;

        bool apply(document & doc, table_id table, size_t row, column_mapping const & mapping) const;

    private:
        patch_options const & opts_;
        llm_assist *          assist_;

        static std::optional<column_role> classify_cell(std::string_view text);
    };

//================================================================================================================
//
// Implementations
//
//================================================================================================================

    inline std::optional<std::vector<std::optional<column_role>>> table_analyzer::header_roles(std::vector<std::string> const & row)
    {
        using namespace detail;

        // Whole header names only; data such as "Номер договора" is no header
        static const std::vector<std::string_view> number_headers = {
            "№", "№ п/п", "п/п", "#", "no", "no.", "номер", "number", "пункт" };
        static const std::vector<std::string_view> key_headers = {
            "сокращение", "сокращения", "аббревиатура", "аббревиатуры", "abbreviation", "key", "ключ", "термин", "term" };
        static const std::vector<std::string_view> description_headers = {
            "описание", "наименование", "полное наименование", "расшифровка", "определение", "description", "name", "definition" };

        auto is_one_of = [](std::string const & text, std::vector<std::string_view> const & names)
        {
            return std::find(names.begin(), names.end(), text) != names.end();
        };

        std::vector<std::optional<column_role>> roles;
        bool named = false;

        for (auto const & cell : row)
        {
            auto text = casefold(normalize_spaces(cell));
            std::optional<column_role> role;

            if (is_one_of(text, number_headers))
                role = column_role::number;
            else if (is_one_of(text, key_headers))
                role = column_role::key;
            else if (is_one_of(text, description_headers))
                role = column_role::description;

            named = named || role.has_value();
            roles.push_back(role);
        }

        if (!named)
            return std::nullopt;
        return roles;
    }

    // Numbers, short upper-case-like tokens and multi-word text.
    inline std::optional<column_role> table_analyzer::classify_cell(std::string_view text)
    {
        using namespace detail;

        auto trimmed = trim_sv(text);
        if (trimmed.empty())
            return std::nullopt;

        if (parse_item_number(trimmed))
            return column_role::number;

        auto words = split_words(trimmed);
        if (words.size() > 1)
            return column_role::description;

        size_t letters = 0;
        size_t upper   = 0;
        for (size_t i = 0; i < trimmed.size();)
        {
            char32_t cp = decode_utf8(trimmed, i);
            if (!is_letter(cp))
                continue;
            ++letters;
            if (is_upper(cp))
                ++upper;
        }

        size_t length = codepoint_count(trimmed);
        if (length <= 12 && (letters == 0 || upper * 2 > letters || length <= 5))
            return column_role::key;

        return column_role::description;
    }

    inline std::vector<column_role> table_analyzer::infer_roles(table_rows const & sample_rows) const
    {
        size_t columns = 0;
        for (auto const & r : sample_rows)
            columns = std::max(columns, r.size());

        std::vector<std::optional<column_role>> named(columns);
        size_t first_row = 0;

        if (!sample_rows.empty())
        {
            if (auto header = header_roles(sample_rows.front()))
            {
                for (size_t c = 0; c < header->size() && c < columns; ++c)
                    named[c] = (*header)[c];
                first_row = 1;
            }
        }

        std::vector<column_role> roles;
        for (size_t c = 0; c < columns; ++c)
        {
            if (named[c])
            {
                roles.push_back(*named[c]);
                continue;
            }

            size_t votes[3] = { 0, 0, 0 };
            size_t sampled  = 0;
            for (size_t r = first_row; r < sample_rows.size() && sampled < opts_.table_sample_rows; ++r, ++sampled)
            {
                if (c >= sample_rows[r].size())
                    continue;
                if (auto role = classify_cell(sample_rows[r][c]))
                    ++votes[static_cast<size_t>(*role)];
            }

            column_role fallback = c == 0 ? column_role::key : column_role::description;
            column_role winner   = fallback;
            size_t      best     = votes[static_cast<size_t>(fallback)];

            for (auto role : { column_role::key, column_role::description, column_role::number })
                if (votes[static_cast<size_t>(role)] > best)
                {
                    best   = votes[static_cast<size_t>(role)];
                    winner = role;
                }

            roles.push_back(winner);
        }

        return roles;
    }

    inline std::vector<column_role> table_analyzer::infer_roles(document const & doc, table_id table) const
    {
        auto t = doc.table(table);
        if (!t)
            return {};

        table_rows sample;
        for (size_t r = 0; r < t->row_count() && r <= opts_.table_sample_rows; ++r)
            sample.push_back(t->row_texts(r));

        auto roles = infer_roles(sample);

        // Rows can be ragged; cover the widest one.
        while (roles.size() < t->max_column_count())
            roles.push_back(column_role::description);

        return roles;
    }

    inline column_mapping table_analyzer::distribute(std::string_view new_text, std::vector<column_role> const & roles) const
    {
        using namespace detail;

        column_mapping out;

        std::vector<size_t> targets;
        for (size_t c = 0; c < roles.size(); ++c)
            if (roles[c] != column_role::number)
                targets.push_back(c);

        if (targets.empty())
            return out;

        auto words = split_words(new_text);

        if (words.empty())
        {
            for (auto c : targets)
                out[c] = "";
            return out;
        }

        if (targets.size() == 1)
        {
            out[targets[0]] = join(words, " ");
            return out;
        }

        // Abbreviation tables: the first word is the key, the rest describes it
        if (targets.size() == 2 && roles[targets[0]] == column_role::key && roles[targets[1]] == column_role::description)
        {
            out[targets[0]] = words[0];
            if (words.size() > 1)
                out[targets[1]] = join(words, " ", 1);
            return out;
        }

        size_t n    = targets.size();
        size_t per  = std::max<size_t>(1, words.size() / n);
        size_t next = 0;

        for (size_t k = 0; k < n; ++k)
        {
            size_t take = k + 1 == n ? words.size() - std::min(next, words.size()) : per;
            size_t to   = std::min(words.size(), next + take);
            out[targets[k]] = join(words, " ", std::min(next, words.size()), to);
            next = to;
        }

        return out;
    }

    inline column_mapping table_analyzer::review(std::vector<std::string> const & row, column_mapping proposed) const
    {
        if (!assist_)
            return proposed;

        std::optional<reviewed_mapping> reviewed;
        try
        {
            reviewed = assist_->review_column_mapping(row, proposed);
        }
        catch (std::exception const & e)
        {
            spdlog::warn("column mapping review failed, keeping the computed mapping: {}", e.what());
            return proposed;
        }

        if (!reviewed || reviewed->mapping.empty())
            return proposed;

        if (reviewed->confidence < opts_.review_confidence_threshold)
        {
            spdlog::debug("column mapping review below threshold ({:.2f} < {:.2f})", reviewed->confidence, opts_.review_confidence_threshold);
            return proposed;
        }

        for (auto const & [col, text] : reviewed->mapping)
            if (col >= row.size())
            {
                spdlog::warn("column mapping review named column {} of a {}-column row; ignored", col, row.size());
                return proposed;
            }

        spdlog::debug("column mapping replaced by review (confidence {:.2f})", reviewed->confidence);
        return std::move(reviewed->mapping);
    }

    inline bool table_analyzer::apply(document & doc, table_id table, size_t row, column_mapping const & mapping) const
    {
        editor ed(doc);
        bool ok = true;
        for (auto const & [col, text] : mapping)
            ok = ed.set_cell_text(table, row, col, text) && ok;
        return ok;
    }

} // namespace redline

#endif // REDLINE_TABLE_HPP
