// redline_options.hpp - Redline Document Patch Engine - Session Options
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef REDLINE_OPTIONS_HPP
#define REDLINE_OPTIONS_HPP

#include "redline_core.hpp"

#include <sstream>

namespace redline
{
    enum class match_mode
    {
        exact,
        whitespace_normalized,
        case_insensitive,
        keyword_subset,
        numbered_item,
    };

    inline std::string_view to_string(match_mode mode)
    {
        switch (mode)
        {
            case match_mode::exact:                 return "exact";
            case match_mode::whitespace_normalized: return "whitespace_normalized";
            case match_mode::case_insensitive:      return "case_insensitive";
            case match_mode::keyword_subset:        return "keyword_subset";
            case match_mode::numbered_item:         return "numbered_item";
        }
        return "exact";
    }

    // What happens when two local candidates score exactly the same.
    enum class tie_break_policy
    {
        first_occurrence,
        reject,
    };

    enum class annotation_style
    {
        attached,          // comment record on the paragraph
        inline_paragraph,  // visible note paragraph after the block
    };

    struct patch_options
    {
        match_mode       primary_mode                = match_mode::exact;
        size_t           keyword_count               = 3;
        size_t           min_token_length            = 3;
        size_t           neighbor_radius             = 2;
        size_t           table_sample_rows           = 8;
        double           review_confidence_threshold = 0.8;
        tie_break_policy tie_break                   = tie_break_policy::first_occurrence;
        bool             annotate                    = true;
        annotation_style annotation                  = annotation_style::attached;
        std::string      annotation_author           = "redline";
    };

//========================================================================
// Loading options from text
//========================================================================

    enum class option_error_kind
    {
        unknown_key,
        invalid_value,
        malformed_line,
    };

    using option_error   = error<option_error_kind>;
    using option_context = context<patch_options, option_error>;

    namespace detail
    {
        // "key = value"; the value keeps inner spaces. Empty when no '='.
        inline std::optional<std::pair<std::string, std::string>> split_key_value(std::string_view line)
        {
            auto eq = line.find('=');
            if (eq == std::string_view::npos)
                return std::nullopt;

            auto key = trim_sv(line.substr(0, eq));
            if (key.empty())
                return std::nullopt;

            return std::make_pair(to_lower(std::string(key)), std::string(trim_sv(line.substr(eq + 1))));
        }

        inline std::optional<bool> parse_bool(std::string_view s)
        {
            auto v = to_lower(std::string(trim_sv(s)));
            if (v == "true" || v == "yes" || v == "on" || v == "1")  return true;
            if (v == "false" || v == "no" || v == "off" || v == "0") return false;
            return std::nullopt;
        }

        inline std::optional<size_t> parse_count(std::string_view s)
        {
            std::string v(trim_sv(s));
            if (v.empty() || !std::all_of(v.begin(), v.end(), [](char c) { return c >= '0' && c <= '9'; }))
                return std::nullopt;
            return static_cast<size_t>(std::strtoull(v.c_str(), nullptr, 10));
        }

        inline std::optional<match_mode> parse_match_mode(std::string_view s)
        {
            auto v = to_lower(std::string(trim_sv(s)));
            std::replace(v.begin(), v.end(), '-', '_');
            for (auto m : { match_mode::exact, match_mode::whitespace_normalized, match_mode::case_insensitive,
                            match_mode::keyword_subset, match_mode::numbered_item })
                if (to_string(m) == v)
                    return m;
            return std::nullopt;
        }
    }

    // Unknown keys and bad values are reported and skipped; the rest apply.
    inline option_context load_options(std::string_view text, patch_options defaults = {})
    {
        using namespace detail;

        option_context out{ std::move(defaults), {} };
        auto & o = out.result;

        std::istringstream ss{ std::string(text) };
        std::string raw;
        size_t line_no = 0;

        auto report = [&](option_error_kind kind, std::string message)
        {
            out.errors.push_back({ kind, "line " + std::to_string(line_no) + ": " + std::move(message) });
        };

        while (std::getline(ss, raw))
        {
            ++line_no;
            auto line = trim_sv(raw);
            if (line.empty() || line.starts_with("//") || line.starts_with("#"))
                continue;

            auto kv = split_key_value(line);
            if (!kv)
            {
                report(option_error_kind::malformed_line, "expected key = value");
                continue;
            }

            auto const & [key, value] = *kv;
            bool ok = true;

            if (key == "primary_mode")
            {
                auto m = parse_match_mode(value);
                if ((ok = m.has_value())) o.primary_mode = *m;
            }
            else if (key == "keyword_count")
            {
                auto n = parse_count(value);
                if ((ok = n.has_value() && *n > 0)) o.keyword_count = *n;
            }
            else if (key == "min_token_length")
            {
                auto n = parse_count(value);
                if ((ok = n.has_value() && *n > 0)) o.min_token_length = *n;
            }
            else if (key == "neighbor_radius")
            {
                auto n = parse_count(value);
                if ((ok = n.has_value())) o.neighbor_radius = *n;
            }
            else if (key == "table_sample_rows")
            {
                auto n = parse_count(value);
                if ((ok = n.has_value() && *n > 0)) o.table_sample_rows = *n;
            }
            else if (key == "review_confidence_threshold")
            {
                char* end = nullptr;
                double d = std::strtod(value.c_str(), &end);
                ok = !value.empty() && end == value.c_str() + value.size() && d >= 0.0 && d <= 1.0;
                if (ok) o.review_confidence_threshold = d;
            }
            else if (key == "tie_break")
            {
                auto v = to_lower(value);
                if (v == "first_occurrence")  o.tie_break = tie_break_policy::first_occurrence;
                else if (v == "reject")       o.tie_break = tie_break_policy::reject;
                else ok = false;
            }
            else if (key == "annotate")
            {
                auto b = parse_bool(value);
                if ((ok = b.has_value())) o.annotate = *b;
            }
            else if (key == "annotation")
            {
                auto v = to_lower(value);
                if (v == "attached")              o.annotation = annotation_style::attached;
                else if (v == "inline_paragraph") o.annotation = annotation_style::inline_paragraph;
                else ok = false;
            }
            else if (key == "annotation_author")
            {
                ok = !value.empty();
                if (ok) o.annotation_author = value;
            }
            else
            {
                report(option_error_kind::unknown_key, "unknown option \"" + key + "\"");
                continue;
            }

            if (!ok)
                report(option_error_kind::invalid_value, "invalid value \"" + value + "\" for " + key);
        }

        return out;
    }

} // namespace redline

#endif // REDLINE_OPTIONS_HPP
