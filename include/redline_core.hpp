// redline_core.hpp - Redline Document Patch Engine - Core Data Structures
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef REDLINE_CORE_HPP
#define REDLINE_CORE_HPP

#include <string>
#include <string_view>
#include <vector>
#include <variant>
#include <optional>
#include <algorithm>
#include <map>
#include <cstdint>
#include <cstdlib>
#include <cctype>

namespace redline
{
//========================================================================
// IDs
//========================================================================

    inline constexpr size_t npos() { return static_cast<size_t>(-1); }

    template <typename Tag>
    struct id
    {
        size_t val;

        explicit id(size_t v = npos()) : val(v) {}
        operator size_t() const { return val; }
        id & operator= (size_t v) { val = v; return *this; }
        auto operator<=>(id const &) const = default;
        id & operator++() { ++val; return *this; }
        id operator++(int) { id temp = *this; ++val; return temp; }
    };

    template <typename Tag>
    constexpr id<Tag> invalid_id()
    {
        return id<Tag>{ npos() };
    }

    template <typename Tag>
    constexpr bool valid(id<Tag> i)
    {
        return i.val != npos();
    }

    struct paragraph_tag;
    struct table_tag;

    using paragraph_id = id<paragraph_tag>;
    using table_id     = id<table_tag>;

    // A top-level content unit of the document body.
    using block_ref = std::variant<paragraph_id, table_id>;

//========================================================================
// Errors and generation contexts
//========================================================================

    template <typename Kind>
    struct error
    {
        Kind        kind;
        std::string message;
    };

    template <typename T, typename Error>
    struct context
    {
        T result;
        std::vector<Error> errors;

        bool has_errors() const { return !errors.empty(); }
    };

    enum class patch_error_kind
    {
        malformed_operation,
        unsupported_operation,
        target_not_found,
        target_ambiguous,
        structural_conflict,
        load_failure,
        persistence_failure,
        aborted,
    };

    inline std::string_view to_string(patch_error_kind kind)
    {
        switch (kind)
        {
            case patch_error_kind::malformed_operation:   return "MALFORMED_OPERATION";
            case patch_error_kind::unsupported_operation: return "UNSUPPORTED_OPERATION";
            case patch_error_kind::target_not_found:      return "TARGET_NOT_FOUND";
            case patch_error_kind::target_ambiguous:      return "TARGET_AMBIGUOUS";
            case patch_error_kind::structural_conflict:   return "STRUCTURAL_CONFLICT";
            case patch_error_kind::load_failure:          return "LOAD_FAILURE";
            case patch_error_kind::persistence_failure:   return "PERSISTENCE_FAILURE";
            case patch_error_kind::aborted:               return "ABORTED";
        }
        return "UNKNOWN";
    }

    using patch_error = error<patch_error_kind>;

//========================================================================
// Table structure
//========================================================================

    enum class column_role
    {
        key,
        description,
        number
    };

    inline std::string_view to_string(column_role role)
    {
        switch (role)
        {
            case column_role::key:         return "key";
            case column_role::description: return "description";
            case column_role::number:      return "number";
        }
        return "description";
    }

    using table_rows = std::vector<std::vector<std::string>>;

    // Column index -> new cell text. Columns absent from the map keep their text.
    using column_mapping = std::map<size_t, std::string>;

//========================================================================
// UTILITY FUNCTIONS
//========================================================================

    namespace detail
    {
        constexpr size_t MAX_LINES = 1'000'000;

        inline std::string_view trim_sv(std::string_view s)
        {
            size_t start = s.find_first_not_of(" \t\r\n");
            if (start == std::string_view::npos) return {};
            size_t end = s.find_last_not_of(" \t\r\n");
            return s.substr(start, end - start + 1);
        }

        // ASCII only; bytes of multi-byte UTF-8 sequences pass through.
        inline std::string to_lower(std::string const & s)
        {
            std::string result = s;
            std::transform(result.begin(), result.end(), result.begin(),
                [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return result;
        }

        // Escapes in single-line text values: "\n" and "\\".
        inline std::string unescape(std::string_view text)
        {
            std::string out;
            out.reserve(text.size());

            for (size_t i = 0; i < text.size(); ++i)
            {
                if (text[i] == '\\' && i + 1 < text.size())
                {
                    if (text[i + 1] == 'n')  { out += '\n'; ++i; continue; }
                    if (text[i + 1] == '\\') { out += '\\'; ++i; continue; }
                }
                out += text[i];
            }
            return out;
        }

    //--------------------------------------------------------------------
    // UTF-8
    //--------------------------------------------------------------------

        // Decodes the code point at s[i] and advances i. Invalid bytes decode
        // as themselves so that offsets always make progress.
        inline char32_t decode_utf8(std::string_view s, size_t & i)
        {
            auto byte = [&](size_t k) { return static_cast<unsigned char>(s[k]); };

            unsigned char c = byte(i);
            if (c < 0x80) { ++i; return c; }

            size_t len = (c >> 5) == 0x6 ? 2 : (c >> 4) == 0xE ? 3 : (c >> 3) == 0x1E ? 4 : 0;
            if (len == 0 || i + len > s.size()) { ++i; return c; }

            char32_t cp = len == 2 ? (c & 0x1F) : len == 3 ? (c & 0x0F) : (c & 0x07);
            for (size_t k = 1; k < len; ++k)
            {
                if ((byte(i + k) & 0xC0) != 0x80) { ++i; return c; }
                cp = (cp << 6) | (byte(i + k) & 0x3F);
            }
            i += len;
            return cp;
        }

        inline void append_utf8(std::string & out, char32_t cp)
        {
            if (cp < 0x80)
                out += static_cast<char>(cp);
            else if (cp < 0x800)
            {
                out += static_cast<char>(0xC0 | (cp >> 6));
                out += static_cast<char>(0x80 | (cp & 0x3F));
            }
            else if (cp < 0x10000)
            {
                out += static_cast<char>(0xE0 | (cp >> 12));
                out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
                out += static_cast<char>(0x80 | (cp & 0x3F));
            }
            else
            {
                out += static_cast<char>(0xF0 | (cp >> 18));
                out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
                out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
                out += static_cast<char>(0x80 | (cp & 0x3F));
            }
        }

        inline size_t codepoint_count(std::string_view s)
        {
            size_t n = 0;
            for (size_t i = 0; i < s.size(); ++n)
                decode_utf8(s, i);
            return n;
        }

        // Latin, Latin-1 and Cyrillic only; everything else folds to itself.
        inline char32_t fold_case(char32_t cp)
        {
            if (cp >= U'A' && cp <= U'Z')       return cp + 0x20;
            if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) return cp + 0x20;
            if (cp >= 0x0410 && cp <= 0x042F)   return cp + 0x20;
            if (cp >= 0x0400 && cp <= 0x040F)   return cp + 0x50;
            return cp;
        }

        inline bool is_upper(char32_t cp)
        {
            return fold_case(cp) != cp;
        }

        inline bool is_space(char32_t cp)
        {
            return cp == U' ' || cp == U'\t' || cp == U'\n' || cp == U'\r' || cp == U'\v' || cp == U'\f'
                || cp == 0xA0 || cp == 0x2007 || cp == 0x202F || (cp >= 0x2000 && cp <= 0x200A);
        }

        inline bool is_digit(char32_t cp)
        {
            return cp >= U'0' && cp <= U'9';
        }

        inline bool is_word_char(char32_t cp)
        {
            if (cp < 0x80)
                return (cp >= U'a' && cp <= U'z') || (cp >= U'A' && cp <= U'Z') || is_digit(cp) || cp == U'_';

            if (is_space(cp)) return false;
            if (cp == 0xAB || cp == 0xBB || cp == 0xA7 || cp == 0xB7) return false;  // « » § ·
            if (cp >= 0x2010 && cp <= 0x206F) return false;                         // dashes, quotes
            if (cp == 0x2116) return false;                                         // №
            return true;
        }

        inline bool is_letter(char32_t cp)
        {
            return is_word_char(cp) && !is_digit(cp) && cp != U'_';
        }

        inline std::string casefold(std::string_view s)
        {
            std::string out;
            out.reserve(s.size());
            for (size_t i = 0; i < s.size();)
                append_utf8(out, fold_case(decode_utf8(s, i)));
            return out;
        }

    //--------------------------------------------------------------------
    // Folded text: a transformed copy of a source string that remembers
    // where every byte came from, so matches map back to source spans.
    //--------------------------------------------------------------------

        struct folded_text
        {
            std::string         text;
            std::vector<size_t> begin_of;   // source offset of the char producing text[i]
            std::vector<size_t> end_of;     // source end offset of that char

            std::pair<size_t, size_t> source_span(size_t b, size_t e) const
            {
                return { begin_of[b], end_of[e - 1] };
            }
        };

        inline folded_text fold(std::string_view src, bool collapse_spaces, bool fold_letters)
        {
            folded_text out;
            out.text.reserve(src.size());

            bool   pending_space = false;
            size_t space_begin   = 0;
            size_t space_end     = 0;

            for (size_t i = 0; i < src.size();)
            {
                size_t   at = i;
                char32_t cp = decode_utf8(src, i);

                if (collapse_spaces && is_space(cp))
                {
                    if (!pending_space) space_begin = at;
                    pending_space = !out.text.empty();
                    space_end = i;
                    continue;
                }

                if (pending_space)
                {
                    out.text += ' ';
                    out.begin_of.push_back(space_begin);
                    out.end_of.push_back(space_end);
                    pending_space = false;
                }

                size_t before = out.text.size();
                append_utf8(out.text, fold_letters ? fold_case(cp) : cp);
                for (size_t k = before; k < out.text.size(); ++k)
                {
                    out.begin_of.push_back(at);
                    out.end_of.push_back(i);
                }
            }

            return out;
        }

        inline std::string normalize_spaces(std::string_view s)
        {
            return fold(s, true, false).text;
        }

        // Casefolded, whitespace-collapsed containment test.
        inline bool contains_folded(std::string_view haystack, std::string_view needle)
        {
            auto n = fold(needle, true, true).text;
            if (n.empty()) return false;
            return fold(haystack, true, true).text.find(n) != std::string::npos;
        }

        inline std::vector<std::string> split_words(std::string_view s)
        {
            std::vector<std::string> words;
            std::string current;
            for (size_t i = 0; i < s.size();)
            {
                size_t   at = i;
                char32_t cp = decode_utf8(s, i);
                if (is_space(cp))
                {
                    if (!current.empty()) words.push_back(std::move(current));
                    current.clear();
                }
                else
                    current.append(s.substr(at, i - at));
            }
            if (!current.empty()) words.push_back(std::move(current));
            return words;
        }

        inline std::string join(std::vector<std::string> const & parts, std::string_view sep, size_t from = 0, size_t to = npos())
        {
            std::string out;
            to = std::min(to, parts.size());
            for (size_t i = from; i < to; ++i)
            {
                if (i > from) out += sep;
                out += parts[i];
            }
            return out;
        }

    //--------------------------------------------------------------------
    // Tokens
    //--------------------------------------------------------------------

        struct token
        {
            std::string text;    // casefolded
            size_t      begin;   // byte span in the source
            size_t      end;
            size_t      length;  // in code points
        };

        inline std::vector<token> tokenize(std::string_view s)
        {
            std::vector<token> out;
            token current{ {}, 0, 0, 0 };
            bool in_word = false;

            for (size_t i = 0; i < s.size();)
            {
                size_t   at = i;
                char32_t cp = decode_utf8(s, i);

                if (is_word_char(cp))
                {
                    if (!in_word)
                    {
                        current = token{ {}, at, at, 0 };
                        in_word = true;
                    }
                    append_utf8(current.text, fold_case(cp));
                    current.end = i;
                    ++current.length;
                }
                else if (in_word)
                {
                    out.push_back(std::move(current));
                    in_word = false;
                }
            }
            if (in_word) out.push_back(std::move(current));
            return out;
        }

        inline bool is_stop_word(std::string_view folded)
        {
            static const std::vector<std::string_view> stop_words =
            {
                // Russian function words and instruction verbs
                "и", "в", "во", "на", "по", "с", "со", "к", "ко", "о", "об", "от", "до", "из", "за",
                "для", "не", "что", "как", "это", "или", "а", "но", "при", "его", "ее", "их",
                "слова", "слово", "словами", "текст", "текста", "заменить", "изменить", "удалить",
                "добавить", "исключить", "изложить", "редакции", "следующей", "новой",
                "пункт", "пункта", "пункте", "подпункт", "подпункта", "абзац", "абзаце",
                // English
                "the", "and", "of", "to", "in", "on", "for", "with", "a", "an", "by", "is", "at",
                "replace", "change", "text", "item", "point", "paragraph", "words", "word",
            };
            return std::find(stop_words.begin(), stop_words.end(), folded) != stop_words.end();
        }

        inline std::vector<token> significant_tokens(std::string_view s, size_t min_length)
        {
            std::vector<token> out;
            for (auto & t : tokenize(s))
                if (t.length >= min_length && !is_stop_word(t.text))
                    out.push_back(std::move(t));
            return out;
        }

        // Leading code points of a folded token; enough to match Russian inflections.
        inline std::string stem(std::string_view folded, size_t length = 5)
        {
            size_t i = 0;
            for (size_t n = 0; n < length && i < folded.size(); ++n)
                decode_utf8(folded, i);
            return std::string(folded.substr(0, i));
        }

    //--------------------------------------------------------------------
    // Item numbers: "5", "5.", "5)", "5.1", "5.1."
    //--------------------------------------------------------------------

        struct item_prefix
        {
            std::string number;      // canonical form, e.g. "5.1"
            size_t      prefix_end;  // first byte after the number and following spaces
        };

        // Scans digits(.digits)* with an optional trailing '.' or ')'. Strict
        // scanning rejects a bare number that runs into more text.
        inline std::optional<std::pair<std::string, size_t>> scan_item_number(std::string_view s, size_t pos, bool strict = true)
        {
            std::string number;
            bool dotted = false;
            size_t i = pos;

            while (true)
            {
                size_t start = i;
                while (i < s.size() && s[i] >= '0' && s[i] <= '9') ++i;
                if (i == start) return std::nullopt;
                number.append(s.substr(start, i - start));

                if (i + 1 < s.size() && s[i] == '.' && s[i + 1] >= '0' && s[i + 1] <= '9')
                {
                    number += '.';
                    dotted = true;
                    ++i;
                    continue;
                }
                break;
            }

            bool terminated = false;
            if (i < s.size() && (s[i] == '.' || s[i] == ')'))
            {
                ++i;
                terminated = true;
            }

            if (strict && !terminated && !dotted && i < s.size())
                return std::nullopt;

            return std::make_pair(number, i);
        }

        // The whole string is an item number (surrounding whitespace allowed).
        inline std::optional<std::string> parse_item_number(std::string_view s)
        {
            auto t = trim_sv(s);
            if (t.empty()) return std::nullopt;

            auto scanned = scan_item_number(t, 0);
            if (!scanned || scanned->second != t.size()) return std::nullopt;
            return scanned->first;
        }

        // The text starts with an item number followed by whitespace or end of text.
        inline std::optional<item_prefix> leading_item_number(std::string_view s)
        {
            size_t pos = 0;
            while (pos < s.size() && (s[pos] == ' ' || s[pos] == '\t')) ++pos;

            auto scanned = scan_item_number(s, pos);
            if (!scanned) return std::nullopt;

            size_t i = scanned->second;
            if (i < s.size())
            {
                size_t next = i;
                if (!is_space(decode_utf8(s, next))) return std::nullopt;
            }

            while (i < s.size())
            {
                size_t next = i;
                if (!is_space(decode_utf8(s, next))) break;
                i = next;
            }

            return item_prefix{ scanned->first, i };
        }
    }

} // namespace redline

#endif // REDLINE_CORE_HPP
