// redline_serializer.hpp - Redline Document Patch Engine - Document Text Serializer
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef REDLINE_SERIALIZER_HPP
#define REDLINE_SERIALIZER_HPP

#include "redline_document.hpp"

#include <sstream>

namespace redline
{
    //========================================================================
    // SERIALIZER API
    //========================================================================

    inline std::string serialize(document const & doc);

    // One body block in the same format; used to compare blocks across edits.
    inline std::string serialize_block(document const & doc, size_t block_index);

    //========================================================================
    // SERIALIZER IMPLEMENTATION
    //========================================================================

    namespace detail
    {
        class serializer_impl
        {
        public:
            explicit serializer_impl(document const & doc)
                : doc_(doc)
            {}

            std::string serialize()
            {
                std::ostringstream out;
                for (size_t i = 0; i < doc_.block_count(); ++i)
                    serialize_block(out, i);
                return out.str();
            }

            void serialize_block(std::ostringstream & out, size_t index)
            {
                if (auto p = doc_.paragraph_at(index))
                    serialize_paragraph(out, *p);
                else if (auto t = doc_.table_at(index))
                    serialize_table(out, *t);
            }

        private:
            document const & doc_;

            void serialize_paragraph(std::ostringstream & out, document::paragraph_view const & p)
            {
                out << "@para";
                if (p.style() != "Normal")
                    out << ' ' << p.style();
                out << '\n';

                for (auto const & r : p.runs())
                {
                    out << '~';
                    serialize_format(out, r.format);
                    out << '|' << escape(r.text) << '\n';
                }

                for (auto const & c : p.comments())
                    out << '!' << c.author << '|' << escape(c.text) << '\n';
            }

            void serialize_table(std::ostringstream & out, document::table_view const & t)
            {
                out << "@table";
                if (!t.style().empty())
                    out << ' ' << t.style();
                out << '\n';

                for (size_t r = 0; r < t.row_count(); ++r)
                {
                    out << "@row\n";
                    for (size_t c = 0; c < t.column_count(r); ++c)
                    {
                        out << "@cell\n";
                        for (auto pid : t.cell_paragraphs(r, c))
                            if (auto p = doc_.paragraph(pid))
                                serialize_paragraph(out, *p);
                    }
                }

                out << "@end\n";
            }

            void serialize_format(std::ostringstream & out, run_format const & f)
            {
                std::vector<std::string> attrs;
                if (f.bold)      attrs.push_back("b");
                if (f.italic)    attrs.push_back("i");
                if (f.underline) attrs.push_back("u");
                if (!f.color.empty()) attrs.push_back("color=" + f.color);
                if (f.size > 0)
                {
                    std::ostringstream size;
                    size << f.size;
                    attrs.push_back("size=" + size.str());
                }
                if (!f.font.empty()) attrs.push_back("font=" + f.font);

                out << join(attrs, ",");
            }

            static std::string escape(std::string_view text)
            {
                std::string out;
                out.reserve(text.size());
                for (char c : text)
                {
                    if (c == '\\')      out += "\\\\";
                    else if (c == '\n') out += "\\n";
                    else                out += c;
                }
                return out;
            }
        };

    } // namespace detail

    //========================================================================
    // PUBLIC SERIALIZER API IMPLEMENTATION
    //========================================================================

    inline std::string serialize(document const & doc)
    {
        detail::serializer_impl serializer(doc);
        return serializer.serialize();
    }

    inline std::string serialize_block(document const & doc, size_t block_index)
    {
        detail::serializer_impl serializer(doc);
        std::ostringstream out;
        serializer.serialize_block(out, block_index);
        return out.str();
    }

} // namespace redline

#endif // REDLINE_SERIALIZER_HPP
