// redline_document.hpp - Redline Document Patch Engine - Authoritative Document Model
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef REDLINE_DOCUMENT_HPP
#define REDLINE_DOCUMENT_HPP

#include "redline_core.hpp"

#include <span>
#include <ranges>
#include <tuple>

namespace redline
{
//========================================================================
// Content values
//========================================================================

    struct run_format
    {
        bool        bold      = false;
        bool        italic    = false;
        bool        underline = false;
        std::string color;            // RRGGBB, empty for automatic
        double      size      = 0;    // points, 0 for inherited
        std::string font;

        bool operator==(run_format const &) const = default;
    };

    struct run
    {
        std::string text;
        run_format  format;

        bool operator==(run const &) const = default;
    };

    struct comment
    {
        std::string author;
        std::string text;

        bool operator==(comment const &) const = default;
    };

    // "Heading N" / "Заголовок N" -> N, "Title" -> 0.
    inline std::optional<int> heading_level(std::string_view style)
    {
        auto lower = detail::casefold(detail::trim_sv(style));

        if (lower == "title" || lower == "название")
            return 0;

        for (std::string_view prefix : { std::string_view("heading"), std::string_view("заголовок") })
        {
            if (lower.rfind(prefix, 0) != 0)
                continue;

            auto rest = detail::trim_sv(std::string_view(lower).substr(prefix.size()));
            if (rest.empty())
                return 1;

            char* end = nullptr;
            std::string digits(rest);
            long level = std::strtol(digits.c_str(), &end, 10);
            if (end == digits.c_str() + digits.size() && level >= 1 && level <= 9)
                return static_cast<int>(level);
        }

        return std::nullopt;
    }

    inline bool is_toc_style(std::string_view style)
    {
        auto lower = detail::casefold(detail::trim_sv(style));
        return lower.rfind("toc", 0) == 0 || lower.rfind("оглавление", 0) == 0;
    }

//========================================================================
// Document
//========================================================================

    class document
    {
    public:
        //------------------------------------------------------------------------
        // Public, read-only views
        //------------------------------------------------------------------------

        struct paragraph_view;
        struct table_view;

        //------------------------------------------------------------------------
        // Construction
        //------------------------------------------------------------------------

        document() = default;

        //------------------------------------------------------------------------
        // Body access
        //------------------------------------------------------------------------

        size_t block_count() const noexcept
        {
            return body_.size();
        }

        std::span<const block_ref> blocks() const noexcept
        {
            return body_;
        }

        block_ref block(size_t index) const
        {
            return body_.at(index);
        }

        bool is_paragraph(size_t index) const noexcept
        {
            return index < body_.size() && std::holds_alternative<paragraph_id>(body_[index]);
        }

        bool is_table(size_t index) const noexcept
        {
            return index < body_.size() && std::holds_alternative<table_id>(body_[index]);
        }

        // Current body position of a block; empty once the block is gone.
        std::optional<size_t> index_of(block_ref ref) const noexcept
        {
            for (size_t i = 0; i < body_.size(); ++i)
                if (body_[i] == ref)
                    return i;
            return std::nullopt;
        }

        // Body position of the block that holds a paragraph (itself or its table).
        std::optional<size_t> block_index_of(paragraph_id id) const noexcept;

        //------------------------------------------------------------------------
        // Paragraph and table access
        //------------------------------------------------------------------------

        size_t paragraph_count() const noexcept
        {
            return static_cast<size_t>(std::ranges::count_if(paragraphs_, [](auto const & p) { return p.alive; }));
        }

        size_t table_count() const noexcept
        {
            return static_cast<size_t>(std::ranges::count_if(tables_, [](auto const & t) { return t.alive; }));
        }

        std::optional<paragraph_view> paragraph(paragraph_id id) const noexcept;
        std::optional<paragraph_view> paragraph_at(size_t block_index) const noexcept;

        std::optional<table_view> table(table_id id) const noexcept;
        std::optional<table_view> table_at(size_t block_index) const noexcept;

        //------------------------------------------------------------------------
        // Text
        //------------------------------------------------------------------------

        std::string paragraph_text(paragraph_id id) const;

        // Table blocks read as their cells joined by spaces, one line per row.
        std::string block_text(size_t index) const;

        std::string text() const;

    private:

        //------------------------------------------------------------------------
        // Internal storage; nodes are never moved or reused within a session
        //------------------------------------------------------------------------

        struct paragraph_node
        {
            paragraph_id          id;
            std::string           style;
            std::vector<run>      runs;
            std::vector<comment>  comments;
            table_id              owner = invalid_id<table_tag>();
            bool                  alive = true;
        };

        struct cell_node
        {
            std::vector<paragraph_id> paragraphs;
        };

        struct row_node
        {
            std::vector<cell_node> cells;
        };

        struct table_node
        {
            table_id              id;
            std::string           style;
            std::vector<row_node> rows;
            bool                  alive = true;
        };

        std::vector<paragraph_node> paragraphs_;
        std::vector<table_node>     tables_;
        std::vector<block_ref>      body_;

        paragraph_node * get_node(paragraph_id id) noexcept
        {
            if (id.val >= paragraphs_.size() || !paragraphs_[id.val].alive) return nullptr;
            return &paragraphs_[id.val];
        }

        paragraph_node const * get_node(paragraph_id id) const noexcept
        {
            if (id.val >= paragraphs_.size() || !paragraphs_[id.val].alive) return nullptr;
            return &paragraphs_[id.val];
        }

        table_node * get_node(table_id id) noexcept
        {
            if (id.val >= tables_.size() || !tables_[id.val].alive) return nullptr;
            return &tables_[id.val];
        }

        table_node const * get_node(table_id id) const noexcept
        {
            if (id.val >= tables_.size() || !tables_[id.val].alive) return nullptr;
            return &tables_[id.val];
        }

        paragraph_id create_paragraph_id() noexcept { return paragraph_id{ paragraphs_.size() }; }
        table_id     create_table_id() noexcept     { return table_id{ tables_.size() }; }

        friend class editor;
    };

//========================================================================
// Views
//========================================================================

    struct document::paragraph_view
    {
        const document* doc;
        const paragraph_node* node;

        paragraph_id id() const noexcept
        {
            return node->id;
        }

        std::string_view style() const noexcept
        {
            return node->style;
        }

        std::span<const run> runs() const noexcept
        {
            return node->runs;
        }

        std::span<const comment> comments() const noexcept
        {
            return node->comments;
        }

        std::string text() const
        {
            std::string out;
            for (auto const & r : node->runs)
                out += r.text;
            return out;
        }

        std::optional<int> heading_level() const
        {
            return redline::heading_level(node->style);
        }

        bool is_heading() const
        {
            return heading_level().has_value();
        }

        bool is_toc_entry() const
        {
            return is_toc_style(node->style);
        }

        bool in_table() const noexcept
        {
            return valid(node->owner);
        }

        table_id owner() const noexcept
        {
            return node->owner;
        }
    };

    struct document::table_view
    {
        const document* doc;
        const table_node* node;

        table_id id() const noexcept
        {
            return node->id;
        }

        std::string_view style() const noexcept
        {
            return node->style;
        }

        size_t row_count() const noexcept
        {
            return node->rows.size();
        }

        size_t column_count(size_t row) const noexcept
        {
            return row < node->rows.size() ? node->rows[row].cells.size() : 0;
        }

        size_t max_column_count() const noexcept
        {
            size_t n = 0;
            for (auto const & r : node->rows)
                n = std::max(n, r.cells.size());
            return n;
        }

        std::span<const paragraph_id> cell_paragraphs(size_t row, size_t col) const noexcept
        {
            if (row >= node->rows.size() || col >= node->rows[row].cells.size())
                return {};
            return node->rows[row].cells[col].paragraphs;
        }

        std::string cell_text(size_t row, size_t col) const
        {
            std::string out;
            bool first = true;
            for (auto pid : cell_paragraphs(row, col))
            {
                if (!first) out += '\n';
                first = false;
                out += doc->paragraph_text(pid);
            }
            return out;
        }

        std::vector<std::string> row_texts(size_t row) const
        {
            std::vector<std::string> out;
            for (size_t c = 0; c < column_count(row); ++c)
                out.push_back(cell_text(row, c));
            return out;
        }

        // Locates a paragraph inside the table as (row, col, index in cell).
        std::optional<std::tuple<size_t, size_t, size_t>> find(paragraph_id pid) const noexcept
        {
            for (size_t r = 0; r < node->rows.size(); ++r)
                for (size_t c = 0; c < node->rows[r].cells.size(); ++c)
                {
                    auto const & paras = node->rows[r].cells[c].paragraphs;
                    for (size_t p = 0; p < paras.size(); ++p)
                        if (paras[p] == pid)
                            return std::make_tuple(r, c, p);
                }
            return std::nullopt;
        }
    };

//========================================================================
// document member implementations
//========================================================================

    inline std::optional<document::paragraph_view>
    document::paragraph(paragraph_id id) const noexcept
    {
        auto const * node = get_node(id);
        if (!node)
            return std::nullopt;

        return paragraph_view{ this, node };
    }

    inline std::optional<document::paragraph_view>
    document::paragraph_at(size_t block_index) const noexcept
    {
        if (!is_paragraph(block_index))
            return std::nullopt;

        return paragraph(std::get<paragraph_id>(body_[block_index]));
    }

    inline std::optional<document::table_view>
    document::table(table_id id) const noexcept
    {
        auto const * node = get_node(id);
        if (!node)
            return std::nullopt;

        return table_view{ this, node };
    }

    inline std::optional<document::table_view>
    document::table_at(size_t block_index) const noexcept
    {
        if (!is_table(block_index))
            return std::nullopt;

        return table(std::get<table_id>(body_[block_index]));
    }

    inline std::optional<size_t> document::block_index_of(paragraph_id id) const noexcept
    {
        auto const * node = get_node(id);
        if (!node)
            return std::nullopt;

        if (valid(node->owner))
            return index_of(block_ref{ node->owner });

        return index_of(block_ref{ id });
    }

    inline std::string document::paragraph_text(paragraph_id id) const
    {
        auto p = paragraph(id);
        return p ? p->text() : std::string{};
    }

    inline std::string document::block_text(size_t index) const
    {
        if (auto p = paragraph_at(index))
            return p->text();

        std::string out;
        if (auto t = table_at(index))
        {
            for (size_t r = 0; r < t->row_count(); ++r)
            {
                if (r > 0) out += '\n';
                for (size_t c = 0; c < t->column_count(r); ++c)
                {
                    if (c > 0) out += ' ';
                    out += t->cell_text(r, c);
                }
            }
        }
        return out;
    }

    inline std::string document::text() const
    {
        std::string out;
        for (size_t i = 0; i < body_.size(); ++i)
        {
            if (i > 0) out += '\n';
            out += block_text(i);
        }
        return out;
    }

} // namespace redline

#endif // REDLINE_DOCUMENT_HPP
