// redline_editor.hpp - Redline Document Patch Engine - Document Editor
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef REDLINE_EDITOR_HPP
#define REDLINE_EDITOR_HPP

#include "redline_document.hpp"

namespace redline
{
    class editor
    {
    public:
        explicit editor(document & doc) noexcept
            : doc_(doc)
        {}

    //============================================================
    // Paragraphs
    //============================================================

        paragraph_id append_paragraph(std::string_view style, std::vector<run> runs);
        paragraph_id insert_paragraph_at(size_t position, std::string_view style, std::vector<run> runs);
        paragraph_id insert_paragraph_after(size_t block_index, std::string_view style, std::vector<run> runs);

        void set_style(paragraph_id id, std::string_view style);
        void set_runs(paragraph_id id, std::vector<run> runs);
        bool append_run(paragraph_id id, run r);

        // Replaces the byte span [begin, end) of the paragraph text. The full
        // replacement lands in the first touched run, fully covered runs are
        // removed, and the last touched run keeps only its trailing text.
        bool replace_span(paragraph_id id, size_t begin, size_t end, std::string_view replacement);

        bool attach_comment(paragraph_id id, comment c);

    //============================================================
    // Tables
    //============================================================

        table_id append_table(std::string_view style);
        table_id append_table(std::string_view style, table_rows const & rows);
        table_id insert_table_after(size_t block_index, std::string_view style, table_rows const & rows);

        size_t append_row(table_id table);
        size_t append_cell(table_id table, size_t row);
        paragraph_id append_cell_paragraph(table_id table, size_t row, size_t col, std::string_view style, std::vector<run> runs);

        // Writes text into the first run of the cell's first paragraph and drops
        // every other run and paragraph of the cell.
        bool set_cell_text(table_id table, size_t row, size_t col, std::string_view text);

        bool erase_row(table_id table, size_t row);

    //============================================================
    // Blocks
    //============================================================

        bool erase_block(size_t index);

        // Erases [first, last) and returns the number of blocks removed.
        size_t erase_blocks(size_t first, size_t last);

        // Comments never go inside a table: a table index is moved to the
        // block after it, creating an empty paragraph when the table is last.
        size_t comment_block_for(size_t block_index);

    private:

        document & doc_;

    //========================================================
    // Internal helpers; not exposed for clients
    //========================================================

        paragraph_id create_paragraph_node(std::string_view style, std::vector<run> runs, table_id owner);
        table_id create_table_node(std::string_view style, table_rows const & rows);
        void kill_table_contents(document::table_node & tn);
        void kill_cell(document::cell_node & cell);
    };

//================================================================================================================
//
// Editor implementations
//
//================================================================================================================

//========================================================
// Internal helpers; not exposed for clients
//========================================================

    inline paragraph_id editor::create_paragraph_node(std::string_view style, std::vector<run> runs, table_id owner)
    {
        paragraph_id id = doc_.create_paragraph_id();

        document::paragraph_node pn;
        pn.id    = id;
        pn.style = style.empty() ? std::string("Normal") : std::string(style);
        pn.runs  = std::move(runs);
        pn.owner = owner;

        doc_.paragraphs_.push_back(std::move(pn));
        return id;
    }

    inline table_id editor::create_table_node(std::string_view style, table_rows const & rows)
    {
        table_id id = doc_.create_table_id();

        document::table_node tn;
        tn.id    = id;
        tn.style = std::string(style);
        doc_.tables_.push_back(std::move(tn));

        size_t columns = 0;
        for (auto const & r : rows)
            columns = std::max(columns, r.size());

        for (size_t r = 0; r < rows.size(); ++r)
        {
            size_t row = append_row(id);
            for (size_t c = 0; c < columns; ++c)
            {
                size_t col = append_cell(id, row);
                std::string text = c < rows[r].size() ? rows[r][c] : std::string{};
                std::vector<run> runs;
                if (!text.empty())
                    runs.push_back(run{ std::move(text), {} });
                append_cell_paragraph(id, row, col, "Normal", std::move(runs));
            }
        }

        return id;
    }

    inline void editor::kill_cell(document::cell_node & cell)
    {
        for (auto pid : cell.paragraphs)
            if (auto * pn = doc_.get_node(pid))
                pn->alive = false;
        cell.paragraphs.clear();
    }

    inline void editor::kill_table_contents(document::table_node & tn)
    {
        for (auto & row : tn.rows)
            for (auto & cell : row.cells)
                kill_cell(cell);
    }

//============================================================
// Paragraphs
//============================================================

    inline paragraph_id editor::append_paragraph(std::string_view style, std::vector<run> runs)
    {
        return insert_paragraph_at(doc_.body_.size(), style, std::move(runs));
    }

    inline paragraph_id editor::insert_paragraph_at(size_t position, std::string_view style, std::vector<run> runs)
    {
        position = std::min(position, doc_.body_.size());

        paragraph_id id = create_paragraph_node(style, std::move(runs), invalid_id<table_tag>());
        doc_.body_.insert(doc_.body_.begin() + static_cast<std::ptrdiff_t>(position), block_ref{ id });
        return id;
    }

    inline paragraph_id editor::insert_paragraph_after(size_t block_index, std::string_view style, std::vector<run> runs)
    {
        if (block_index >= doc_.body_.size())
            return invalid_id<paragraph_tag>();

        return insert_paragraph_at(block_index + 1, style, std::move(runs));
    }

    inline void editor::set_style(paragraph_id id, std::string_view style)
    {
        if (auto * pn = doc_.get_node(id))
            pn->style = std::string(style);
    }

    inline void editor::set_runs(paragraph_id id, std::vector<run> runs)
    {
        if (auto * pn = doc_.get_node(id))
            pn->runs = std::move(runs);
    }

    inline bool editor::append_run(paragraph_id id, run r)
    {
        auto * pn = doc_.get_node(id);
        if (!pn)
            return false;

        pn->runs.push_back(std::move(r));
        return true;
    }

    inline bool editor::replace_span(paragraph_id id, size_t begin, size_t end, std::string_view replacement)
    {
        auto * pn = doc_.get_node(id);
        if (!pn || begin > end)
            return false;

        auto & runs = pn->runs;

        size_t total = 0;
        for (auto const & r : runs)
            total += r.text.size();

        if (end > total)
            return false;

        if (runs.empty())
        {
            if (!replacement.empty())
                runs.push_back(run{ std::string(replacement), {} });
            return true;
        }

        // Run offsets
        std::vector<size_t> starts;
        starts.reserve(runs.size());
        size_t offset = 0;
        for (auto const & r : runs)
        {
            starts.push_back(offset);
            offset += r.text.size();
        }

        auto run_containing = [&](size_t pos) -> size_t
        {
            for (size_t k = 0; k < runs.size(); ++k)
                if (!runs[k].text.empty() && starts[k] <= pos && pos < starts[k] + runs[k].text.size())
                    return k;

            // pos == total: the last run with text, or the last run
            for (size_t k = runs.size(); k-- > 0;)
                if (!runs[k].text.empty())
                    return k;
            return runs.size() - 1;
        };

        size_t first = run_containing(begin);
        size_t last  = end > begin ? run_containing(end - 1) : first;

        if (first == last)
        {
            auto & r = runs[first];
            size_t local_begin = std::min(begin - std::min(begin, starts[first]), r.text.size());
            size_t local_end   = std::min(end - std::min(end, starts[first]), r.text.size());
            r.text = r.text.substr(0, local_begin) + std::string(replacement) + r.text.substr(local_end);

            if (r.text.empty() && runs.size() > 1)
                runs.erase(runs.begin() + static_cast<std::ptrdiff_t>(first));
            return true;
        }

        auto & head = runs[first];
        auto & tail = runs[last];

        head.text = head.text.substr(0, begin - starts[first]) + std::string(replacement);
        tail.text = tail.text.substr(end - starts[last]);

        bool drop_tail = tail.text.empty();
        bool drop_head = head.text.empty();

        // Back to front so earlier indices stay valid
        if (drop_tail)
            runs.erase(runs.begin() + static_cast<std::ptrdiff_t>(last));

        runs.erase(runs.begin() + static_cast<std::ptrdiff_t>(first + 1),
                   runs.begin() + static_cast<std::ptrdiff_t>(last));

        if (drop_head && runs.size() > 1)
            runs.erase(runs.begin() + static_cast<std::ptrdiff_t>(first));

        return true;
    }

    inline bool editor::attach_comment(paragraph_id id, comment c)
    {
        auto * pn = doc_.get_node(id);
        if (!pn)
            return false;

        pn->comments.push_back(std::move(c));
        return true;
    }

//============================================================
// Tables
//============================================================

    inline table_id editor::append_table(std::string_view style)
    {
        return append_table(style, {});
    }

    inline table_id editor::append_table(std::string_view style, table_rows const & rows)
    {
        table_id id = create_table_node(style, rows);
        doc_.body_.push_back(block_ref{ id });
        return id;
    }

    inline table_id editor::insert_table_after(size_t block_index, std::string_view style, table_rows const & rows)
    {
        if (block_index >= doc_.body_.size())
            return invalid_id<table_tag>();

        table_id id = create_table_node(style, rows);
        doc_.body_.insert(doc_.body_.begin() + static_cast<std::ptrdiff_t>(block_index + 1), block_ref{ id });
        return id;
    }

    inline size_t editor::append_row(table_id table)
    {
        auto * tn = doc_.get_node(table);
        if (!tn)
            return npos();

        tn->rows.emplace_back();
        return tn->rows.size() - 1;
    }

    inline size_t editor::append_cell(table_id table, size_t row)
    {
        auto * tn = doc_.get_node(table);
        if (!tn || row >= tn->rows.size())
            return npos();

        tn->rows[row].cells.emplace_back();
        return tn->rows[row].cells.size() - 1;
    }

    inline paragraph_id editor::append_cell_paragraph(table_id table, size_t row, size_t col, std::string_view style, std::vector<run> runs)
    {
        auto * tn = doc_.get_node(table);
        if (!tn || row >= tn->rows.size() || col >= tn->rows[row].cells.size())
            return invalid_id<paragraph_tag>();

        paragraph_id id = create_paragraph_node(style, std::move(runs), table);

        // create_paragraph_node may reallocate paragraphs_, never tables_
        tn->rows[row].cells[col].paragraphs.push_back(id);
        return id;
    }

    inline bool editor::set_cell_text(table_id table, size_t row, size_t col, std::string_view text)
    {
        auto * tn = doc_.get_node(table);
        if (!tn || row >= tn->rows.size() || col >= tn->rows[row].cells.size())
            return false;

        auto & cell = tn->rows[row].cells[col];

        if (cell.paragraphs.empty())
        {
            append_cell_paragraph(table, row, col, "Normal", { run{ std::string(text), {} } });
            return true;
        }

        auto * first = doc_.get_node(cell.paragraphs.front());
        if (!first)
            return false;

        if (first->runs.empty())
            first->runs.push_back(run{ std::string(text), {} });
        else
        {
            first->runs.front().text = std::string(text);
            first->runs.resize(1);
        }

        for (size_t p = 1; p < cell.paragraphs.size(); ++p)
            if (auto * pn = doc_.get_node(cell.paragraphs[p]))
                pn->alive = false;
        cell.paragraphs.resize(1);

        return true;
    }

    inline bool editor::erase_row(table_id table, size_t row)
    {
        auto * tn = doc_.get_node(table);
        if (!tn || row >= tn->rows.size())
            return false;

        for (auto & cell : tn->rows[row].cells)
            kill_cell(cell);
        tn->rows.erase(tn->rows.begin() + static_cast<std::ptrdiff_t>(row));

        if (tn->rows.empty())
        {
            if (auto index = doc_.index_of(block_ref{ table }))
                erase_block(*index);
        }

        return true;
    }

//============================================================
// Blocks
//============================================================

    inline bool editor::erase_block(size_t index)
    {
        if (index >= doc_.body_.size())
            return false;

        block_ref ref = doc_.body_[index];

        if (auto const * pid = std::get_if<paragraph_id>(&ref))
        {
            if (auto * pn = doc_.get_node(*pid))
                pn->alive = false;
        }
        else if (auto * tn = doc_.get_node(std::get<table_id>(ref)))
        {
            kill_table_contents(*tn);
            tn->alive = false;
        }

        doc_.body_.erase(doc_.body_.begin() + static_cast<std::ptrdiff_t>(index));
        return true;
    }

    inline size_t editor::erase_blocks(size_t first, size_t last)
    {
        last = std::min(last, doc_.body_.size());

        size_t removed = 0;
        for (size_t i = first; i < last; ++i)
            if (erase_block(first))
                ++removed;
        return removed;
    }

    inline size_t editor::comment_block_for(size_t block_index)
    {
        if (!doc_.is_table(block_index))
            return block_index;

        if (block_index + 1 < doc_.body_.size())
            return block_index + 1;

        insert_paragraph_after(block_index, "Normal", {});
        return block_index + 1;
    }

} // namespace redline

#endif // REDLINE_EDITOR_HPP
