// redline_ports.hpp - Redline Document Patch Engine - Collaborator Ports
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef REDLINE_PORTS_HPP
#define REDLINE_PORTS_HPP

#include "redline_editor.hpp"

namespace redline
{
//========================================================================
// Comment sink
//========================================================================

    // Places a note next to a block. A sink never writes inside a table.
    class comment_sink
    {
    public:
        virtual ~comment_sink() = default;

        // False when there is no such block.
        virtual bool insert(document & doc, size_t block_index, std::string_view text) = 0;
    };

    // Attaches a comment record to the paragraph; a table's comment goes to
    // the block after it.
    class attached_comment_sink : public comment_sink
    {
    public:
        explicit attached_comment_sink(std::string author = "redline")
            : author_(std::move(author))
        {}

        bool insert(document & doc, size_t block_index, std::string_view text) override
        {
            if (block_index >= doc.block_count())
                return false;

            editor ed(doc);
            size_t target = ed.comment_block_for(block_index);

            auto p = doc.paragraph_at(target);
            if (!p)
            {
                // Two tables back to back: a fresh paragraph between them
                ed.insert_paragraph_after(block_index, "Normal", {});
                p = doc.paragraph_at(block_index + 1);
                if (!p)
                    return false;
            }

            return ed.attach_comment(p->id(), comment{ author_, std::string(text) });
        }

    private:
        std::string author_;
    };

    // Inserts a visible italic blue note paragraph after the block.
    class inline_comment_sink : public comment_sink
    {
    public:
        bool insert(document & doc, size_t block_index, std::string_view text) override
        {
            if (block_index >= doc.block_count())
                return false;

            run_format format;
            format.italic = true;
            format.color  = "0000FF";

            editor ed(doc);
            auto id = ed.insert_paragraph_after(block_index, "Normal", {
                run{ "[Комментарий: " + std::string(text) + "]", format }
            });
            return valid(id);
        }
    };

//========================================================================
// LLM assist
//========================================================================

    struct candidate_table
    {
        table_id                 id;
        std::vector<std::string> header;   // first row texts
        size_t                   rows = 0;
    };

    struct reviewed_mapping
    {
        column_mapping mapping;
        double         confidence = 0;
    };

    // Optional external judgement. Every call may throw or come back empty;
    // callers then keep their own algorithmic answer.
    class llm_assist
    {
    public:
        virtual ~llm_assist() = default;

        virtual std::vector<table_id> classify_target_table(std::string_view description, std::span<const candidate_table> candidates) = 0;

        virtual std::optional<reviewed_mapping> review_column_mapping(std::vector<std::string> const & row, column_mapping const & proposed) = 0;
    };

} // namespace redline

#endif // REDLINE_PORTS_HPP
