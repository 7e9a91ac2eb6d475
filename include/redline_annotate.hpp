// redline_annotate.hpp - Redline Document Patch Engine - Annotation Tracker
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef REDLINE_ANNOTATE_HPP
#define REDLINE_ANNOTATE_HPP

#include "redline_executor.hpp"

#include <spdlog/spdlog.h>

namespace redline
{
    // Writes the audit notes once every operation has run. Each site is
    // resolved from its handle right before its note goes in.
    class annotation_tracker
    {
    public:
        explicit annotation_tracker(comment_sink & sink)
            : sink_(sink)
        {}

        // Returns the number of notes written.
        size_t annotate(document & doc, std::vector<execution_result> const & results);

        static std::string note_for(execution_result const & result);

    private:
        comment_sink & sink_;
    };

//========================================================================
// Implementations
//========================================================================

    inline std::string annotation_tracker::note_for(execution_result const & result)
    {
        std::string note = "[" + result.operation_id + "] " + result.kind + "\n" + result.description;
        if (!result.detail.empty())
            note += "\n" + result.detail;
        note += "\nСтатус: " + std::string(result.applied() ? "SUCCESS" : "FAILED");
        return note;
    }

    inline size_t annotation_tracker::annotate(document & doc, std::vector<execution_result> const & results)
    {
        size_t written = 0;

        for (auto const & r : results)
        {
            if (!r.applied() || !r.annotate)
                continue;

            if (!r.site)
            {
                spdlog::debug("{}: nothing left to annotate", r.operation_id);
                continue;
            }

            auto index = doc.index_of(*r.site);
            if (!index)
            {
                spdlog::warn("{}: edited block no longer exists; note skipped", r.operation_id);
                continue;
            }

            try
            {
                if (sink_.insert(doc, *index, note_for(r)))
                    ++written;
                else
                    spdlog::warn("{}: note could not be placed at block {}", r.operation_id, *index);
            }
            catch (std::exception const & e)
            {
                spdlog::warn("{}: comment sink failed: {}", r.operation_id, e.what());
            }
        }

        return written;
    }

} // namespace redline

#endif // REDLINE_ANNOTATE_HPP
