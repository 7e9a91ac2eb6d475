// redline_retry.hpp - Redline Document Patch Engine - Retry Chain
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef REDLINE_RETRY_HPP
#define REDLINE_RETRY_HPP

#include "redline_executor.hpp"

#include <spdlog/spdlog.h>

namespace redline
{
    // Escalates an operation whose target was not found through weaker
    // matching: whitespace, case, the numbered item (when the operation names
    // one), keywords, and last the blocks around the previous edit.
    class retry_chain
    {
    public:
        retry_chain(patch_executor & executor, patch_options const & opts)
            : executor_(executor)
            , opts_(opts)
        {}

        // The fixed attempts for an operation, primary first. Modes equal to
        // the primary are not repeated.
        std::vector<attempt_config> plan(operation const & op) const;

        // Centred on the last edit; empty before any edit.
        std::optional<attempt_config> neighbour_attempt() const;

        execution_result execute_with_retry(operation const & op);

    private:
        patch_executor &      executor_;
        patch_options const & opts_;
    };

//================================================================================================================
//
// Implementations
//
//================================================================================================================

    inline std::vector<attempt_config> retry_chain::plan(operation const & op) const
    {
        std::vector<attempt_config> out;

        auto add = [&](match_mode mode)
        {
            if (!out.empty() && mode == opts_.primary_mode)
                return;

            attempt_config cfg;
            cfg.mode  = mode;
            cfg.label = std::string(to_string(mode));
            out.push_back(std::move(cfg));
        };

        add(opts_.primary_mode);

        if (!patch_executor::retryable(op))
            return out;

        add(match_mode::whitespace_normalized);
        add(match_mode::case_insensitive);

        if (auto const * rt = std::get_if<replace_text>(&op.body); rt && rt->item_number)
            add(match_mode::numbered_item);

        add(match_mode::keyword_subset);
        return out;
    }

    inline std::optional<attempt_config> retry_chain::neighbour_attempt() const
    {
        auto at = executor_.last_location();
        if (!at)
            return std::nullopt;

        attempt_config cfg;
        cfg.mode             = match_mode::keyword_subset;
        cfg.stemmed_keywords = true;
        cfg.block_range      = std::make_pair(*at > opts_.neighbor_radius ? *at - opts_.neighbor_radius : 0, *at + opts_.neighbor_radius);
        cfg.label            = "neighbor_scan";
        return cfg;
    }

    inline execution_result retry_chain::execute_with_retry(operation const & op)
    {
        execution_state  state;
        execution_result result = make_result(op);

        auto not_found = [&]
        {
            return result.status == exec_status::failed
                && result.error
                && result.error->kind == patch_error_kind::target_not_found;
        };

        auto attempts = plan(op);
        for (size_t k = 0; k < attempts.size(); ++k)
        {
            if (k > 0)
                spdlog::debug("{}: retrying with {}", op.id, attempts[k].label);

            executor_.attempt(op, attempts[k], state, result);
            if (!not_found())
                return result;
        }

        if (patch_executor::retryable(op))
        {
            if (auto neighbour = neighbour_attempt())
            {
                spdlog::debug("{}: scanning blocks {}..{}", op.id, neighbour->block_range->first, neighbour->block_range->second);
                executor_.attempt(op, *neighbour, state, result);
            }
        }

        return result;
    }

} // namespace redline

#endif // REDLINE_RETRY_HPP
