// redline_orderer.hpp - Redline Document Patch Engine - Operation Orderer
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef REDLINE_ORDERER_HPP
#define REDLINE_ORDERER_HPP

#include "redline_operation.hpp"

#include <iterator>

#include <spdlog/spdlog.h>

namespace redline
{
    // A local operation depends on a global one when its target or its new
    // text mentions the global target.
    inline bool is_dependent(operation const & local, operation const & global)
    {
        auto const & g = target_text(global);
        return detail::contains_folded(target_text(local), g)
            || detail::contains_folded(payload_text(local), g);
    }

    // Dependent local operations, then the other local ones, then the global
    // ones; each group keeps its original relative order.
    inline std::vector<operation> order(std::vector<operation> ops)
    {
        std::vector<operation> dependent;
        std::vector<operation> independent;
        std::vector<operation> global;

        std::vector<operation const *> globals;
        for (auto const & op : ops)
            if (is_global(op))
                globals.push_back(&op);

        for (auto & op : ops)
        {
            if (is_global(op))
                continue;

            bool depends = std::any_of(globals.begin(), globals.end(),
                [&](operation const * g) { return is_dependent(op, *g); });

            if (depends)
                spdlog::debug("{} depends on a global replacement; moved ahead", op.id);

            (depends ? dependent : independent).push_back(op);
        }

        for (auto & op : ops)
            if (is_global(op))
                global.push_back(std::move(op));

        std::vector<operation> out;
        out.reserve(ops.size());
        std::move(dependent.begin(), dependent.end(), std::back_inserter(out));
        std::move(independent.begin(), independent.end(), std::back_inserter(out));
        std::move(global.begin(), global.end(), std::back_inserter(out));
        return out;
    }

} // namespace redline

#endif // REDLINE_ORDERER_HPP
