// redline_session.hpp - Redline Document Patch Engine - Patch Session
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef REDLINE_SESSION_HPP
#define REDLINE_SESSION_HPP

#include "redline_annotate.hpp"
#include "redline_orderer.hpp"
#include "redline_retry.hpp"
#include "redline_store.hpp"

#include <atomic>
#include <memory>

#include <spdlog/spdlog.h>

namespace redline
{
//========================================================================
// Cancellation
//========================================================================

    // May be raised from another thread; the session checks it between
    // operations and before persisting.
    class cancel_token
    {
    public:
        void raise() noexcept { raised_.store(true); }
        bool raised() const noexcept { return raised_.load(); }

    private:
        std::atomic<bool> raised_{ false };
    };

//========================================================================
// Report
//========================================================================

    struct execution_report
    {
        std::vector<execution_result> results;
        bool                          persisted = false;

        size_t total() const noexcept { return results.size(); }

        size_t applied() const noexcept
        {
            return static_cast<size_t>(std::count_if(results.begin(), results.end(), [](auto const & r) { return r.applied(); }));
        }

        size_t failed() const noexcept { return total() - applied(); }
    };

    inline std::string format_report(execution_report const & report)
    {
        std::ostringstream out;
        out << "Patch report: " << report.total() << " operation(s), "
            << report.applied() << " applied, " << report.failed() << " failed\n";

        for (auto const & r : report.results)
        {
            out << "  [" << r.operation_id << "] " << r.kind << ' ' << to_string(r.status);
            if (r.applied())
                out << " (" << r.strategy << ", " << r.attempts << " attempt(s), " << r.occurrences << " change(s))";
            else if (r.error)
                out << ' ' << to_string(r.error->kind) << " after " << r.attempts << " attempt(s)";
            if (!r.detail.empty())
                out << ": " << r.detail;
            out << '\n';
        }

        out << "Persisted: " << (report.persisted ? "yes" : "no") << '\n';
        return out.str();
    }

//========================================================================
// Session
//========================================================================

    using session_context = context<execution_report, patch_error>;

    // Owns everything one patch run needs; independent sessions share nothing.
    class patch_session
    {
    public:
        patch_session(document_store & store, comment_sink & sink, patch_options options = {}, llm_assist * assist = nullptr)
            : store_(store)
            , options_(std::move(options))
            , assist_(assist)
            , sink_(&sink)
        {}

        // The comment sink follows options.annotation.
        explicit patch_session(document_store & store, patch_options options = {}, llm_assist * assist = nullptr)
            : store_(store)
            , options_(std::move(options))
            , assist_(assist)
        {
            if (options_.annotation == annotation_style::inline_paragraph)
                owned_sink_ = std::make_unique<inline_comment_sink>();
            else
                owned_sink_ = std::make_unique<attached_comment_sink>(options_.annotation_author);
            sink_ = owned_sink_.get();
        }

        patch_options const & options() const noexcept { return options_; }

        // Validates, orders, executes and annotates against doc. Persists nothing.
        session_context patch(document & doc, std::vector<raw_operation> const & raw, cancel_token const * cancel = nullptr);

        // Loads source, patches it and saves it to destination exactly once.
        // On any fatal error nothing is written.
        session_context run(std::string_view source, std::vector<raw_operation> const & raw,
                            std::string_view destination, cancel_token const * cancel = nullptr);

    private:
        document_store &              store_;
        patch_options                 options_;
        llm_assist *                  assist_;
        std::unique_ptr<comment_sink> owned_sink_;
        comment_sink *                sink_ = nullptr;

        static bool cancelled(cancel_token const * cancel) { return cancel && cancel->raised(); }
    };

//================================================================================================================
//
// Implementations
//
//================================================================================================================

    inline session_context patch_session::patch(document & doc, std::vector<raw_operation> const & raw, cancel_token const * cancel)
    {
        session_context out;
        auto & results = out.result.results;

        spdlog::info("patch session started: {} operation(s), {} block(s)", raw.size(), doc.block_count());

        std::vector<operation> ops;
        for (size_t i = 0; i < raw.size(); ++i)
        {
            auto checked = validate(raw[i], i + 1);
            if (auto const * bad = std::get_if<malformed_operation>(&checked))
            {
                spdlog::warn("{} rejected: {} ({})", bad->id, bad->error.message, to_string(bad->error.kind));
                results.push_back(make_result(*bad));
                continue;
            }
            ops.push_back(std::get<operation>(std::move(checked)));
        }

        ops = order(std::move(ops));

        patch_executor executor(doc, options_, *sink_, assist_);
        retry_chain    chain(executor, options_);

        for (auto const & op : ops)
        {
            if (cancelled(cancel))
            {
                spdlog::error("patch session aborted before {}", op.id);
                out.errors.push_back({ patch_error_kind::aborted, "cancelled before " + op.id });
                return out;
            }

            auto result = chain.execute_with_retry(op);
            if (result.applied())
                spdlog::info("{} {} applied [{}]: {}", op.id, result.kind, result.strategy, result.detail);
            else
                spdlog::warn("{} {} failed after {} attempt(s): {}", op.id, result.kind, result.attempts, result.detail);

            results.push_back(std::move(result));
        }

        if (cancelled(cancel))
        {
            spdlog::error("patch session aborted before annotation");
            out.errors.push_back({ patch_error_kind::aborted, "cancelled before annotation" });
            return out;
        }

        if (options_.annotate)
        {
            annotation_tracker tracker(*sink_);
            size_t notes = tracker.annotate(doc, results);
            spdlog::debug("{} annotation(s) written", notes);
        }

        spdlog::info("patch session finished: {} applied, {} failed", out.result.applied(), out.result.failed());
        return out;
    }

    inline session_context patch_session::run(std::string_view source, std::vector<raw_operation> const & raw,
                                              std::string_view destination, cancel_token const * cancel)
    {
        load_context loaded;
        try
        {
            loaded = store_.load(source);
        }
        catch (std::exception const & e)
        {
            spdlog::error("loading {} failed: {}", source, e.what());
            return { {}, { { patch_error_kind::load_failure, std::string("cannot load document: ") + e.what() } } };
        }

        for (auto const & e : loaded.errors)
        {
            if (is_fatal(e))
            {
                spdlog::error("loading {} failed: {}", source, e.message);
                return { {}, { { patch_error_kind::load_failure, std::string(to_string(e.kind)) + ": " + e.message } } };
            }
            spdlog::warn("{}: {}", source, e.message);
        }

        document doc = std::move(loaded.result);

        auto out = patch(doc, raw, cancel);
        if (out.has_errors())
            return out;

        if (cancelled(cancel))
        {
            spdlog::error("patch session aborted before saving");
            out.errors.push_back({ patch_error_kind::aborted, "cancelled before saving" });
            return out;
        }

        std::optional<store_error> failure;
        try
        {
            failure = store_.save(doc, destination);
        }
        catch (std::exception const & e)
        {
            failure = store_error{ store_error_kind::write_failure, e.what() };
        }

        if (failure)
        {
            spdlog::error("saving {} failed: {}", destination, failure->message);
            out.errors.push_back({ patch_error_kind::persistence_failure, failure->message });
            return out;
        }

        out.result.persisted = true;
        spdlog::info("saved {}", destination);
        return out;
    }

} // namespace redline

#endif // REDLINE_SESSION_HPP
