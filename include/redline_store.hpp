// redline_store.hpp - Redline Document Patch Engine - Document Stores
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef REDLINE_STORE_HPP
#define REDLINE_STORE_HPP

#include "redline_parser.hpp"
#include "redline_serializer.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>

namespace redline
{
//========================================================================
// Store port
//========================================================================

    enum class store_error_kind
    {
        not_found,
        read_failure,
        parse_failure,   // the document loaded, with recoverable format errors
        write_failure,
    };

    inline std::string_view to_string(store_error_kind kind)
    {
        switch (kind)
        {
            case store_error_kind::not_found:     return "not found";
            case store_error_kind::read_failure:  return "read failure";
            case store_error_kind::parse_failure: return "parse failure";
            case store_error_kind::write_failure: return "write failure";
        }
        return "unknown";
    }

    using store_error  = error<store_error_kind>;
    using load_context = context<document, store_error>;

    inline bool is_fatal(store_error const & e)
    {
        return e.kind != store_error_kind::parse_failure;
    }

    class document_store
    {
    public:
        virtual ~document_store() = default;

        virtual load_context load(std::string_view path) = 0;

        // Empty on success. A failed save must leave any existing file intact.
        virtual std::optional<store_error> save(document const & doc, std::string_view path) = 0;
    };

    namespace detail
    {
        inline load_context load_from_text(std::string_view text)
        {
            auto parsed = parse(text);

            load_context out;
            out.result = std::move(parsed.result);
            for (auto & e : parsed.errors)
                out.errors.push_back({ store_error_kind::parse_failure, std::move(e.message) });
            return out;
        }
    }

//========================================================================
// File store
//========================================================================

    class file_document_store : public document_store
    {
    public:
        load_context load(std::string_view path) override
        {
            std::filesystem::path p{ std::string(path) };

            std::error_code ec;
            if (!std::filesystem::exists(p, ec))
                return { {}, { { store_error_kind::not_found, "no such document: " + p.string() } } };

            std::ifstream in(p, std::ios::binary);
            if (!in)
                return { {}, { { store_error_kind::read_failure, "cannot open " + p.string() } } };

            std::ostringstream ss;
            ss << in.rdbuf();
            if (in.bad())
                return { {}, { { store_error_kind::read_failure, "error reading " + p.string() } } };

            spdlog::debug("loaded {} bytes from {}", ss.str().size(), p.string());
            return detail::load_from_text(ss.str());
        }

        // Writes next to the destination and renames over it, so readers see
        // either the old file or the complete new one.
        std::optional<store_error> save(document const & doc, std::string_view path) override
        {
            std::filesystem::path target{ std::string(path) };
            std::filesystem::path temp = target;
            temp += ".redline-tmp";

            {
                std::ofstream out(temp, std::ios::binary | std::ios::trunc);
                if (!out)
                    return store_error{ store_error_kind::write_failure, "cannot create " + temp.string() };

                out << serialize(doc);
                out.flush();
                if (!out)
                {
                    out.close();
                    discard(temp);
                    return store_error{ store_error_kind::write_failure, "error writing " + temp.string() };
                }
            }

            std::error_code ec;
            std::filesystem::rename(temp, target, ec);
            if (ec)
            {
                discard(temp);
                return store_error{ store_error_kind::write_failure, "cannot replace " + target.string() + ": " + ec.message() };
            }

            spdlog::debug("saved {}", target.string());
            return std::nullopt;
        }

    private:
        static void discard(std::filesystem::path const & temp)
        {
            std::error_code ec;
            if (!std::filesystem::remove(temp, ec) && ec)
                spdlog::warn("could not remove temporary file {}: {}", temp.string(), ec.message());
        }
    };

//========================================================================
// Memory store
//========================================================================

    // Keeps serialized documents by path. Saves can be made to fail.
    class memory_document_store : public document_store
    {
    public:
        void put(std::string path, std::string text)
        {
            files_[std::move(path)] = std::move(text);
        }

        std::optional<std::string> get(std::string const & path) const
        {
            auto it = files_.find(path);
            if (it == files_.end())
                return std::nullopt;
            return it->second;
        }

        void fail_saves(bool fail) noexcept { fail_saves_ = fail; }
        size_t save_count() const noexcept { return save_count_; }

        load_context load(std::string_view path) override
        {
            auto it = files_.find(std::string(path));
            if (it == files_.end())
                return { {}, { { store_error_kind::not_found, "no such document: " + std::string(path) } } };

            return detail::load_from_text(it->second);
        }

        std::optional<store_error> save(document const & doc, std::string_view path) override
        {
            if (fail_saves_)
                return store_error{ store_error_kind::write_failure, "store is read-only: " + std::string(path) };

            files_[std::string(path)] = serialize(doc);
            ++save_count_;
            return std::nullopt;
        }

    private:
        std::map<std::string, std::string> files_;
        bool   fail_saves_ = false;
        size_t save_count_ = 0;
    };

} // namespace redline

#endif // REDLINE_STORE_HPP
