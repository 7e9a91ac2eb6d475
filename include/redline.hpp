// redline.hpp - Redline Document Patch Engine
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

//========================================================================
// Redline Core Principles:
//========================================================================
//
// The Untouched-Is-Identical Principle
// ------------------------------------
// A patch changes what its operations name and nothing else.
// Every block no operation touched leaves the session byte-identical.
//
//
// The Local-Failure Principle
// ---------------------------
// One operation failing is a line in the report, not an abort.
// Later operations run against the document as it stands.
// Only loading and the single final save can fail a session.
//
//
// The Re-Resolution Principle
// ---------------------------
// Positions go stale after every structural edit.
// Paragraphs and tables are held by handle and resolved when used.
//
//
// The Algorithm-First Principle
// -----------------------------
// External judgement may refine an answer but never supply the only one.
// The deterministic result is always computed first and kept as fallback.
//
//========================================================================


#ifndef REDLINE_DOCUMENT_PATCH_ENGINE
#define REDLINE_DOCUMENT_PATCH_ENGINE

#include "redline_core.hpp"
#include "redline_parser.hpp"
#include "redline_serializer.hpp"
#include "redline_ops_reader.hpp"
#include "redline_session.hpp"

namespace redline
{
//========================================================================
// Document loading
//========================================================================

    // Document text into a document. Format errors are kept as messages;
    // the document holds everything that could be read.
    inline load_context load(std::string_view text)
    {
        return detail::load_from_text(text);
    }
}

#endif
