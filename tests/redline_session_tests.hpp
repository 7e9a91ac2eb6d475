#ifndef REDLINE_TESTS_SESSION__
#define REDLINE_TESTS_SESSION__

#include "redline_test_harness.hpp"
#include "redline_test_doubles.hpp"
#include "../include/redline_session.hpp"

#include <filesystem>
#include <fstream>

namespace redline::tests
{
using namespace redline;

inline raw_operation raw_op(std::string id, std::string kind, std::vector<std::pair<std::string, std::string>> const & fields)
{
    raw_operation r;
    r.id   = std::move(id);
    r.kind = std::move(kind);
    for (auto const & [key, value] : fields)
        r.set(key, value);
    return r;
}

constexpr std::string_view regulation_doc =
    "@para Heading 1\n~|1. Общие положения\n"
    "@para\n~|Отчёт о рисках готовит ДРМ ежеквартально.\n"
    "@para\n~|Текущая версия API v1.2.\n"
    "@para\n~|Прочие условия.\n"
    "@table Table Grid\n"
    "@row\n@cell\n@para\n~|Сокращение\n@cell\n@para\n~|Расшифровка\n"
    "@row\n@cell\n@para\n~|ДРМ\n@cell\n@para\n~|Департамент рыночных рисков\n"
    "@end\n"
    "@para\n~|ДРМ согласует лимиты.\n";

inline std::vector<raw_operation> regulation_ops()
{
    return {
        raw_op("CHG-001", "replace_text", {
            { "description", "Заменить ДРМ на ДКР по всему тексту" },
            { "target", "ДРМ" }, { "replacement", "ДКР" }, { "scope", "global" } }),
        raw_op("CHG-002", "replace_text", {
            { "description", "Изменить периодичность отчёта" },
            { "target", "готовит ДРМ ежеквартально" }, { "replacement", "готовит ДРМ ежемесячно" } }),
        raw_op("CHG-003", "replace_text", {
            { "description", "Обновить версию API" },
            { "target", "v1.2" }, { "replacement", "v2.0" } }),
    };
}

inline patch_options without_notes()
{
    patch_options opts;
    opts.annotate = false;
    return opts;
}

// Raises the token from inside a run, as a caller on another thread would.
struct raising_sink : comment_sink
{
    cancel_token & token;

    explicit raising_sink(cancel_token & t) : token(t) {}

    bool insert(document &, size_t, std::string_view) override
    {
        token.raise();
        return true;
    }
};

//============================================================================
// Patching
//============================================================================

inline bool global_runs_after_dependent_locals()
{
    auto doc = doc_from(regulation_doc);

    memory_document_store store;
    patch_session session(store, without_notes());

    auto ctx = session.patch(doc, regulation_ops());
    EXPECT(!ctx.has_errors(), "No fatal errors");
    EXPECT(ctx.result.total() == 3 && ctx.result.applied() == 3, "All three apply");

    EXPECT(ctx.result.results[0].operation_id == "CHG-002", "The dependent local runs first");
    EXPECT(ctx.result.results[2].operation_id == "CHG-001", "The global runs last");
    EXPECT(ctx.result.results[2].occurrences == 3, "The global reaches every occurrence");

    EXPECT(count_of(doc.text(), "ДРМ") == 0, "No old abbreviation remains");
    EXPECT(doc.paragraph_at(1)->text() == "Отчёт о рисках готовит ДКР ежемесячно.", "Both edits landed on the same sentence");

    return true;
}

inline bool untouched_blocks_stay_identical()
{
    auto doc = doc_from(regulation_doc);
    auto heading = serialize_block(doc, 0);
    auto other   = serialize_block(doc, 3);

    memory_document_store store;
    patch_session session(store, without_notes());
    session.patch(doc, regulation_ops());

    EXPECT(doc.block_count() == 6, "No blocks were added or removed");
    EXPECT(serialize_block(doc, 0) == heading, "The heading is byte-identical");
    EXPECT(serialize_block(doc, 3) == other, "The unrelated paragraph is byte-identical");

    return true;
}

inline bool input_order_does_not_matter()
{
    auto ops = regulation_ops();
    auto reversed = std::vector<raw_operation>(ops.rbegin(), ops.rend());

    memory_document_store store;
    patch_session session(store, without_notes());

    auto a = doc_from(regulation_doc);
    auto b = doc_from(regulation_doc);
    session.patch(a, ops);
    session.patch(b, reversed);

    EXPECT(serialize(a) == serialize(b), "Both orders give the same document");

    return true;
}

inline bool malformed_operations_are_reported_first()
{
    auto doc = doc_from(regulation_doc);

    std::vector<raw_operation> ops = {
        raw_op("OK-1", "replace_text", { { "target", "v1.2" }, { "replacement", "v2.0" } }),
        raw_op("BAD-1", "replace_text", { { "replacement", "v2.0" } }),
        raw_op("BAD-2", "rename_document", { { "target", "x" } }),
    };

    memory_document_store store;
    patch_session session(store, without_notes());
    auto ctx = session.patch(doc, ops);

    EXPECT(!ctx.has_errors(), "Bad operations are not fatal");
    EXPECT(ctx.result.total() == 3, "Every operation has a result");
    EXPECT(ctx.result.results[0].operation_id == "BAD-1" && ctx.result.results[1].operation_id == "BAD-2", "Rejected operations lead the report");
    EXPECT(ctx.result.results[0].error->kind == patch_error_kind::malformed_operation, "A missing field is malformed");
    EXPECT(ctx.result.results[1].error->kind == patch_error_kind::unsupported_operation, "An unknown kind is unsupported");
    EXPECT(ctx.result.results[0].attempts == 0, "Rejected operations never run");
    EXPECT(ctx.result.results[2].applied(), "The good operation still applies");

    return true;
}

inline bool cancellation_between_operations()
{
    auto doc = doc_from(regulation_doc);
    auto before = serialize_block(doc, 2);

    cancel_token token;
    raising_sink sink(token);
    memory_document_store store;
    patch_session session(store, sink, without_notes());

    std::vector<raw_operation> ops = {
        raw_op("E1", "add_comment", { { "anchor", "Прочие условия" }, { "note", "Проверить" } }),
        raw_op("E2", "replace_text", { { "target", "v1.2" }, { "replacement", "v2.0" } }),
    };

    auto ctx = session.patch(doc, ops, &token);
    EXPECT(ctx.has_errors() && ctx.errors[0].kind == patch_error_kind::aborted, "The session reports ABORTED");
    EXPECT(ctx.errors[0].message == "cancelled before E2", "The message names the next operation");
    EXPECT(ctx.result.total() == 1 && ctx.result.results[0].applied(), "Only the first operation ran");
    EXPECT(serialize_block(doc, 2) == before, "The second operation never touched the document");

    return true;
}

//============================================================================
// Annotation
//============================================================================

inline bool attached_notes_carry_the_audit_trail()
{
    auto doc = doc_from(regulation_doc);

    memory_document_store store;
    patch_session session(store);

    std::vector<raw_operation> ops = {
        raw_op("CHG-003", "replace_text", {
            { "description", "Обновить версию API" }, { "target", "v1.2" }, { "replacement", "v2.0" } }),
        raw_op("CHG-004", "replace_text", {
            { "description", "Без отметки" }, { "target", "Прочие условия" }, { "replacement", "Иные условия" }, { "annotate", "false" } }),
    };

    auto ctx = session.patch(doc, ops);
    EXPECT(ctx.result.applied() == 2, "Both operations apply");

    auto p = doc.paragraph_at(2);
    EXPECT(p->comments().size() == 1, "The edited paragraph has one note");
    EXPECT(p->comments()[0].author == "redline", "The default author is used");
    EXPECT(p->comments()[0].text == "[CHG-003] REPLACE_TEXT\nОбновить версию API\nreplaced \"v1.2\"\nСтатус: SUCCESS", "The note names the change and its outcome");
    EXPECT(doc.paragraph_at(3)->comments().empty(), "Operations can opt out of notes");

    return true;
}

inline bool table_notes_go_after_the_table()
{
    auto doc = doc_from(
        "@para\n~|Глоссарий\n"
        "@table\n@row\n@cell\n@para\n~|ДРМ\n@cell\n@para\n~|Департамент рыночных рисков\n@end\n");

    memory_document_store store;
    patch_session session(store);

    auto ctx = session.patch(doc, { raw_op("T1", "replace_text", { { "target", "ДРМ" }, { "replacement", "ДКР" } }) });
    EXPECT(ctx.result.applied() == 1, "The cell is edited");
    EXPECT(doc.block_count() == 3, "A paragraph was added for the note");
    EXPECT(doc.paragraph_at(2)->comments().size() == 1, "The note sits after the table");
    EXPECT(doc.table_at(1)->cell_text(0, 0) == "ДКР", "The table holds the edit");

    return true;
}

inline bool inline_notes_are_visible_paragraphs()
{
    auto doc = doc_from(regulation_doc);

    patch_options opts;
    opts.annotation = annotation_style::inline_paragraph;

    memory_document_store store;
    patch_session session(store, opts);

    session.patch(doc, { raw_op("CHG-003", "replace_text", {
        { "description", "Обновить версию API" }, { "target", "v1.2" }, { "replacement", "v2.0" } }) });

    EXPECT(doc.block_count() == 7, "One note paragraph was added");

    auto note = doc.paragraph_at(3);
    EXPECT(note->text().rfind("[Комментарий: [CHG-003] REPLACE_TEXT", 0) == 0, "The note follows the edited paragraph");
    EXPECT(note->runs()[0].format.italic && note->runs()[0].format.color == "0000FF", "Notes are italic and blue");
    EXPECT(doc.paragraph_at(2)->comments().empty(), "No comment record is attached");

    return true;
}

inline bool notes_follow_blocks_that_moved()
{
    auto doc = doc_from(
        "@para\n~|Вводная часть.\n"
        "@para\n~|Устаревший абзац.\n"
        "@para\n~|Прочие условия.\n"
        "@para\n~|Срок хранения составляет 5 лет.\n");

    memory_document_store store;
    patch_session session(store);

    auto ctx = session.patch(doc, {
        raw_op("E1", "replace_text", { { "target", "5 лет" }, { "replacement", "7 лет" } }),
        raw_op("E2", "delete_paragraph", { { "target", "Устаревший абзац" } }),
    });

    EXPECT(ctx.result.applied() == 2, "Both apply");
    EXPECT(doc.block_count() == 3, "One paragraph is gone");

    auto moved = doc.paragraph_at(2);
    EXPECT(moved->text() == "Срок хранения составляет 7 лет.", "The edited paragraph moved up");
    EXPECT(moved->comments().size() == 1 && moved->comments()[0].text.rfind("[E1]", 0) == 0, "Its note followed it");
    EXPECT(doc.paragraph_at(0)->comments().size() == 1 && doc.paragraph_at(0)->comments()[0].text.rfind("[E2]", 0) == 0, "The deletion is noted on its neighbour");
    EXPECT(doc.paragraph_at(1)->comments().empty(), "Nothing else is noted");

    return true;
}

inline bool tracker_skips_what_it_cannot_note()
{
    auto doc = doc_from("@para\n~|a\n@para\n~|b\n@para\n~|c\n");

    auto result = [&](std::string id, bool applied, size_t block)
    {
        execution_result r;
        r.operation_id = std::move(id);
        r.kind         = "REPLACE_TEXT";
        r.status       = applied ? exec_status::applied : exec_status::failed;
        r.site         = doc.block(block);
        return r;
    };

    std::vector<execution_result> results = {
        result("R1", true, 0),
        result("R2", true, 1),
        result("R3", true, 2),
        result("R4", false, 1),
        result("R5", true, 0),
    };
    results[1].annotate = false;
    results[4].site.reset();

    editor ed(doc);
    EXPECT(ed.erase_block(2), "The third block is removed");

    attached_comment_sink sink;
    annotation_tracker tracker(sink);
    EXPECT(tracker.annotate(doc, results) == 1, "Only the first result is noted");
    EXPECT(doc.paragraph_at(0)->comments().size() == 1, "It went to its block");
    EXPECT(doc.paragraph_at(1)->comments().empty(), "Opted-out and failed results are skipped");

    throwing_sink broken;
    annotation_tracker failing(broken);
    EXPECT(failing.annotate(doc, results) == 0, "A failing sink writes nothing and does not throw");

    return true;
}

//============================================================================
// Runs against a store
//============================================================================

inline bool run_saves_once()
{
    memory_document_store store;
    store.put("regulation.rdl", std::string(regulation_doc));

    patch_session session(store, without_notes());
    auto ctx = session.run("regulation.rdl", regulation_ops(), "patched.rdl");

    EXPECT(!ctx.has_errors() && ctx.result.persisted, "The run persists");
    EXPECT(store.save_count() == 1, "Exactly one save");
    EXPECT(count_of(*store.get("patched.rdl"), "ДРМ") == 0, "The saved document is patched");
    EXPECT(*store.get("regulation.rdl") == regulation_doc, "The source is untouched");

    return true;
}

inline bool failures_alone_are_not_fatal()
{
    memory_document_store store;
    store.put("regulation.rdl", std::string(regulation_doc) + "@bogus\n");

    patch_session session(store, without_notes());
    auto ctx = session.run("regulation.rdl", {
        raw_op("F1", "replace_text", { { "target", "несуществующий текст" }, { "replacement", "x" } }),
        raw_op("F2", "delete_paragraph", { { "target", "9." } }),
    }, "patched.rdl");

    EXPECT(!ctx.has_errors(), "Failed operations and parse warnings are not fatal");
    EXPECT(ctx.result.failed() == 2 && ctx.result.persisted, "Both failed and the document was still saved");
    EXPECT(store.save_count() == 1, "One save");

    return true;
}

inline bool fatal_errors_write_nothing()
{
    {
        memory_document_store store;
        patch_session session(store, without_notes());
        auto ctx = session.run("missing.rdl", regulation_ops(), "patched.rdl");
        EXPECT(ctx.has_errors() && ctx.errors[0].kind == patch_error_kind::load_failure, "A missing source is LOAD_FAILURE");
        EXPECT(ctx.result.total() == 0 && store.save_count() == 0, "Nothing ran and nothing was saved");
    }
    {
        memory_document_store store;
        store.put("regulation.rdl", std::string(regulation_doc));
        store.fail_saves(true);

        patch_session session(store, without_notes());
        auto ctx = session.run("regulation.rdl", regulation_ops(), "patched.rdl");
        EXPECT(ctx.has_errors() && ctx.errors[0].kind == patch_error_kind::persistence_failure, "A failed save is PERSISTENCE_FAILURE");
        EXPECT(!ctx.result.persisted && !store.get("patched.rdl"), "No output exists");
        EXPECT(ctx.result.applied() == 3, "The results are still reported");
    }
    {
        memory_document_store store;
        store.put("regulation.rdl", std::string(regulation_doc));

        cancel_token token;
        token.raise();

        patch_session session(store, without_notes());
        auto ctx = session.run("regulation.rdl", regulation_ops(), "patched.rdl", &token);
        EXPECT(ctx.has_errors() && ctx.errors[0].kind == patch_error_kind::aborted, "A raised token is ABORTED");
        EXPECT(store.save_count() == 0 && !store.get("patched.rdl"), "Nothing was saved");
    }

    return true;
}

inline bool file_store_round_trip()
{
    namespace fs = std::filesystem;

    auto dir = fs::temp_directory_path();
    auto src = dir / "redline_session_source.rdl";
    auto dst = dir / "redline_session_patched.rdl";

    {
        std::ofstream out(src, std::ios::binary | std::ios::trunc);
        out << regulation_doc;
    }

    file_document_store store;
    patch_session session(store, without_notes());
    auto ctx = session.run(src.string(), regulation_ops(), dst.string());

    EXPECT(!ctx.has_errors() && ctx.result.persisted, "The file run persists");

    auto reloaded = store.load(dst.string());
    EXPECT(!reloaded.has_errors(), "The output parses cleanly");
    EXPECT(count_of(reloaded.result.text(), "ДРМ") == 0, "The output is patched");

    auto temp = dst;
    temp += ".redline-tmp";
    EXPECT(!fs::exists(temp), "No temporary file is left behind");

    auto missing = store.load((dir / "redline_no_such_file.rdl").string());
    EXPECT(missing.has_errors() && missing.errors[0].kind == store_error_kind::not_found, "A missing file is not found");

    std::error_code ec;
    fs::remove(src, ec);
    fs::remove(dst, ec);

    return true;
}

//============================================================================
// Report
//============================================================================

inline bool report_lists_every_result()
{
    execution_report report;

    execution_result ok;
    ok.operation_id = "CHG-001";
    ok.kind         = "REPLACE_TEXT";
    ok.status       = exec_status::applied;
    ok.strategy     = "exact";
    ok.attempts     = 1;
    ok.occurrences  = 2;
    ok.detail       = "replaced 2 occurrences of \"ДРМ\"";

    execution_result bad;
    bad.operation_id = "CHG-002";
    bad.kind         = "DELETE_PARAGRAPH";
    bad.attempts     = 4;
    bad.error        = patch_error{ patch_error_kind::target_not_found, "\"x\" not found (keyword_subset)" };
    bad.detail       = bad.error->message;

    report.results   = { ok, bad };
    report.persisted = true;

    EXPECT(format_report(report) ==
        "Patch report: 2 operation(s), 1 applied, 1 failed\n"
        "  [CHG-001] REPLACE_TEXT Applied (exact, 1 attempt(s), 2 change(s)): replaced 2 occurrences of \"ДРМ\"\n"
        "  [CHG-002] DELETE_PARAGRAPH Failed TARGET_NOT_FOUND after 4 attempt(s): \"x\" not found (keyword_subset)\n"
        "Persisted: yes\n",
        "The report lists counts, each result and persistence");

    return true;
}

//============================================================================
// Test Runner
//============================================================================

inline void run_session_tests()
{
    SUBCAT("Patching");
    RUN_TEST(global_runs_after_dependent_locals);
    RUN_TEST(untouched_blocks_stay_identical);
    RUN_TEST(input_order_does_not_matter);
    RUN_TEST(malformed_operations_are_reported_first);
    RUN_TEST(cancellation_between_operations);

    SUBCAT("Annotation");
    RUN_TEST(attached_notes_carry_the_audit_trail);
    RUN_TEST(table_notes_go_after_the_table);
    RUN_TEST(inline_notes_are_visible_paragraphs);
    RUN_TEST(notes_follow_blocks_that_moved);
    RUN_TEST(tracker_skips_what_it_cannot_note);

    SUBCAT("Store");
    RUN_TEST(run_saves_once);
    RUN_TEST(failures_alone_are_not_fatal);
    RUN_TEST(fatal_errors_write_nothing);
    RUN_TEST(file_store_round_trip);

    SUBCAT("Report");
    RUN_TEST(report_lists_every_result);
}

}

#endif
