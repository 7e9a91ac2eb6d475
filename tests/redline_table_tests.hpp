#ifndef REDLINE_TESTS_TABLE__
#define REDLINE_TESTS_TABLE__

#include "redline_test_harness.hpp"
#include "redline_test_doubles.hpp"
#include "../include/redline_table.hpp"

namespace redline::tests
{
using namespace redline;

//============================================================================
// Column roles
//============================================================================

inline bool infer_abbreviation_table_roles()
{
    patch_options opts;
    table_analyzer ta(opts);

    table_rows rows = {
        { "ДРМ", "Департамент рыночных рисков" },
        { "КК",  "Кредитный комитет" },
    };

    auto roles = ta.infer_roles(rows);
    EXPECT(roles.size() == 2, "One role per column");
    EXPECT(roles[0] == column_role::key, "Short upper-case tokens are keys");
    EXPECT(roles[1] == column_role::description, "Multi-word text is a description");

    table_rows numbered = {
        { "1", "ДРМ", "Департамент рыночных рисков" },
        { "2", "КК",  "Кредитный комитет" },
    };

    auto nroles = ta.infer_roles(numbered);
    EXPECT(nroles.size() == 3 && nroles[0] == column_role::number, "Item numbers make a number column");
    EXPECT(nroles[1] == column_role::key && nroles[2] == column_role::description, "The other columns keep their roles");

    return true;
}

inline bool header_row_names_columns()
{
    auto named = table_analyzer::header_roles({ "№ п/п", "Сокращение", "Расшифровка" });
    EXPECT(named.has_value() && named->size() == 3, "The row reads as a header");
    EXPECT((*named)[0] == column_role::number, "№ п/п is a number column");
    EXPECT((*named)[1] == column_role::key, "Сокращение is a key column");
    EXPECT((*named)[2] == column_role::description, "Расшифровка is a description column");

    EXPECT(!table_analyzer::header_roles({ "ДРМ", "Департамент рыночных рисков" }), "Data rows are not headers");
    EXPECT(!table_analyzer::header_roles({ "Номер договора", "Наименование контрагента" }), "Header words inside data do not make a header");

    patch_options opts;
    table_analyzer ta(opts);

    // The header decides even though the data would vote otherwise
    auto roles = ta.infer_roles(table_rows{ { "Наименование", "Примечание" }, { "Лимит", "ДКР" } });
    EXPECT(roles[0] == column_role::description, "A named column follows its header");
    EXPECT(roles[1] == column_role::key, "Unnamed columns are voted on the data rows");

    return true;
}

inline bool majority_vote_decides()
{
    patch_options opts;
    table_analyzer ta(opts);

    table_rows rows = {
        { "Лимит пересматривается ежемесячно" },
        { "Отчёт готовит ДКР" },
        { "ДРМ" },
    };

    auto roles = ta.infer_roles(rows);
    EXPECT(roles.size() == 1 && roles[0] == column_role::description, "Two description votes outweigh one key vote");

    EXPECT(ta.infer_roles(table_rows{ { "", "" } }) == (std::vector<column_role>{ column_role::key, column_role::description }), "Empty cells fall back by position");

    return true;
}

inline bool infer_roles_from_document()
{
    auto doc = doc_from(
        "@table\n"
        "@row\n@cell\n@para\n~|ДРМ\n@cell\n@para\n~|Департамент рыночных рисков\n"
        "@row\n@cell\n@para\n~|КК\n@cell\n@para\n~|Кредитный комитет\n@cell\n@para\n~|с 2024 года\n"
        "@end\n");

    patch_options opts;
    table_analyzer ta(opts);

    auto roles = ta.infer_roles(doc, doc.table_at(0)->id());
    EXPECT(roles.size() == 3, "Roles cover the widest row");
    EXPECT(roles[0] == column_role::key && roles[1] == column_role::description, "Roles come from the cells");
    EXPECT(ta.infer_roles(doc, table_id{}).empty(), "A missing table has no roles");

    return true;
}

//============================================================================
// Distribution
//============================================================================

inline bool distribute_key_and_description()
{
    patch_options opts;
    table_analyzer ta(opts);

    std::vector<column_role> roles = { column_role::key, column_role::description };

    auto m = ta.distribute("ДКР Департамент контроля рисков", roles);
    EXPECT(m.size() == 2, "Both columns get text");
    EXPECT(m[0] == "ДКР", "The first word is the key");
    EXPECT(m[1] == "Департамент контроля рисков", "The rest is the description");

    auto single = ta.distribute("ДКР", roles);
    EXPECT(single.size() == 1 && single[0] == "ДКР", "A single word only touches the key");

    return true;
}

inline bool distribute_skips_number_columns()
{
    patch_options opts;
    table_analyzer ta(opts);

    auto m = ta.distribute("ДКР Департамент контроля рисков",
        { column_role::number, column_role::key, column_role::description });

    EXPECT(!m.contains(0), "The number column never appears");
    EXPECT(m[1] == "ДКР" && m[2] == "Департамент контроля рисков", "The text goes to the other columns");

    auto only = ta.distribute("новый текст пункта", { column_role::number, column_role::description });
    EXPECT(only.size() == 1 && only[1] == "новый текст пункта", "One target takes everything");

    EXPECT(ta.distribute("x", { column_role::number }).empty(), "Nothing to write when every column is numbered");

    return true;
}

inline bool distribute_evenly_with_remainder_last()
{
    patch_options opts;
    table_analyzer ta(opts);

    std::vector<column_role> roles(3, column_role::description);

    auto m = ta.distribute("a b c d e f g", roles);
    EXPECT(m.size() == 3, "Three columns");
    EXPECT(m[0] == "a b", "Two words to the first");
    EXPECT(m[1] == "c d", "Two words to the second");
    EXPECT(m[2] == "e f g", "The last column takes the remainder");

    auto short_text = ta.distribute("a b", roles);
    EXPECT(short_text[0] == "a" && short_text[1] == "b" && short_text[2].empty(), "Columns past the words are cleared");

    auto blank = ta.distribute("   ", roles);
    EXPECT(blank.size() == 3 && blank[0].empty() && blank[2].empty(), "Blank text clears every target");

    return true;
}

//============================================================================
// Review and apply
//============================================================================

inline bool review_replaces_confident_mapping()
{
    patch_options opts;
    scripted_assist assist;
    table_analyzer ta(opts, &assist);

    std::vector<std::string> row = { "ДРМ", "Департамент рыночных рисков" };
    column_mapping proposed = { { 0, "ДКР" }, { 1, "Департамент" } };

    assist.review = reviewed_mapping{ { { 1, "Департамент контроля рисков" } }, 0.9 };
    auto m = ta.review(row, proposed);
    EXPECT(assist.calls == 1, "The assist was asked");
    EXPECT(m.size() == 1 && m[1] == "Департамент контроля рисков", "A confident review replaces the mapping");

    assist.review = reviewed_mapping{ { { 1, "иное" } }, 0.5 };
    EXPECT(ta.review(row, proposed) == proposed, "A review below the threshold is ignored");

    assist.review = reviewed_mapping{ { { 5, "иное" } }, 0.95 };
    EXPECT(ta.review(row, proposed) == proposed, "A review naming a missing column is ignored");

    assist.review = std::nullopt;
    EXPECT(ta.review(row, proposed) == proposed, "No answer keeps the mapping");

    return true;
}

inline bool review_survives_assist_failure()
{
    patch_options opts;
    std::vector<std::string> row = { "ДРМ", "Департамент рыночных рисков" };
    column_mapping proposed = { { 0, "ДКР" } };

    scripted_assist broken;
    broken.fail = true;
    EXPECT(table_analyzer(opts, &broken).review(row, proposed) == proposed, "A throwing assist keeps the mapping");

    EXPECT(table_analyzer(opts).review(row, proposed) == proposed, "Without an assist the mapping stands");

    return true;
}

inline bool apply_writes_mapped_cells()
{
    auto doc = doc_from(
        "@table\n"
        "@row\n@cell\n@para\n~|ДРМ\n@cell\n@para\n~|Департамент рыночных рисков\n"
        "@end\n");

    patch_options opts;
    table_analyzer ta(opts);
    auto tid = doc.table_at(0)->id();

    EXPECT(ta.apply(doc, tid, 0, { { 0, "ДКР" }, { 1, "Департамент контроля рисков" } }), "Both cells are written");
    EXPECT(doc.table(tid)->row_texts(0) == (std::vector<std::string>{ "ДКР", "Департамент контроля рисков" }), "The row holds the new text");

    EXPECT(!ta.apply(doc, tid, 0, { { 0, "X" }, { 4, "Y" } }), "A missing column fails the write");
    EXPECT(doc.table(tid)->cell_text(0, 0) == "X", "Existing columns are still written");

    return true;
}

//============================================================================
// Test Runner
//============================================================================

inline void run_table_tests()
{
    SUBCAT("Column roles");
    RUN_TEST(infer_abbreviation_table_roles);
    RUN_TEST(header_row_names_columns);
    RUN_TEST(majority_vote_decides);
    RUN_TEST(infer_roles_from_document);

    SUBCAT("Distribution");
    RUN_TEST(distribute_key_and_description);
    RUN_TEST(distribute_skips_number_columns);
    RUN_TEST(distribute_evenly_with_remainder_last);

    SUBCAT("Review");
    RUN_TEST(review_replaces_confident_mapping);
    RUN_TEST(review_survives_assist_failure);
    RUN_TEST(apply_writes_mapped_cells);
}

}

#endif
