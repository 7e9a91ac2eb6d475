#ifndef REDLINE_TESTS_PARSER__
#define REDLINE_TESTS_PARSER__

#include "redline_test_harness.hpp"
#include "../include/redline_parser.hpp"
#include "../include/redline_serializer.hpp"

namespace redline::tests
{
using namespace redline;

inline bool parse_paragraphs_runs_and_comments()
{
    constexpr std::string_view src =
        "// regulation excerpt\n"
        "@para Heading 1\n"
        "~b|1. Общие положения\n"
        "@para\n"
        "~|Текущая версия \n"
        "~i,u,color=FF0000,size=10.5,font=Times New Roman|API v1.2\n"
        "!Иванов|Проверить номер версии\n";

    auto ctx = parse(src);
    EXPECT(!ctx.has_errors(), "Clean source should parse without errors");

    auto & doc = ctx.result;
    EXPECT(doc.block_count() == 2, "Two paragraphs expected");

    auto h = doc.paragraph_at(0);
    EXPECT(h && h->style() == "Heading 1", "First block keeps its style");
    EXPECT(h->runs().size() == 1 && h->runs()[0].format.bold, "Heading run is bold");

    auto p = doc.paragraph_at(1);
    EXPECT(p->style() == "Normal", "A bare @para is Normal");
    EXPECT(p->text() == "Текущая версия API v1.2", "Runs concatenate, trailing spaces included");

    auto const & f = p->runs()[1].format;
    EXPECT(f.italic && f.underline && !f.bold, "Flags are read");
    EXPECT(f.color == "FF0000", "Colour is read");
    EXPECT(f.size == 10.5, "Size is read");
    EXPECT(f.font == "Times New Roman", "Font keeps inner spaces");

    EXPECT(p->comments().size() == 1, "One comment expected");
    EXPECT(p->comments()[0].author == "Иванов", "Comment author is read");
    EXPECT(p->comments()[0].text == "Проверить номер версии", "Comment text is read");

    return true;
}

inline bool parse_tables()
{
    constexpr std::string_view src =
        "@table Table Grid\n"
        "@row\n"
        "@cell\n"
        "@para\n"
        "~|ДРМ\n"
        "@cell\n"
        "@para\n"
        "~|Департамент\n"
        "@para\n"
        "~|рыночных рисков\n"
        "@row\n"
        "@cell\n"
        "@cell\n"
        "@para\n"
        "~|пусто слева\n"
        "@end\n"
        "@para\n"
        "~|после таблицы\n";

    auto ctx = parse(src);
    EXPECT(!ctx.has_errors(), "Table source should parse without errors");

    auto t = ctx.result.table_at(0);
    EXPECT(t.has_value(), "First block is a table");
    EXPECT(t->style() == "Table Grid", "Table style is read");
    EXPECT(t->row_count() == 2, "Two rows expected");
    EXPECT(t->cell_text(0, 1) == "Департамент\nрыночных рисков", "Cell paragraphs join with newlines");
    EXPECT(t->cell_paragraphs(1, 0).size() == 1, "An empty cell still owns one paragraph");
    EXPECT(ctx.result.paragraph_at(1)->text() == "после таблицы", "The body continues after @end");

    return true;
}

inline bool escapes_in_run_text()
{
    auto ctx = parse("@para\n~|a\\nb \\\\ c\n");
    EXPECT(!ctx.has_errors(), "Escapes are valid");
    EXPECT(ctx.result.paragraph_at(0)->text() == "a\nb \\ c", "Escapes are decoded");
    return true;
}

inline bool errors_carry_line_numbers()
{
    constexpr std::string_view src =
        "~|orphan\n"
        "@para\n"
        "~x|bad attribute\n"
        "~color=red|bad colour\n"
        "~no separator\n"
        "@row\n"
        "@end\n"
        "@bogus\n"
        "plain text\n"
        "~|kept\n";

    auto ctx = parse(src);
    auto const & e = ctx.errors;

    EXPECT(e.size() == 8, "Every bad line is reported");
    EXPECT(e[0].kind == parse_error_kind::run_outside_paragraph, "A run before any paragraph");
    EXPECT(e[0].message.rfind("line 1: ", 0) == 0, "Messages start with the line number");
    EXPECT(e[1].kind == parse_error_kind::invalid_attribute && e[1].message.rfind("line 3: ", 0) == 0, "Unknown flag on line 3");
    EXPECT(e[2].kind == parse_error_kind::invalid_attribute, "Colour must be hex");
    EXPECT(e[3].kind == parse_error_kind::malformed_run, "A run needs '|'");
    EXPECT(e[4].kind == parse_error_kind::row_outside_table, "@row without a table");
    EXPECT(e[5].kind == parse_error_kind::unmatched_end, "@end without a table");
    EXPECT(e[6].kind == parse_error_kind::unknown_directive, "Unknown directive");
    EXPECT(e[7].kind == parse_error_kind::unknown_directive, "Bare text is not a directive");
    EXPECT(ctx.result.paragraph_at(0)->text() == "kept", "Good lines after errors still apply");

    return true;
}

inline bool unterminated_table_is_closed()
{
    auto ctx = parse("@table\n@row\n@cell\n");

    EXPECT(ctx.errors.size() == 1, "One error expected");
    EXPECT(ctx.errors[0].kind == parse_error_kind::unterminated_table, "The open table is reported");

    auto t = ctx.result.table_at(0);
    EXPECT(t && t->row_count() == 1, "The table is still built");
    EXPECT(t->cell_paragraphs(0, 0).size() == 1, "The open cell got its paragraph");

    return true;
}

inline bool table_structure_errors()
{
    auto ctx = parse("@table\n@row\n@para\n@cell\n@table\n@end\n");

    EXPECT(ctx.errors.size() == 2, "Two errors expected");
    EXPECT(ctx.errors[0].kind == parse_error_kind::paragraph_outside_cell, "@para needs a cell inside tables");
    EXPECT(ctx.errors[1].kind == parse_error_kind::nested_table, "Tables cannot nest");
    EXPECT(ctx.result.block_count() == 2, "The nested table becomes a sibling");

    return true;
}

//============================================================================
// Serializer
//============================================================================

inline bool serialize_round_trip()
{
    constexpr std::string_view src =
        "@para Heading 1\n"
        "~b|1. Общие положения\n"
        "@para\n"
        "~|Текущая версия \n"
        "~i,u,color=FF0000,size=10.5,font=Arial|API v1.2\n"
        "!Иванов|Проверить\\nверсию\n"
        "@table Table Grid\n"
        "@row\n"
        "@cell\n"
        "@para\n"
        "~|ДРМ\n"
        "@cell\n"
        "@para\n"
        "@end\n"
        "@para TOC 1\n"
        "~|1. Общие положения\\\\\n";

    auto ctx = parse(src);
    EXPECT(!ctx.has_errors(), "Source should parse");
    EXPECT(serialize(ctx.result) == src, "Canonical text serializes back unchanged");

    auto again = parse(serialize(ctx.result));
    EXPECT(serialize(again.result) == src, "A second pass is stable");

    return true;
}

inline bool serialize_single_block()
{
    auto ctx = parse("@para\n~|a\n@table\n@row\n@cell\n@para\n~|b\n@end\n");
    EXPECT(!ctx.has_errors(), "Source should parse");

    EXPECT(serialize_block(ctx.result, 0) == "@para\n~|a\n", "Paragraph block");
    EXPECT(serialize_block(ctx.result, 1) == "@table\n@row\n@cell\n@para\n~|b\n@end\n", "Table block");
    EXPECT(serialize_block(ctx.result, 2).empty(), "Past the end is empty");

    return true;
}

//============================================================================
// Test Runner
//============================================================================

inline void run_parser_tests()
{
    SUBCAT("Parsing");
    RUN_TEST(parse_paragraphs_runs_and_comments);
    RUN_TEST(parse_tables);
    RUN_TEST(escapes_in_run_text);

    SUBCAT("Errors");
    RUN_TEST(errors_carry_line_numbers);
    RUN_TEST(unterminated_table_is_closed);
    RUN_TEST(table_structure_errors);

    SUBCAT("Serialization");
    RUN_TEST(serialize_round_trip);
    RUN_TEST(serialize_single_block);
}

}

#endif
