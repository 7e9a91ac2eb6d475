// redline_example.cpp - Redline Document Patch Engine - Example driver
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.
//
// Without arguments the built-in regulation and operation list are patched in
// memory. With arguments:
//
//   redline_example <document> <operations> <output> [options]

#include "include/redline.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

#include <spdlog/spdlog.h>

// Example regulation with a glossary table, numbered items and a section
const char* example_document = R"(
@para Title
~b|Положение о кредитном комитете
@para Heading 1
~|1. Термины и сокращения
@table Table Grid
@row
@cell
@para
~b|Сокращение
@cell
@para
~b|Расшифровка
@row
@cell
@para
~|ДРМ
@cell
@para
~|Департамент рыночных рисков
@row
@cell
@para
~|КК
@cell
@para
~|Кредитный комитет
@end
@para Heading 1
~|2. Общие положения
@para
~|2.1 Комитет действует на основании решения Правления.
@para
~|2.2 Отчёты комитета направляются в ДРМ ежеквартально.
@para
~|Текущая версия API |
~i|v1.2
~| используется для обмена данными.
@para Heading 1
~|3. Порядок работы
@para
~|3.1 Заседания проводятся не реже одного раза в месяц.
)";

const char* example_operations = R"(
op CHG-001 replace_text
    description = Заменить ДРМ на ДКР по всему тексту
    target = ДРМ
    replacement = ДКР
/op

op CHG-002 replace_text
    description = Обновить версию API в описании обмена данными
    target = версия API v1.2
    replacement = версия API v2.0
/op

op CHG-003 replace_text
    description = В таблице сокращений заменить ДРМ его новой расшифровкой
    target = ДРМ
    replacement = ДКР Департамент кредитных рисков
/op

op CHG-004 insert_paragraph
    description = Добавить пункт о кворуме после пункта 3.1
    anchor = Заседания проводятся не реже
    text = 3.2 Заседание правомочно при участии большинства членов комитета.
/op

op CHG-005 add_comment
    description = Отметить таблицу сокращений для проверки
    anchor = Кредитный комитет
    note = Сверить перечень сокращений с приказом.
/op
)";

void print_separator(const std::string& title)
{
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(70, '=') << "\n\n";
}

bool read_file(const std::string& path, std::string& out)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return false;

    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return !in.bad();
}

redline::ops_context read_operation_list(std::string_view text)
{
    auto ops = redline::read_operations(text);
    for (auto const & e : ops.errors)
        spdlog::warn("operation list: {}", e.message);
    return ops;
}

int run_demo()
{
    using namespace redline;

    memory_document_store store;
    store.put("regulation.rdl", example_document);

    print_separator("SOURCE");
    std::cout << load(example_document).result.text() << "\n";

    auto ops = read_operation_list(example_operations);

    patch_session session(store);
    auto ctx = session.run("regulation.rdl", ops.result, "regulation.patched.rdl");

    print_separator("REPORT");
    std::cout << format_report(ctx.result);

    for (auto const & e : ctx.errors)
        std::cout << "✗ " << to_string(e.kind) << ": " << e.message << "\n";

    if (auto saved = store.get("regulation.patched.rdl"))
    {
        print_separator("PATCHED");
        std::cout << load(*saved).result.text() << "\n";

        print_separator("PATCHED (SERIALIZED)");
        std::cout << *saved;
    }

    return ctx.has_errors() ? 1 : 0;
}

int run_files(const std::string& doc_path, const std::string& ops_path, const std::string& out_path, const std::string* options_path)
{
    using namespace redline;

    patch_options options;
    if (options_path)
    {
        std::string text;
        if (!read_file(*options_path, text))
        {
            spdlog::error("cannot read options file {}", *options_path);
            return 2;
        }

        auto loaded = load_options(text);
        for (auto const & e : loaded.errors)
            spdlog::warn("{}: {}", *options_path, e.message);
        options = loaded.result;
    }

    std::string ops_text;
    if (!read_file(ops_path, ops_text))
    {
        spdlog::error("cannot read operation list {}", ops_path);
        return 2;
    }

    auto ops = read_operation_list(ops_text);

    file_document_store store;
    patch_session session(store, options);
    auto ctx = session.run(doc_path, ops.result, out_path);

    std::cout << format_report(ctx.result);
    for (auto const & e : ctx.errors)
        std::cout << "✗ " << to_string(e.kind) << ": " << e.message << "\n";

    return ctx.has_errors() ? 1 : 0;
}

int main(int argc, char** argv)
{
    spdlog::set_level(spdlog::level::info);

    if (argc == 1)
        return run_demo();

    if (argc < 4 || argc > 5)
    {
        std::cerr << "usage: " << argv[0] << " <document> <operations> <output> [options]\n";
        return 2;
    }

    std::string options_path = argc == 5 ? argv[4] : "";
    return run_files(argv[1], argv[2], argv[3], argc == 5 ? &options_path : nullptr);
}
