#include "redline_test_harness.hpp"
#include "redline_document_tests.hpp"
#include "redline_parser_tests.hpp"
#include "redline_operation_tests.hpp"
#include "redline_locator_tests.hpp"
#include "redline_table_tests.hpp"
#include "redline_executor_tests.hpp"
#include "redline_session_tests.hpp"

#include <algorithm>
#include <iostream>

#include <spdlog/spdlog.h>

namespace redline::tests
{
    std::vector<test_result> results;
    char const * last_error = "";
}

bool first = true;

void run_tests( std::string suite_name, void(*pf_tests)() )
{
    if (!first)
        std::cout << '\n';
    else first = false;

    std::cout << suite_name << '\n';
    std::cout << std::string(suite_name.length(), '=') << '\n';

    try
    {
        pf_tests();
    }
    catch (std::exception const & e)
    {
        std::cout << "[FAIL] " << suite_name << " aborted: " << e.what() << '\n';
        redline::tests::results.push_back({ suite_name, false });
    }
}

int main()
{
    using namespace redline::tests;

    // Failure paths log warnings
    spdlog::set_level(spdlog::level::off);

    #ifdef REDLINE_TESTS_DOCUMENT__
        run_tests("Document model", run_document_tests);
    #endif

    #ifdef REDLINE_TESTS_PARSER__
        run_tests("Parser and serializer", run_parser_tests);
    #endif

    #ifdef REDLINE_TESTS_OPERATION__
        run_tests("Operations", run_operation_tests);
    #endif

    #ifdef REDLINE_TESTS_LOCATOR__
        run_tests("Locator", run_locator_tests);
    #endif

    #ifdef REDLINE_TESTS_TABLE__
        run_tests("Table analyzer", run_table_tests);
    #endif

    #ifdef REDLINE_TESTS_EXECUTOR__
        run_tests("Executor", run_executor_tests);
    #endif

    #ifdef REDLINE_TESTS_SESSION__
        run_tests("Session", run_session_tests);
    #endif

    size_t failed = static_cast<size_t>(std::count_if(results.begin(), results.end(), [](auto const & r) { return !r.passed; }));
    std::cout << '\n' << results.size() - failed << " of " << results.size() << " tests passed\n";

    return failed == 0 ? 0 : 1;
}
