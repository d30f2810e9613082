// Test runner: runs all unit test suites and reports results.

#include <iostream>
#include <vector>
#include <string>
#include <functional>
#include <chrono>

// Forward declarations of test functions from other test files.
namespace test_step_validator { bool run_all_tests(); }
namespace test_chain_tracker { bool run_all_tests(); }
namespace test_guidance { bool run_all_tests(); }
namespace test_reasoning_engine { bool run_all_tests(); }
namespace test_stdout_guard { bool run_all_tests(); }
namespace test_mcp_stdio { bool run_all_tests(); }
namespace test_mcp_dispatch { bool run_all_tests(); }
namespace test_config { bool run_all_tests(); }
namespace test_utf8_sanitize { bool run_all_tests(); }
namespace test_debug_log { bool run_all_tests(); }
namespace test_shutdown_signal { bool run_all_tests(); }

struct TestSuite {
    std::string name;
    std::function<bool()> runner;
};

int main() {
    std::vector<TestSuite> suites = {
        {"test_step_validator", test_step_validator::run_all_tests},
        {"test_chain_tracker", test_chain_tracker::run_all_tests},
        {"test_guidance", test_guidance::run_all_tests},
        {"test_reasoning_engine", test_reasoning_engine::run_all_tests},
        {"test_stdout_guard", test_stdout_guard::run_all_tests},
        {"test_mcp_stdio", test_mcp_stdio::run_all_tests},
        {"test_mcp_dispatch", test_mcp_dispatch::run_all_tests},
        {"test_config", test_config::run_all_tests},
        {"test_utf8_sanitize", test_utf8_sanitize::run_all_tests},
        {"test_debug_log", test_debug_log::run_all_tests},
        {"test_shutdown_signal", test_shutdown_signal::run_all_tests},
    };

    int passed_count = 0;
    int failed_count = 0;
    auto total_start_time = std::chrono::steady_clock::now();

    std::cout << "=== CRMCPS Test Runner ===" << std::endl;
    std::cout << std::endl;

    for (const auto &suite : suites) {
        std::cout << "--- " << suite.name << " ---" << std::endl;
        auto suite_start_time = std::chrono::steady_clock::now();

        bool suite_passed = suite.runner();

        auto suite_elapsed = std::chrono::steady_clock::now() - suite_start_time;
        long suite_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(suite_elapsed).count();

        if (suite_passed) {
            std::cout << "  PASSED (" << suite_milliseconds << " ms)" << std::endl;
            passed_count++;
        } else {
            std::cout << "  FAILED (" << suite_milliseconds << " ms)" << std::endl;
            failed_count++;
        }
        std::cout << std::endl;
    }

    auto total_elapsed = std::chrono::steady_clock::now() - total_start_time;
    long total_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(total_elapsed).count();

    std::cout << "=== Results ===" << std::endl;
    std::cout << "  Passed: " << passed_count << std::endl;
    std::cout << "  Failed: " << failed_count << std::endl;
    std::cout << "  Total time: " << total_milliseconds << " ms" << std::endl;

    return (failed_count == 0) ? 0 : 1;
}
