/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file framework.hpp
 * @brief A lightweight, header-only unit testing micro-framework for TomlDB.
 *
 * @details
 * Minimal infrastructure for validating the document engine, the storage layer and
 * the JSON front-end: ANSI-colored terminal output, exception-protected execution
 * blocks and assertion macros (including exception expectations).
 */

#pragma once

#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace tomldb::test {

// ========================================================================
// Global Metrics
// ========================================================================

inline int passed_count = 0; ///< Cumulative successful test counter.
inline int failed_count = 0; ///< Cumulative failed test counter.

// ========================================================================
// Assertion Primitives
// ========================================================================

/**
 * @brief Validates that two values are equivalent.
 *
 * The operands may differ in type as long as they compare (e.g. `std::string` and a
 * literal).
 */
template <typename A, typename B>
void assert_eq(const A& val1, const B& val2, const char* file, int line, const char* expr)
{
    if (val1 != val2) {
        std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line
                  << " -> Assertion failed: " << expr << " (" << val1 << " != " << val2 << ")"
                  << std::endl;
        failed_count++;
        throw std::runtime_error("Assertion failed");
    }
}

/**
 * @brief Validates that two values are NOT equivalent.
 */
template <typename A, typename B>
void assert_ne(const A& val1, const B& val2, const char* file, int line, const char* expr)
{
    if (val1 == val2) {
        std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line
                  << " -> Assertion failed: " << expr << " (" << val1 << " == " << val2 << ")"
                  << std::endl;
        failed_count++;
        throw std::runtime_error("Assertion failed");
    }
}

/**
 * @brief Validates that a boolean expression evaluates to true.
 */
inline void assert_true(bool cond, const char* file, int line, const char* expr)
{
    if (!cond) {
        std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line
                  << " -> Assertion failed: " << expr << " is FALSE" << std::endl;
        failed_count++;
        throw std::runtime_error("Assertion failed");
    }
}

/**
 * @brief Validates that a boolean expression evaluates to false.
 */
inline void assert_true_false(bool cond, const char* file, int line, const char* expr)
{
    if (cond) {
        std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line
                  << " -> Assertion failed: " << expr << " is TRUE" << std::endl;
        failed_count++;
        throw std::runtime_error("Assertion failed");
    }
}

/**
 * @brief Validates that `func` throws an exception of type `E`.
 */
template <typename E>
void assert_throws(const std::function<void()>& func, const char* file, int line, const char* expr)
{
    try {
        func();
    } catch (const E&) {
        return;
    } catch (const std::exception& e) {
        std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line << " -> " << expr
                  << " threw an unexpected exception: " << e.what() << std::endl;
        failed_count++;
        throw std::runtime_error("Assertion failed");
    }
    std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line << " -> " << expr
              << " did not throw" << std::endl;
    failed_count++;
    throw std::runtime_error("Assertion failed");
}

// ========================================================================
// Execution Orchestrator
// ========================================================================

/**
 * @brief Executes a test case within a protected execution context.
 */
inline void run(std::string_view name, std::function<void()> func)
{
    std::cout << "[RUN  ] " << name << "... " << std::flush;
    try {
        func();
        // Clear line and print pass status
        std::cout << "\r\033[32m[PASS]\033[0m " << name << "          " << std::endl;
        passed_count++;
    } catch (const std::exception& e) {
        // Assertion failures are already counted; anything else escaped the test body.
        if (std::string_view(e.what()) != "Assertion failed") {
            std::cout << "\n\033[31m[FAIL]\033[0m Uncaught exception: " << e.what() << std::endl;
            failed_count++;
        }
        std::cout << "\r\033[31m[FAIL]\033[0m " << name << "          " << std::endl;
    }
}

/**
 * @brief Emits a summary report of the current test session.
 */
inline void print_summary()
{
    std::cout << "\n\033[36m=== TomlDB Test Summary ===\033[0m" << std::endl;
    std::cout << "Passed: " << passed_count << std::endl;
    if (failed_count > 0) {
        std::cout << "Failed: \033[31m" << failed_count << "\033[0m" << std::endl;
    } else {
        std::cout << "Failed: 0" << std::endl;
    }
    std::cout << "Total:  " << (passed_count + failed_count) << std::endl;
}

} // namespace tomldb::test

// ============================================================================
// API Macros
// ============================================================================

/**
 * @def ASSERT_EQ
 * @brief Macro for equality assertions. Includes file and line metadata.
 */
#define ASSERT_EQ(a, b) tomldb::test::assert_eq((a), (b), __FILE__, __LINE__, #a " == " #b)

/**
 * @def ASSERT_NE
 * @brief Macro for inequality assertions. Includes file and line metadata.
 */
#define ASSERT_NE(a, b) tomldb::test::assert_ne((a), (b), __FILE__, __LINE__, #a " != " #b)

/**
 * @def ASSERT_TRUE
 * @brief Macro for truthiness assertions.
 */
#define ASSERT_TRUE(a) tomldb::test::assert_true((a), __FILE__, __LINE__, #a)

/**
 * @def ASSERT_FALSE
 * @brief Macro for falsiness assertions.
 */
#define ASSERT_FALSE(a) tomldb::test::assert_true_false((a), __FILE__, __LINE__, #a)

/**
 * @def RUN_TEST
 * @brief Orchestrates the execution of a named test function.
 */
#define RUN_TEST(func_name) tomldb::test::run(#func_name, func_name)

/**
 * @def ASSERT_THROWS
 * @brief Macro asserting that a statement throws `exception_type`.
 */
#define ASSERT_THROWS(statement, exception_type)                                                   \
    tomldb::test::assert_throws<exception_type>([&]() { statement; }, __FILE__, __LINE__,        \
                                                #statement " throws " #exception_type)
