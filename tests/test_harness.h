#pragma once

#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

struct TestCase {
  const char* name;
  void (*fn)();
};

inline int g_failures = 0;
inline std::string g_current_test;

inline void expect_true(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL [" << g_current_test << "]: " << message << std::endl;
    ++g_failures;
  }
}

inline void expect_eq(size_t actual, size_t expected, const std::string& message) {
  if (actual != expected) {
    std::cerr << "FAIL [" << g_current_test << "]: " << message
              << " (expected " << expected << ", got " << actual << ")" << std::endl;
    ++g_failures;
  }
}

inline void expect_str(const std::string& actual, const std::string& expected,
                       const std::string& message) {
  if (actual != expected) {
    std::cerr << "FAIL [" << g_current_test << "]: " << message << "\n  expected: " << expected
              << "\n  got:      " << actual << std::endl;
    ++g_failures;
  }
}

inline void expect_contains(const std::string& haystack, const std::string& needle,
                            const std::string& message) {
  if (haystack.find(needle) == std::string::npos) {
    std::cerr << "FAIL [" << g_current_test << "]: " << message << "\n  missing: " << needle
              << "\n  in:      " << haystack << std::endl;
    ++g_failures;
  }
}

inline void expect_missing(const std::string& haystack, const std::string& needle,
                           const std::string& message) {
  if (haystack.find(needle) != std::string::npos) {
    std::cerr << "FAIL [" << g_current_test << "]: " << message << "\n  unexpected: " << needle
              << "\n  in:         " << haystack << std::endl;
    ++g_failures;
  }
}

void register_domain_tests(std::vector<TestCase>& tests);
void register_syntax_tests(std::vector<TestCase>& tests);
void register_binder_tests(std::vector<TestCase>& tests);
void register_space_tests(std::vector<TestCase>& tests);
void register_rewrite_tests(std::vector<TestCase>& tests);
void register_assemble_tests(std::vector<TestCase>& tests);
void register_translate_tests(std::vector<TestCase>& tests);
void register_reduce_tests(std::vector<TestCase>& tests);
void register_pipe_tests(std::vector<TestCase>& tests);
void register_cli_utils_tests(std::vector<TestCase>& tests);
