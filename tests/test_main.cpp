#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "test_harness.h"

namespace {

std::vector<TestCase> collect_tests() {
  std::vector<TestCase> tests;
  register_domain_tests(tests);
  register_syntax_tests(tests);
  register_binder_tests(tests);
  register_space_tests(tests);
  register_rewrite_tests(tests);
  register_assemble_tests(tests);
  register_reduce_tests(tests);
  register_translate_tests(tests);
  register_pipe_tests(tests);
  register_cli_utils_tests(tests);
  return tests;
}

int run_test(const TestCase& test) {
  g_current_test = test.name;
  g_failures = 0;
  try {
    test.fn();
  } catch (const std::exception& ex) {
    std::cerr << "FAIL [" << test.name << "]: unexpected exception: " << ex.what() << std::endl;
    ++g_failures;
  }
  return g_failures;
}

}  // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = collect_tests();
  if (argc > 1) {
    std::string target = argv[1];
    for (const auto& test : tests) {
      if (target == test.name) {
        int failures = run_test(test);
        return failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
      }
    }
    std::cerr << "Unknown test: " << target << std::endl;
    std::cerr << "Available tests:" << std::endl;
    for (const auto& test : tests) {
      std::cerr << "  " << test.name << std::endl;
    }
    return EXIT_FAILURE;
  }

  int total_failures = 0;
  for (const auto& test : tests) {
    int failures = run_test(test);
    if (failures > 0) {
      std::cerr << "FAILED: " << test.name << " (" << failures << ")" << std::endl;
      total_failures += failures;
    }
  }

  if (total_failures > 0) {
    std::cerr << total_failures << " test(s) failed." << std::endl;
    return EXIT_FAILURE;
  }
  std::cout << "All tests passed." << std::endl;
  return EXIT_SUCCESS;
}
