// Minimal test utilities shared by the test executables.
#pragma once

#include <cmath>
#include <cstdio>
#include <exception>

#define TEST_ASSERT(condition, message) \
  do { \
    if (!(condition)) { \
      fprintf(stderr, "[FAIL] %s: %s\n", __func__, message); \
      return 0; \
    } \
  } while(0)

#define TEST_ASSERT_NEAR(actual, expected, tolerance, message) \
  TEST_ASSERT(std::fabs((actual) - (expected)) <= (tolerance), message)

// Evaluates expr and fails unless it throws ExceptionType.
#define TEST_ASSERT_THROWS(expr, ExceptionType, message) \
  do { \
    bool thrown_ = false; \
    try { expr; } catch (const ExceptionType&) { thrown_ = true; } \
    TEST_ASSERT(thrown_, message); \
  } while(0)

#define TEST_PASS(test_name) \
  do { \
    printf("[PASS] %s\n", test_name); \
    return 1; \
  } while(0)

struct TestCase {
  const char* name;
  int (*func)(void);
};

// Runs every test, prints totals and returns the process exit code.
template <std::size_t N>
int runTests(const char* suiteName, const TestCase (&tests)[N]) {
  printf("=== %s ===\n\n", suiteName);

  int total_tests = static_cast<int>(N);
  int passed = 0;
  int failed = 0;

  for (int i = 0; i < total_tests; i++) {
    printf("Running test %d/%d: %s\n", i + 1, total_tests, tests[i].name);

    int ok = 0;
    try {
      ok = tests[i].func();
    } catch (const std::exception& ex) {
      fprintf(stderr, "[FAIL] unexpected exception: %s\n", ex.what());
      ok = 0;
    }

    if (ok) {
      passed++;
    } else {
      failed++;
      printf("[FAIL] Test failed: %s\n", tests[i].name);
    }
    printf("\n");
  }

  printf("=== Test Results ===\n");
  printf("Total tests: %d\n", total_tests);
  printf("Passed: %d\n", passed);
  printf("Failed: %d\n", failed);

  if (failed == 0) {
    printf("\n All tests passed!\n");
    return 0;
  }
  printf("\n Some tests failed.\n");
  return 1;
}
