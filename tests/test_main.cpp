#include "test_framework.hpp"

#include <iostream>

void register_common_tests(std::vector<parastore::tests::TestCase> &tests);
void register_filesystem_tests(std::vector<parastore::tests::TestCase> &tests);
void register_schema_tests(std::vector<parastore::tests::TestCase> &tests);
void register_model_tests(std::vector<parastore::tests::TestCase> &tests);
void register_paths_tests(std::vector<parastore::tests::TestCase> &tests);
void register_index_tests(std::vector<parastore::tests::TestCase> &tests);
void register_reader_tests(std::vector<parastore::tests::TestCase> &tests);
void register_writer_tests(std::vector<parastore::tests::TestCase> &tests);
void register_archival_tests(std::vector<parastore::tests::TestCase> &tests);
void register_config_tests(std::vector<parastore::tests::TestCase> &tests);
void register_observability_tests(std::vector<parastore::tests::TestCase> &tests);
void register_end_to_end_tests(std::vector<parastore::tests::TestCase> &tests);

int main() {
  std::vector<parastore::tests::TestCase> tests;
  register_common_tests(tests);
  register_filesystem_tests(tests);
  register_schema_tests(tests);
  register_model_tests(tests);
  register_paths_tests(tests);
  register_index_tests(tests);
  register_reader_tests(tests);
  register_writer_tests(tests);
  register_archival_tests(tests);
  register_config_tests(tests);
  register_observability_tests(tests);
  register_end_to_end_tests(tests);

  std::size_t passed = 0;
  std::size_t failed = 0;

  for (const auto &test : tests) {
    try {
      test.fn();
      ++passed;
    } catch (const std::exception &ex) {
      ++failed;
      std::cerr << "[FAIL] " << test.name << ": " << ex.what() << "\n";
    }
  }

  std::cout << "Ran " << tests.size() << " tests: " << passed << " passed, " << failed
            << " failed\n";
  return failed == 0 ? 0 : 1;
}
