#include "test_framework.hpp"

#include "parastore/schema/schema.hpp"

#include <yaml-cpp/yaml.h>

namespace {

const parastore::schema::Schema &sample_schema() {
  using parastore::schema::Field;
  static const parastore::schema::Schema schema = [] {
    parastore::schema::Schema s("Sample");
    s.required("id", Field::string().starts_with("proj_"))
        .required("status", Field::one_of({"active", "completed"}))
        .optional("score", Field::integer().min(0).max(100))
        .optional("tags", Field::array_of(Field::string()))
        .optional("updated_at", Field::timestamp());
    return s;
  }();
  return schema;
}

} // namespace

void register_schema_tests(std::vector<parastore::tests::TestCase> &tests) {
  using parastore::tests::require;
  namespace schema = parastore::schema;
  namespace common = parastore::common;

  tests.push_back({"schema_accepts_valid_document_and_unknown_keys", [] {
                     const auto node =
                         YAML::Load("id: proj_1\nstatus: active\nscore: 40\nextra: kept\n");
                     require(sample_schema().validate(node).ok(), "valid document");
                   }});

  tests.push_back({"schema_reports_every_issue", [] {
                     const auto node = YAML::Load("id: area_1\nstatus: done\nscore: 101\n");
                     const auto issues = sample_schema().issues(node);
                     require(issues.size() == 3, "three issues, got " +
                                                     std::to_string(issues.size()));
                     require(issues[0].path == "id", issues[0].path);
                   }});

  tests.push_back({"schema_validate_attaches_validation_failure", [] {
                     const auto node = YAML::Load("status: active\n");
                     const auto result = sample_schema().validate(node);
                     require(!result.ok(), "missing id fails");
                     require(result.error().code == common::ErrorCode::ValidationError, "code");
                     bool saw_failure = false;
                     try {
                       std::rethrow_exception(result.error().cause);
                     } catch (const schema::ValidationFailure &failure) {
                       saw_failure = failure.issues().size() == 1 &&
                                     failure.issues()[0].message == "required";
                     }
                     require(saw_failure, "ValidationFailure with one required issue");
                   }});

  tests.push_back({"schema_rejects_null_for_typed_field", [] {
                     const auto node = YAML::Load("id: proj_1\nstatus: active\ntags: ~\n");
                     require(!sample_schema().validate(node).ok(), "null tags rejected");
                   }});

  tests.push_back({"schema_checks_array_elements_and_timestamps", [] {
                     const auto node = YAML::Load(
                         "id: proj_1\nstatus: active\ntags: [a, [b]]\nupdated_at: yesterday\n");
                     const auto issues = sample_schema().issues(node);
                     require(issues.size() == 2, schema::format_issues(issues));
                     require(issues[0].path == "tags[1]", issues[0].path);
                     require(issues[1].path == "updated_at", issues[1].path);
                   }});

  tests.push_back({"schema_rejects_non_mapping_root", [] {
                     const auto issues = sample_schema().issues(YAML::Load("- a\n- b\n"));
                     require(issues.size() == 1 && issues[0].path == "<root>", "root issue");
                   }});
}
