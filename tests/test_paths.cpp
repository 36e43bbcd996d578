#include "test_framework.hpp"

#include "parastore/paths/resolver.hpp"

#include <algorithm>

void register_paths_tests(std::vector<parastore::tests::TestCase> &tests) {
  using parastore::tests::require;
  namespace paths = parastore::paths;

  tests.push_back({"resolve_scheme_addresses", [] {
                     const paths::PathResolver resolver;
                     require(resolver.resolve("para://projects/q1").value() == "Orion/Projects/q1",
                             "projects");
                     require(resolver.resolve("PARA://Areas/health").value() == "Orion/Areas/health",
                             "case-insensitive scheme and category");
                     require(resolver.resolve("para://").value() == "Orion", "empty is root");
                     require(resolver.resolve("para://inbox").value() == "Orion/Inbox", "bare");
                   }});

  tests.push_back({"resolve_entity_categories_append_extension_once", [] {
                     const paths::PathResolver resolver;
                     const auto bare = resolver.resolve("para://contacts/john");
                     const auto full = resolver.resolve("para://contacts/john.yaml");
                     require(bare.ok() && full.ok(), "both resolve");
                     require(bare.value() == "Orion/Resources/contacts/john.yaml", bare.value());
                     require(bare.value() == full.value(), "same path");
                     require(resolver.resolve("para://projects/q1").value().find(".yaml") ==
                                 std::string::npos,
                             "no extension for projects");
                   }});

  tests.push_back({"resolve_rooted_and_relative_forms", [] {
                     const paths::PathResolver resolver;
                     require(resolver.resolve("Orion/projects//q1/").value() ==
                                 "Orion/Projects/q1",
                             "rooted canonicalised");
                     require(resolver.resolve("projects/my project.v2").value() ==
                                 "Orion/Projects/my project.v2",
                             "relative keeps characters");
                     require(resolver.resolve("notes/día").value() ==
                                 "Orion/Resources/notes/día.yaml",
                             "unicode kept");
                   }});

  tests.push_back({"resolve_reports_invalid_category_with_valid_list", [] {
                     const paths::PathResolver resolver;
                     const auto result = resolver.resolve("para://bogus/x");
                     require(!result.ok(), "must fail");
                     require(result.error().code == paths::ResolveErrorCode::InvalidCategory,
                             "code");
                     require(result.error().category == "bogus", result.error().category);
                     const auto &valid = result.error().valid;
                     require(std::find(valid.begin(), valid.end(), "contacts") != valid.end(),
                             "valid list");
                   }});

  tests.push_back({"resolve_rejects_non_para_paths", [] {
                     const paths::PathResolver resolver;
                     const auto result = resolver.resolve("/etc/passwd");
                     require(!result.ok(), "absolute path rejected");
                     require(result.error().code == paths::ResolveErrorCode::NotParaPath, "code");
                     require(!resolver.resolve("OrionExtra/x").ok(), "prefix lookalike");
                     require(paths::resolve_error_name(result.error().code) == "NOT_PARA_PATH",
                             "wire name");
                   }});

  tests.push_back({"logical_address_round_trips", [] {
                     const paths::PathResolver resolver;
                     for (const std::string address :
                          {"para://projects/q1", "para://contacts/john", "para://notes/a/b",
                           "para://resources/notes/draft", "para://archive/projects/2025-12/p1",
                           "para://inbox", "para://", "Orion/Custom/x", "areas/health/_meta.yaml"}) {
                       const auto physical = resolver.resolve(address);
                       require(physical.ok(), "resolves " + address);
                       const auto logical = resolver.to_logical_address(physical.value());
                       require(logical.ok(), "inverts " + physical.value());
                       const auto again = resolver.resolve(logical.value());
                       require(again.ok() && again.value() == physical.value(),
                               "round trip for " + address + " via " + logical.value());
                     }
                   }});

  tests.push_back({"logical_address_prefers_scheme_form", [] {
                     const paths::PathResolver resolver;
                     require(resolver.to_logical_address("Orion/Resources/contacts/john.yaml")
                                     .value() == "para://contacts/john.yaml",
                             "contacts shortcut");
                     require(resolver.to_logical_address("Orion/Projects/q1").value() ==
                                 "para://projects/q1",
                             "projects");
                     require(!resolver.to_logical_address("Elsewhere/x").ok(), "outside root");
                   }});

  tests.push_back({"custom_root_and_scheme", [] {
                     const paths::PathResolver resolver("Vault", "kb");
                     require(resolver.resolve("kb://projects/x").value() == "Vault/Projects/x",
                             "custom scheme");
                     require(!resolver.resolve("para://projects/x").ok(), "default scheme unknown");
                     require(resolver.is_para_path("Vault") && resolver.is_para_path("Vault/a"),
                             "root detection");
                     require(!resolver.is_para_path("VaultX/a"), "lookalike root");
                     require(resolver.build_path({"Projects", "a/b"}) == "Vault/Projects/a/b",
                             resolver.build_path({"Projects", "a/b"}));
                   }});
}
