#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "parastore/fs/local_filesystem.hpp"

#include <filesystem>

void register_filesystem_tests(std::vector<parastore::tests::TestCase> &tests) {
  using parastore::tests::require;
  namespace pt = parastore::testing;
  namespace common = parastore::common;

  tests.push_back({"local_fs_reads_and_writes_relative_to_base", [] {
                     pt::TempWorkspace ws;
                     ws.create_dir("Orion/Projects");
                     auto fs = ws.filesystem();
                     require(fs->write_text("Orion/Projects/a.yaml", "id: a\n").ok(), "write");
                     require(ws.read_file("Orion/Projects/a.yaml") == "id: a\n", "content");
                     const auto text = fs->read_text("Orion/Projects/a.yaml");
                     require(text.ok() && text.value() == "id: a\n", "read back");
                     const auto present = fs->exists("Orion/Projects/a.yaml");
                     require(present.ok() && present.value(), "exists");
                   }});

  tests.push_back({"local_fs_rejects_escaping_paths", [] {
                     pt::TempWorkspace ws;
                     auto fs = ws.filesystem();
                     const auto escaped = fs->write_text("../outside.txt", "x");
                     require(!escaped.ok(), "must fail");
                     require(escaped.error().code == common::ErrorCode::FsError, "fs error");
                     require(escaped.error().has_cause(), "filesystem_error cause");
                   }});

  tests.push_back({"local_fs_trailing_separator_base_is_normalised", [] {
                     pt::TempWorkspace ws;
                     parastore::fs::LocalFileSystem fs(ws.path().string() + "/");
                     require(fs.create_directories("Orion/Inbox").ok(), "mkdir");
                     require(ws.exists("Orion/Inbox"), "created under base");
                   }});

  tests.push_back({"local_fs_rename_moves_directories", [] {
                     pt::TempWorkspace ws;
                     ws.create_file("Orion/Projects/p1/_meta.yaml", "id: proj_1\n");
                     ws.create_dir("Orion/Archive");
                     auto fs = ws.filesystem();
                     require(fs->rename("Orion/Projects/p1", "Orion/Archive/p1").ok(), "rename");
                     require(!ws.exists("Orion/Projects/p1"), "source gone");
                     require(ws.exists("Orion/Archive/p1/_meta.yaml"), "tree moved");
                   }});

  tests.push_back({"local_fs_remove_missing_file_fails", [] {
                     pt::TempWorkspace ws;
                     auto fs = ws.filesystem();
                     require(!fs->remove("nothing.yaml").ok(), "remove of absent file fails");
                   }});

  tests.push_back({"fault_injection_blocks_matching_paths", [] {
                     pt::TempWorkspace ws;
                     pt::FaultInjectingFileSystem fs(ws.filesystem());
                     fs.fail(pt::FaultInjectingFileSystem::Op::Write, ".tmp");
                     require(!fs.write_text("a.yaml.tmp", "x").ok(), "tmp write fails");
                     require(fs.write_text("a.yaml", "x").ok(), "other write passes");
                     require(fs.mutations() == 1, "only the real write counted");
                   }});
}
