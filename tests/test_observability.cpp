#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "parastore/observability/factory.hpp"
#include "parastore/observability/global.hpp"
#include "parastore/observability/log_observer.hpp"
#include "parastore/observability/multi_observer.hpp"

#include <sstream>

void register_observability_tests(std::vector<parastore::tests::TestCase> &tests) {
  using parastore::tests::require;
  namespace obs = parastore::observability;
  namespace pt = parastore::testing;

  tests.push_back({"log_observer_formats_events", [] {
                     std::ostringstream out;
                     obs::LogObserver observer(out);
                     observer.record_event(obs::EntityWrittenEvent{
                         .path = "Orion/Projects/p1/_meta.yaml", .created = true});
                     observer.record_event(obs::IndexSyncFailedEvent{
                         .index_path = "Orion/Projects/_index.yaml",
                         .operation = "upsert",
                         .message = "disk full"});
                     observer.record_event(obs::ArchiveRollbackEvent{
                         .source = "Orion/Projects/p1",
                         .destination = "Orion/Archive/projects/2025-01/p1",
                         .succeeded = false});
                     observer.flush();

                     const std::string text = out.str();
                     require(text.find("[INFO] entity.create path=Orion/Projects/p1/_meta.yaml\n") !=
                                 std::string::npos,
                             text);
                     require(text.find("[WARN] index.sync_failed op=upsert "
                                       "index=Orion/Projects/_index.yaml error=disk full") !=
                                 std::string::npos,
                             text);
                     require(text.find("[ERROR] archive.rollback") != std::string::npos &&
                                 text.find("succeeded=false") != std::string::npos,
                             text);
                   }});

  tests.push_back({"log_observer_formats_metrics", [] {
                     std::ostringstream out;
                     obs::LogObserver observer(out);
                     observer.record_metric(obs::OperationLatencyMetric{
                         .operation = "write", .latency = std::chrono::milliseconds(12)});
                     observer.record_metric(obs::ArchiveTotalMetric{.total = 3});
                     require(out.str().find("metric.latency_ms op=write value=12") !=
                                 std::string::npos,
                             out.str());
                     require(out.str().find("metric.archive_total=3") != std::string::npos,
                             out.str());
                   }});

  tests.push_back({"parse_backends_rejects_unknown_names", [] {
                     const auto parsed = obs::parse_backends(" Log , none, log,file");
                     require(parsed.ok(), "parses");
                     require(parsed.value() ==
                                 std::vector<obs::Backend>{obs::Backend::Log, obs::Backend::File},
                             "none dropped, duplicates collapsed");
                     require(obs::parse_backends("none").ok() &&
                                 obs::parse_backends("none").value().empty(),
                             "none selects nothing");

                     const auto unknown = obs::parse_backends("log,prometheus");
                     require(!unknown.ok() && unknown.error().code ==
                                                  parastore::common::ErrorCode::ValidationError,
                             "unknown backend");
                     require(unknown.error().message.find("prometheus") != std::string::npos,
                             unknown.error().message);
                     require(!obs::parse_backends("log,").ok(), "empty entry");
                   }});

  tests.push_back({"factory_builds_selected_observers", [] {
                     pt::TempWorkspace ws;
                     parastore::config::Config config;
                     config.observability.backend = "none";
                     const auto none = obs::create_observer(config);
                     require(none.ok() && none.value() == nullptr, "none yields no observer");

                     config.observability.backend = "log";
                     const auto log = obs::create_observer(config);
                     require(log.ok() && log.value()->name() == "log", "log");

                     config.observability.backend = "file";
                     require(!obs::create_observer(config).ok(), "file needs a path");

                     config.observability.backend = "log,file";
                     config.observability.log_path = (ws.path() / "parastore.log").string();
                     auto combined = obs::create_observer(config);
                     require(combined.ok() && combined.value()->name() == "multi", "multi");
                     const auto &multi = dynamic_cast<const obs::MultiObserver &>(*combined.value());
                     require(multi.size() == 2 && multi.at(1).name() == "file", "log then file");

                     combined.value()->record_event(obs::EntityDeletedEvent{.path = "Orion/x.yaml"});
                     combined.value()->flush();
                     require(ws.read_file("parastore.log").find("entity.delete path=Orion/x.yaml") !=
                                 std::string::npos,
                             "file sink written");

                     config.observability.backend = "log,statsd";
                     require(!obs::create_observer(config).ok(), "unknown backend fails");
                   }});

  tests.push_back({"multi_observer_fans_out", [] {
                     auto first = std::make_unique<pt::RecordingObserver>();
                     auto second = std::make_unique<pt::RecordingObserver>();
                     auto *first_ptr = first.get();
                     auto *second_ptr = second.get();
                     std::vector<std::unique_ptr<obs::IObserver>> children;
                     children.push_back(std::move(first));
                     children.push_back(nullptr);
                     obs::MultiObserver multi(std::move(children));
                     multi.add(std::move(second));
                     multi.add(nullptr);
                     require(multi.size() == 2, "null observers skipped");

                     multi.record_event(obs::EntityDeletedEvent{.path = "x"});
                     multi.record_metric(obs::ArchiveTotalMetric{.total = 1});
                     require(first_ptr->events.size() == 1 && second_ptr->events.size() == 1,
                             "events fanned out");
                     require(first_ptr->metrics.size() == 1 && second_ptr->metrics.size() == 1,
                             "metrics fanned out");
                   }});

  tests.push_back({"global_helpers_reach_installed_observer", [] {
                     {
                       pt::ObserverScope scope;
                       obs::record_entity_written("a", false);
                       obs::record_entity_deleted("a");
                       obs::record_index_sync_failed("idx", "remove", "boom");
                       obs::record_archived("proj_1", "project", "Orion/Archive/projects/2025-01/p1");
                       obs::record_archive_rollback("src", "dst", true);
                       obs::record_error("store", "oops");
                       obs::record_latency("archive", std::chrono::milliseconds(5));

                       auto &recorder = scope.observer();
                       require(recorder.events.size() == 6, "six events");
                       require(recorder.count<obs::ArchivedEvent>() == 1, "archived");
                       require(recorder.count<obs::ErrorEvent>() == 1, "error");
                       require(recorder.metrics.size() == 1, "one metric");
                       const auto *written = std::get_if<obs::EntityWrittenEvent>(&recorder.events[0]);
                       require(written != nullptr && !written->created, "update recorded");
                     }
                     require(obs::get_global_observer() == nullptr, "scope restores observer");
                     obs::record_error("store", "dropped without observer");
                   }});
}
