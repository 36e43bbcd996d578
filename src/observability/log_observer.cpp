#include "parastore/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>
#include <utility>

namespace parastore::observability {

LogObserver::LogObserver() : out_(&std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(&out) {}

LogObserver::LogObserver(std::unique_ptr<std::ostream> owned)
    : owned_(std::move(owned)), out_(owned_.get()) {}

LogObserver::~LogObserver() = default;

void LogObserver::log_line(const std::string_view level, const std::string &message) {
  *out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, EntityWrittenEvent>) {
          log_line("INFO", std::string(evt.created ? "entity.create" : "entity.update") +
                               " path=" + evt.path);
        } else if constexpr (std::is_same_v<T, EntityDeletedEvent>) {
          log_line("INFO", "entity.delete path=" + evt.path);
        } else if constexpr (std::is_same_v<T, IndexSyncFailedEvent>) {
          log_line("WARN", "index.sync_failed op=" + evt.operation + " index=" + evt.index_path +
                               " error=" + evt.message);
        } else if constexpr (std::is_same_v<T, ArchivedEvent>) {
          log_line("INFO", "archive.move id=" + evt.id + " type=" + evt.type +
                               " to=" + evt.archived_to);
        } else if constexpr (std::is_same_v<T, ArchiveRollbackEvent>) {
          log_line(evt.succeeded ? "WARN" : "ERROR",
                   "archive.rollback from=" + evt.destination + " to=" + evt.source +
                       " succeeded=" + (evt.succeeded ? std::string("true") : std::string("false")));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, OperationLatencyMetric>) {
          log_line("DEBUG", "metric.latency_ms op=" + m.operation + " value=" +
                                std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, ArchiveTotalMetric>) {
          log_line("DEBUG", "metric.archive_total=" + std::to_string(m.total));
        }
      },
      metric);
}

void LogObserver::flush() { out_->flush(); }

} // namespace parastore::observability
