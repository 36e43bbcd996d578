#include "parastore/observability/global.hpp"

#include <mutex>

namespace parastore::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_entity_written(const std::string &path, const bool created) {
  record_event(EntityWrittenEvent{.path = path, .created = created});
}

void record_entity_deleted(const std::string &path) {
  record_event(EntityDeletedEvent{.path = path});
}

void record_index_sync_failed(const std::string &index_path, const std::string &operation,
                              const std::string &message) {
  record_event(
      IndexSyncFailedEvent{.index_path = index_path, .operation = operation, .message = message});
}

void record_archived(const std::string &id, const std::string &type,
                     const std::string &archived_to) {
  record_event(ArchivedEvent{.id = id, .type = type, .archived_to = archived_to});
}

void record_archive_rollback(const std::string &source, const std::string &destination,
                             const bool succeeded) {
  record_event(
      ArchiveRollbackEvent{.source = source, .destination = destination, .succeeded = succeeded});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

void record_latency(const std::string &operation, const std::chrono::milliseconds latency) {
  record_metric(OperationLatencyMetric{.operation = operation, .latency = latency});
}

} // namespace parastore::observability
