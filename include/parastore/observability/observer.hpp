#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace parastore::observability {

struct EntityWrittenEvent {
  std::string path;
  bool created = false;
};

struct EntityDeletedEvent {
  std::string path;
};

// A best-effort index update that was recovered locally.
struct IndexSyncFailedEvent {
  std::string index_path;
  std::string operation;
  std::string message;
};

struct ArchivedEvent {
  std::string id;
  std::string type;
  std::string archived_to;
};

struct ArchiveRollbackEvent {
  std::string source;
  std::string destination;
  bool succeeded = false;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<EntityWrittenEvent, EntityDeletedEvent, IndexSyncFailedEvent,
                                   ArchivedEvent, ArchiveRollbackEvent, ErrorEvent>;

struct OperationLatencyMetric {
  std::string operation;
  std::chrono::milliseconds latency{0};
};

struct ArchiveTotalMetric {
  std::uint64_t total = 0;
};

using ObserverMetric = std::variant<OperationLatencyMetric, ArchiveTotalMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace parastore::observability
