#pragma once

#include "parastore/observability/observer.hpp"

#include <memory>

namespace parastore::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_entity_written(const std::string &path, bool created);
void record_entity_deleted(const std::string &path);
void record_index_sync_failed(const std::string &index_path, const std::string &operation,
                              const std::string &message);
void record_archived(const std::string &id, const std::string &type,
                     const std::string &archived_to);
void record_archive_rollback(const std::string &source, const std::string &destination,
                             bool succeeded);
void record_error(const std::string &component, const std::string &message);
void record_latency(const std::string &operation, std::chrono::milliseconds latency);

} // namespace parastore::observability
