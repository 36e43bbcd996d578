#pragma once

#include "parastore/observability/observer.hpp"

#include <memory>
#include <vector>

namespace parastore::observability {

// Forwards to every child in order. Null children are dropped.
class MultiObserver final : public IObserver {
public:
  MultiObserver() = default;
  explicit MultiObserver(std::vector<std::unique_ptr<IObserver>> observers);

  void add(std::unique_ptr<IObserver> observer);
  [[nodiscard]] std::size_t size() const { return observers_.size(); }
  [[nodiscard]] const IObserver &at(std::size_t index) const { return *observers_.at(index); }

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }

private:
  std::vector<std::unique_ptr<IObserver>> observers_;
};

} // namespace parastore::observability
