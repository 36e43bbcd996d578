#pragma once

#include "parastore/observability/observer.hpp"

#include <iosfwd>
#include <memory>

namespace parastore::observability {

// One "[LEVEL] message" line per event, to stderr, a borrowed stream or an
// owned one (the file backend).
class LogObserver final : public IObserver {
public:
  LogObserver();
  explicit LogObserver(std::ostream &out);
  explicit LogObserver(std::unique_ptr<std::ostream> owned);
  ~LogObserver() override;

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return owned_ ? "file" : "log"; }

private:
  void log_line(std::string_view level, const std::string &message);

  std::unique_ptr<std::ostream> owned_;
  std::ostream *out_;
};

} // namespace parastore::observability
