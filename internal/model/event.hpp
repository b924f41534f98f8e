#pragma once

#include <string>

#include "internal/model/relayable.hpp"
#include "internal/model/system_metrics.hpp"
#include "internal/util/time.hpp"

namespace auklet::model {

/*
  Event

  Terminal outcome of the supervised child. Built once, when the child exits.
*/
class Event final : public Relayable {
 public:
  Event(util::TimePoint timestamp, int exit_status, std::string signal, SystemMetrics metrics);

  const std::string& Topic(const Topics& topics) const override;
  void               Brand(std::string uuid, std::string checksum) override;
  std::string        Encode() const override;

  const std::string&   checksum() const { return checksum_; }
  const std::string&   uuid() const { return uuid_; }
  util::TimePoint      timestamp() const { return timestamp_; }
  int                  exit_status() const { return exit_status_; }
  const std::string&   signal() const { return signal_; }
  const SystemMetrics& system_metrics() const { return metrics_; }

 private:
  std::string     checksum_;
  std::string     uuid_;
  util::TimePoint timestamp_;
  int             exit_status_;
  std::string     signal_;
  SystemMetrics   metrics_;
};

} // namespace auklet::model
