#pragma once

#include <string>

#include "internal/model/relayable.hpp"

namespace auklet::relay {

/*
  Per-run values every shipped record is stamped with. Built once before any
  worker starts and never modified afterwards.
*/
struct RelayContext {
  std::string   checksum;
  model::Topics topics;
};

} // namespace auklet::relay
