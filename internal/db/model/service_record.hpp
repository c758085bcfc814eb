#pragma once

#include <cstdint>
#include <string>

namespace buildq::db::model {

// A deployable service; `image` is the tag currently rolled out.
struct ServiceRecord {
  uint64_t    id         = 0;
  uint64_t    project_id = 0;
  std::string name;
  std::string image;
  uint64_t    created_at_ms = 0;
};

} // namespace buildq::db::model
