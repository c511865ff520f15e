#pragma once

#include <cstdint>

struct TimeStep {
  float dtMs = 0.0F;  // milliseconds; speeds are px/ms
  uint64_t frame = 0;
};
