#pragma once

#include <cstddef>
#include <cstdint>

#include "duck_config.h"

namespace pwduck::graph
{

  // One level value per capture buffer, normalized to full scale = 1.0.
  // Interleaved channels are treated as one sample run. Empty input measures 0.
  float measureLevel(const float *samples, size_t n, config::LevelMetric metric);
  float measureLevel(const int16_t *samples, size_t n, config::LevelMetric metric);

} // namespace pwduck::graph
