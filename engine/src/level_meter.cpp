#include "level_meter.h"

#include <cmath>

namespace pwduck::graph
{

  template <typename T, typename ToFloat>
  static float measure(const T *samples, size_t n, config::LevelMetric metric, ToFloat toFloat)
  {
    if (!samples || n == 0)
      return 0.0f;

    if (metric == config::LevelMetric::Peak)
    {
      float peak = 0.0f;
      for (size_t i = 0; i < n; i++)
        peak = std::fmax(peak, std::fabs(toFloat(samples[i])));
      return peak;
    }

    double sum = 0.0;
    for (size_t i = 0; i < n; i++)
    {
      const double s = toFloat(samples[i]);
      sum += s * s;
    }
    return (float)std::sqrt(sum / (double)n);
  }

  float measureLevel(const float *samples, size_t n, config::LevelMetric metric)
  {
    return measure(samples, n, metric, [](float s)
                   { return std::isfinite(s) ? s : 0.0f; });
  }

  float measureLevel(const int16_t *samples, size_t n, config::LevelMetric metric)
  {
    return measure(samples, n, metric, [](int16_t s)
                   { return (float)s / 32768.0f; });
  }

} // namespace pwduck::graph
