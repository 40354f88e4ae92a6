#include <functional>
#include <random>
#include <thread>

#include <sonde/common/random.hpp>

static inline std::mt19937&
random_mt() {
  // Try to generate as-random-as-possible initial seed value based on time and
  // thread ID.

  static thread_local std::mt19937 mt(
    std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::high_resolution_clock::now().time_since_epoch())
      .count() +
    std::hash<std::thread::id>()(std::this_thread::get_id()));
  return mt;
}

double
sonde_double_uniform_distribution(double min, double max) {
  std::uniform_real_distribution<double> distr(min, max);
  return distr(random_mt());
}

namespace sonde {
std::chrono::milliseconds
JitteredInterval(std::chrono::milliseconds interval, double jitterFactor) {
  if(jitterFactor <= 0.0 || interval.count() <= 0)
    return interval;

  double extra = sonde_double_uniform_distribution(0.0, jitterFactor) *
                 static_cast<double>(interval.count());
  return interval + std::chrono::milliseconds(static_cast<int64_t>(extra));
}
}
