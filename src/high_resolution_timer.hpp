#pragma once

#include <chrono>

namespace ials {
namespace util {

// Wall-clock stopwatch started on construction.
class HighResolutionTimer {
public:
  HighResolutionTimer() : start_(std::chrono::steady_clock::now()) { }

  void restart() {
    start_ = std::chrono::steady_clock::now();
  }

  // Seconds since construction or the last restart().
  double elapsed() const {
    std::chrono::duration<double> d = std::chrono::steady_clock::now() - start_;
    return d.count();
  }

private:
  std::chrono::steady_clock::time_point start_;
};

}  // namespace util
}  // namespace ials
