#pragma once

#include <cstdint>

namespace ials {

class InteractionStore;

// Maps observation counts to confidence weights c = 1 + alpha * count.
// Untouched pairs have confidence exactly 1 and indicator 0.
class ConfidenceModel {
public:
  ConfidenceModel(const InteractionStore& store, double alpha);

  static double Confidence(uint32_t count, double alpha) {
    return 1.0 + alpha * static_cast<double>(count);
  }

  double ConfidenceFor(int user, int item) const;
  int IndicatorFor(int user, int item) const;

  double alpha() const { return alpha_; }

private:
  const InteractionStore& store_;
  double alpha_;
};

}  // namespace ials
