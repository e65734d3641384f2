#include "confidence_model.hpp"
#include "interaction_store.hpp"

namespace ials {

ConfidenceModel::ConfidenceModel(const InteractionStore& store, double alpha)
  : store_(store), alpha_(alpha) { }

double ConfidenceModel::ConfidenceFor(int user, int item) const {
  return Confidence(store_.CountFor(user, item), alpha_);
}

int ConfidenceModel::IndicatorFor(int user, int item) const {
  return store_.Contains(user, item) ? 1 : 0;
}

}  // namespace ials
