#pragma once

#include <memory>
#include <vector>

#include "factor_store.hpp"
#include "interaction_store.hpp"

namespace ials {

struct ScoredItem {
  int item;
  double score;

  ScoredItem() : item(0), score(0.0) { }
  ScoredItem(int i, double s) : item(i), score(s) { }
};

// Scores and ranks items from a trained FactorStore. Read-only; one Scorer
// may serve concurrent queries. Results are sorted by descending score with
// ties broken by ascending item index.
class Scorer {
public:
  // Both stores must describe the same users and items.
  Scorer(std::shared_ptr<const FactorStore> factors,
         std::shared_ptr<const InteractionStore> interactions);

  // x_u . y_i. Approximates the indicator; not clipped or normalized.
  // Throws UnknownUser or UnknownItem.
  double PredictedAffinity(int user, int item) const;

  // Top n items for user. With exclude_seen, items the user already touched
  // are never returned. Throws UnknownUser.
  std::vector<ScoredItem> Recommend(int user, int n,
      bool exclude_seen = true) const;

  // Top n items by cosine similarity of item factors, excluding item itself.
  // Throws UnknownItem.
  std::vector<ScoredItem> SimilarItems(int item, int n) const;

  const FactorStore& factors() const { return *factors_; }

private:
  void CheckUser(int user) const;
  void CheckItem(int item) const;

  std::shared_ptr<const FactorStore> factors_;
  std::shared_ptr<const InteractionStore> interactions_;
};

// One-shot form of Scorer::Recommend.
std::vector<ScoredItem> Recommend(
    const std::shared_ptr<const FactorStore>& factors,
    const std::shared_ptr<const InteractionStore>& interactions,
    int user, int n, bool exclude_seen = true);

}  // namespace ials
