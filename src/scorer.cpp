#include "scorer.hpp"
#include "ials_error.hpp"

#include <algorithm>
#include <utility>
#include <glog/logging.h>

namespace ials {

namespace {

bool RankBefore(const ScoredItem& a, const ScoredItem& b) {
  if (a.score != b.score) {
    return a.score > b.score;
  }
  return a.item < b.item;
}

// Keeps the best n candidates, in rank order.
std::vector<ScoredItem> TopN(std::vector<ScoredItem> candidates, int n) {
  const size_t keep = std::min(candidates.size(), static_cast<size_t>(n));
  std::partial_sort(candidates.begin(), candidates.begin() + keep,
      candidates.end(), RankBefore);
  candidates.resize(keep);
  return candidates;
}

}  // anonymous namespace

Scorer::Scorer(std::shared_ptr<const FactorStore> factors,
    std::shared_ptr<const InteractionStore> interactions)
  : factors_(factors), interactions_(interactions) {
  CHECK(factors_);
  CHECK(interactions_);
  CHECK_EQ(factors_->NumUsers(), interactions_->NumUsers());
  CHECK_EQ(factors_->NumItems(), interactions_->NumItems());
}

void Scorer::CheckUser(int user) const {
  if (user < 0 || user >= factors_->NumUsers()) {
    throw UnknownUser(user);
  }
}

void Scorer::CheckItem(int item) const {
  if (item < 0 || item >= factors_->NumItems()) {
    throw UnknownItem(item);
  }
}

double Scorer::PredictedAffinity(int user, int item) const {
  CheckUser(user);
  CheckItem(item);
  return factors_->UserRow(user).dot(factors_->ItemRow(item));
}

std::vector<ScoredItem> Scorer::Recommend(int user, int n,
    bool exclude_seen) const {
  CheckUser(user);
  if (n <= 0) {
    return std::vector<ScoredItem>();
  }
  const int num_items = factors_->NumItems();
  const Eigen::VectorXd scores =
    factors_->ItemFactors() * factors_->UserRow(user).transpose();

  // The user's row is sorted by item, so a single cursor walks it in step
  // with the candidate loop.
  const EntryRange seen = interactions_->ItemsForUser(user);
  EntryRange::const_iterator next_seen = seen.begin();
  std::vector<ScoredItem> candidates;
  candidates.reserve(num_items);
  for (int i = 0; i < num_items; ++i) {
    if (exclude_seen && next_seen != seen.end() && next_seen->index == i) {
      ++next_seen;
      continue;
    }
    candidates.push_back(ScoredItem(i, scores(i)));
  }
  return TopN(std::move(candidates), n);
}

std::vector<ScoredItem> Scorer::SimilarItems(int item, int n) const {
  CheckItem(item);
  if (n <= 0) {
    return std::vector<ScoredItem>();
  }
  const FactorMatrix& Y = factors_->ItemFactors();
  const Eigen::VectorXd norms = Y.rowwise().norm();
  const Eigen::VectorXd dots = Y * Y.row(item).transpose();
  std::vector<ScoredItem> candidates;
  candidates.reserve(Y.rows());
  for (int i = 0; i < Y.rows(); ++i) {
    if (i == item) {
      continue;
    }
    const double denom = norms(i) * norms(item);
    candidates.push_back(ScoredItem(i, denom > 0.0 ? dots(i) / denom : 0.0));
  }
  return TopN(std::move(candidates), n);
}

std::vector<ScoredItem> Recommend(
    const std::shared_ptr<const FactorStore>& factors,
    const std::shared_ptr<const InteractionStore>& interactions,
    int user, int n, bool exclude_seen) {
  return Scorer(factors, interactions).Recommend(user, n, exclude_seen);
}

}  // namespace ials
