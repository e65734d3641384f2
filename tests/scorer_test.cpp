#include "scorer.hpp"
#include "als_solver.hpp"
#include "ials_error.hpp"

#include <memory>
#include <vector>
#include <gtest/gtest.h>

namespace ials {

namespace {

std::vector<Interaction> SmallData() {
  std::vector<Interaction> data;
  data.push_back(Interaction(0, 0, 1));
  data.push_back(Interaction(0, 1, 3));
  data.push_back(Interaction(1, 1, 1));
  data.push_back(Interaction(2, 2, 5));
  return data;
}

AlsOptions SmallOptions() {
  AlsOptions options;
  options.num_factors = 2;
  options.lambda = 0.1;
  options.alpha = 1.0;
  options.num_iterations = 5;
  options.seed = 42;
  return options;
}

class ScorerTest : public ::testing::Test {
protected:
  void SetUp() override {
    store_ = std::make_shared<InteractionStore>(SmallData(), 3, 4);
    factors_ = Train(*store_, SmallOptions());
  }

  std::shared_ptr<const InteractionStore> store_;
  std::shared_ptr<const FactorStore> factors_;
};

void ExpectRanked(const std::vector<ScoredItem>& recs) {
  for (size_t r = 1; r < recs.size(); ++r) {
    EXPECT_TRUE(recs[r - 1].score > recs[r].score ||
        (recs[r - 1].score == recs[r].score &&
         recs[r - 1].item < recs[r].item))
      << "position " << r;
  }
}

}  // anonymous namespace

TEST_F(ScorerTest, RecommendsOnlyUnseenItems) {
  std::vector<ScoredItem> recs = Recommend(factors_, store_, 0, 2, true);
  ASSERT_EQ(2u, recs.size());
  EXPECT_NE(recs[0].item, recs[1].item);
  for (size_t r = 0; r < recs.size(); ++r) {
    EXPECT_TRUE(recs[r].item == 2 || recs[r].item == 3) << recs[r].item;
  }
  EXPECT_GE(recs[0].score, recs[1].score);
}

TEST_F(ScorerTest, ExclusionHoldsForEveryUser) {
  Scorer scorer(factors_, store_);
  for (int u = 0; u < store_->NumUsers(); ++u) {
    std::vector<ScoredItem> recs = scorer.Recommend(u, 10);
    EXPECT_EQ(4u - store_->ItemsForUser(u).size(), recs.size());
    for (size_t r = 0; r < recs.size(); ++r) {
      EXPECT_FALSE(store_->Contains(u, recs[r].item))
        << "user " << u << " got seen item " << recs[r].item;
    }
    ExpectRanked(recs);
  }
}

TEST_F(ScorerTest, IncludeSeenScoresEveryItem) {
  Scorer scorer(factors_, store_);
  std::vector<ScoredItem> recs = scorer.Recommend(0, 10, false);
  ASSERT_EQ(4u, recs.size());
  ExpectRanked(recs);
  for (size_t r = 0; r < recs.size(); ++r) {
    EXPECT_DOUBLE_EQ(scorer.PredictedAffinity(0, recs[r].item),
        recs[r].score);
  }
}

TEST_F(ScorerTest, NonPositiveNIsEmpty) {
  Scorer scorer(factors_, store_);
  EXPECT_TRUE(scorer.Recommend(1, 0).empty());
  EXPECT_TRUE(scorer.Recommend(1, -3).empty());
  EXPECT_TRUE(scorer.SimilarItems(1, 0).empty());
}

TEST_F(ScorerTest, UnknownUserThrows) {
  Scorer scorer(factors_, store_);
  EXPECT_THROW(scorer.Recommend(3, 1), UnknownUser);
  EXPECT_THROW(scorer.Recommend(-1, 1), UnknownUser);
  EXPECT_THROW(scorer.PredictedAffinity(7, 0), UnknownUser);
  EXPECT_THROW(scorer.PredictedAffinity(0, 4), UnknownItem);
  EXPECT_THROW(scorer.SimilarItems(-1, 2), UnknownItem);
}

TEST(ScorerIsolatedUserTest, IsolatedUserStillGetsAnItem) {
  std::shared_ptr<const InteractionStore> store =
    std::make_shared<InteractionStore>(SmallData(), 4, 4);
  std::shared_ptr<const FactorStore> factors = Train(*store, SmallOptions());
  std::vector<ScoredItem> recs = Recommend(factors, store, 3, 1);
  ASSERT_EQ(1u, recs.size());
  EXPECT_GE(recs[0].item, 0);
  EXPECT_LT(recs[0].item, 4);

  // Same seed, same frozen factor, same answer.
  std::shared_ptr<const FactorStore> again = Train(*store, SmallOptions());
  std::vector<ScoredItem> recs_again = Recommend(again, store, 3, 1);
  ASSERT_EQ(1u, recs_again.size());
  EXPECT_EQ(recs[0].item, recs_again[0].item);
}

TEST(ScorerFixedFactorsTest, TiesBreakByAscendingItem) {
  FactorMatrix X(1, 2);
  X << 1, 0;
  FactorMatrix Y(5, 2);
  Y << 0.5, 1,
       2.0, 0,
       0.5, -1,
       2.0, 3,
       0.5, 0;
  std::shared_ptr<const FactorStore> factors =
    std::make_shared<FactorStore>(X, Y, 1);
  std::shared_ptr<const InteractionStore> store =
    std::make_shared<InteractionStore>(std::vector<Interaction>(), 1, 5);

  std::vector<ScoredItem> recs = Recommend(factors, store, 0, 5);
  ASSERT_EQ(5u, recs.size());
  const int expected[] = {1, 3, 0, 2, 4};
  for (int r = 0; r < 5; ++r) {
    EXPECT_EQ(expected[r], recs[r].item) << "position " << r;
  }
}

TEST(ScorerFixedFactorsTest, AffinityIsAnUnclippedDotProduct) {
  FactorMatrix X(1, 2);
  X << 2, -3;
  FactorMatrix Y(2, 2);
  Y << 1, 4,
       -1, -1;
  std::shared_ptr<const FactorStore> factors =
    std::make_shared<FactorStore>(X, Y, 1);
  std::shared_ptr<const InteractionStore> store =
    std::make_shared<InteractionStore>(std::vector<Interaction>(), 1, 2);
  Scorer scorer(factors, store);
  EXPECT_DOUBLE_EQ(-10.0, scorer.PredictedAffinity(0, 0));
  EXPECT_DOUBLE_EQ(1.0, scorer.PredictedAffinity(0, 1));
}

TEST(ScorerFixedFactorsTest, SimilarItemsByCosine) {
  FactorMatrix X(1, 2);
  X << 1, 1;
  FactorMatrix Y(4, 2);
  Y << 1, 0,
       3, 0,
       0, 2,
       0, 0;
  std::shared_ptr<const FactorStore> factors =
    std::make_shared<FactorStore>(X, Y, 1);
  std::shared_ptr<const InteractionStore> store =
    std::make_shared<InteractionStore>(std::vector<Interaction>(), 1, 4);
  Scorer scorer(factors, store);

  std::vector<ScoredItem> similar = scorer.SimilarItems(0, 10);
  ASSERT_EQ(3u, similar.size());
  EXPECT_EQ(1, similar[0].item);
  EXPECT_DOUBLE_EQ(1.0, similar[0].score);
  // Orthogonal and zero-norm items both score 0; ties go to the lower index.
  EXPECT_EQ(2, similar[1].item);
  EXPECT_DOUBLE_EQ(0.0, similar[1].score);
  EXPECT_EQ(3, similar[2].item);
  EXPECT_DOUBLE_EQ(0.0, similar[2].score);
}

}  // namespace ials
