#include "factor_store.hpp"
#include "ials_error.hpp"

#include <memory>
#include <gtest/gtest.h>

namespace ials {

namespace {

std::shared_ptr<const FactorStore> MakeStore() {
  FactorMatrix X(2, 3);
  X << 1, 2, 3,
       4, 5, 6;
  FactorMatrix Y(1, 3);
  Y << -1, 0, 0.5;
  return std::make_shared<FactorStore>(X, Y, 7);
}

}  // anonymous namespace

TEST(FactorStoreTest, Shapes) {
  std::shared_ptr<const FactorStore> store = MakeStore();
  EXPECT_EQ(2, store->NumUsers());
  EXPECT_EQ(1, store->NumItems());
  EXPECT_EQ(3, store->NumFactors());
  EXPECT_EQ(7, store->Version());
  EXPECT_DOUBLE_EQ(5.0, store->UserRow(1)(1));
  EXPECT_DOUBLE_EQ(0.5, store->ItemRow(0)(2));
}

TEST(FactorStoreTest, ExportIsRowMajor) {
  FlatFactors flat = MakeStore()->Export();
  EXPECT_EQ(2, flat.user_rows);
  EXPECT_EQ(1, flat.item_rows);
  EXPECT_EQ(3, flat.num_factors);
  ASSERT_EQ(6u, flat.user_factors.size());
  ASSERT_EQ(3u, flat.item_factors.size());
  for (int k = 0; k < 6; ++k) {
    EXPECT_DOUBLE_EQ(k + 1.0, flat.user_factors[k]);
  }
  EXPECT_DOUBLE_EQ(-1.0, flat.item_factors[0]);
  EXPECT_DOUBLE_EQ(0.5, flat.item_factors[2]);
}

TEST(FactorStoreTest, FromFlatRestoresMatrices) {
  std::shared_ptr<const FactorStore> original = MakeStore();
  std::shared_ptr<const FactorStore> restored =
    FactorStore::FromFlat(original->Export(), original->Version());
  EXPECT_TRUE(original->UserFactors() == restored->UserFactors());
  EXPECT_TRUE(original->ItemFactors() == restored->ItemFactors());
  EXPECT_EQ(7, restored->Version());
}

TEST(FactorStoreTest, FromFlatRejectsBadShapes) {
  FlatFactors flat = MakeStore()->Export();
  flat.user_factors.pop_back();
  EXPECT_THROW(FactorStore::FromFlat(flat, 0), InvalidArgument);

  flat = MakeStore()->Export();
  flat.num_factors = 0;
  EXPECT_THROW(FactorStore::FromFlat(flat, 0), InvalidArgument);

  flat = MakeStore()->Export();
  flat.item_rows = 2;
  EXPECT_THROW(FactorStore::FromFlat(flat, 0), InvalidArgument);
}

TEST(FactorStoreSlotTest, PublishReplacesSnapshot) {
  FactorStoreSlot slot;
  EXPECT_FALSE(static_cast<bool>(slot.Current()));

  std::shared_ptr<const FactorStore> first = MakeStore();
  slot.Publish(first);
  EXPECT_EQ(first, slot.Current());

  std::shared_ptr<const FactorStore> second =
    FactorStore::FromFlat(first->Export(), 8);
  slot.Publish(second);
  EXPECT_EQ(8, slot.Current()->Version());
  // Readers holding the old snapshot keep a consistent view.
  EXPECT_EQ(7, first->Version());
}

}  // namespace ials
