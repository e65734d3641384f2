#pragma once

#include <memory>
#include <vector>

#include <Eigen/Dense>
#include <boost/thread/mutex.hpp>

namespace ials {

// Row-major so that one factor row is contiguous and rows can be written by
// different workers without touching each other's cache lines.
typedef Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>
  FactorMatrix;

// Flat export of a FactorStore: two dense row-major float64 arrays with
// explicit (rows, num_factors) shapes.
struct FlatFactors {
  int user_rows;
  int item_rows;
  int num_factors;
  std::vector<double> user_factors;   // user_rows * num_factors
  std::vector<double> item_factors;   // item_rows * num_factors

  FlatFactors() : user_rows(0), item_rows(0), num_factors(0) { }
};

// Trained user (X) and item (Y) factor matrices. Immutable; shared between
// the trainer that published it and any number of readers.
class FactorStore {
public:
  // version is the number of completed training iterations.
  FactorStore(const FactorMatrix& user_factors,
              const FactorMatrix& item_factors, int version);

  const FactorMatrix& UserFactors() const { return user_factors_; }
  const FactorMatrix& ItemFactors() const { return item_factors_; }

  FactorMatrix::ConstRowXpr UserRow(int user) const {
    return user_factors_.row(user);
  }
  FactorMatrix::ConstRowXpr ItemRow(int item) const {
    return item_factors_.row(item);
  }

  int NumUsers() const { return static_cast<int>(user_factors_.rows()); }
  int NumItems() const { return static_cast<int>(item_factors_.rows()); }
  int NumFactors() const { return static_cast<int>(user_factors_.cols()); }
  int Version() const { return version_; }

  FlatFactors Export() const;

  // Throws InvalidArgument when the array lengths disagree with the shapes.
  static std::shared_ptr<const FactorStore> FromFlat(const FlatFactors& flat,
                                                     int version);

private:
  const FactorMatrix user_factors_;
  const FactorMatrix item_factors_;
  const int version_;
};

// Holds the most recently published FactorStore. Publish() replaces both
// matrices in one step, so a reader never sees X and Y from different
// iterations. Subclasses may override Publish() to observe each new
// snapshot; they must still call FactorStoreSlot::Publish().
class FactorStoreSlot {
public:
  virtual ~FactorStoreSlot() { }

  virtual void Publish(std::shared_ptr<const FactorStore> store);

  // NULL until the first Publish().
  std::shared_ptr<const FactorStore> Current() const;

private:
  mutable boost::mutex mutex_;
  std::shared_ptr<const FactorStore> current_;
};

}  // namespace ials
