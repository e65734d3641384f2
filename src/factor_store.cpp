#include "factor_store.hpp"
#include "ials_error.hpp"

#include <sstream>
#include <boost/thread/lock_guard.hpp>
#include <glog/logging.h>

namespace ials {

FactorStore::FactorStore(const FactorMatrix& user_factors,
    const FactorMatrix& item_factors, int version)
  : user_factors_(user_factors), item_factors_(item_factors),
  version_(version) {
  CHECK_EQ(user_factors_.cols(), item_factors_.cols())
    << "user and item factors disagree on the number of factors";
}

FlatFactors FactorStore::Export() const {
  FlatFactors flat;
  flat.user_rows = NumUsers();
  flat.item_rows = NumItems();
  flat.num_factors = NumFactors();
  flat.user_factors.assign(user_factors_.data(),
      user_factors_.data() + user_factors_.size());
  flat.item_factors.assign(item_factors_.data(),
      item_factors_.data() + item_factors_.size());
  return flat;
}

std::shared_ptr<const FactorStore> FactorStore::FromFlat(
    const FlatFactors& flat, int version) {
  if (flat.user_rows < 0 || flat.item_rows < 0 || flat.num_factors <= 0 ||
      flat.user_factors.size() !=
        static_cast<size_t>(flat.user_rows) * flat.num_factors ||
      flat.item_factors.size() !=
        static_cast<size_t>(flat.item_rows) * flat.num_factors) {
    std::ostringstream ss;
    ss << "flat factors do not match shapes (" << flat.user_rows << ", "
       << flat.num_factors << ") and (" << flat.item_rows << ", "
       << flat.num_factors << "): got " << flat.user_factors.size()
       << " and " << flat.item_factors.size() << " values";
    throw InvalidArgument(ss.str());
  }
  FactorMatrix user_factors = Eigen::Map<const FactorMatrix>(
      flat.user_factors.data(), flat.user_rows, flat.num_factors);
  FactorMatrix item_factors = Eigen::Map<const FactorMatrix>(
      flat.item_factors.data(), flat.item_rows, flat.num_factors);
  return std::make_shared<FactorStore>(user_factors, item_factors,
      version);
}

void FactorStoreSlot::Publish(std::shared_ptr<const FactorStore> store) {
  boost::lock_guard<boost::mutex> lock(mutex_);
  current_.swap(store);
}

std::shared_ptr<const FactorStore> FactorStoreSlot::Current() const {
  boost::lock_guard<boost::mutex> lock(mutex_);
  return current_;
}

}  // namespace ials
