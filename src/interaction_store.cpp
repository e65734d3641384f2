#include "interaction_store.hpp"
#include "ials_error.hpp"
#include "high_resolution_timer.hpp"

#include <algorithm>
#include <sstream>
#include <glog/logging.h>

namespace ials {

namespace {

// Counting-sort transpose of a compressed matrix with num_in primary rows
// into num_out primary rows. Visiting input rows in ascending order leaves
// every output row sorted by its secondary index.
void Transpose(const std::vector<int64_t>& in_ptr,
    const std::vector<Entry>& in_entries, int num_out,
    std::vector<int64_t>* out_ptr, std::vector<Entry>* out_entries) {
  out_ptr->assign(num_out + 1, 0);
  for (size_t k = 0; k < in_entries.size(); ++k) {
    ++(*out_ptr)[in_entries[k].index + 1];
  }
  for (int r = 0; r < num_out; ++r) {
    (*out_ptr)[r + 1] += (*out_ptr)[r];
  }
  out_entries->resize(in_entries.size());
  std::vector<int64_t> next(out_ptr->begin(), out_ptr->end() - 1);
  const int num_in = static_cast<int>(in_ptr.size()) - 1;
  for (int r = 0; r < num_in; ++r) {
    for (int64_t k = in_ptr[r]; k < in_ptr[r + 1]; ++k) {
      Entry& e = (*out_entries)[next[in_entries[k].index]++];
      e.index = r;
      e.count = in_entries[k].count;
    }
  }
}

}  // anonymous namespace

InteractionStore::InteractionStore(
    const std::vector<Interaction>& interactions, int num_users,
    int num_items) : num_users_(num_users), num_items_(num_items) {
  util::HighResolutionTimer timer;
  if (num_users < 0 || num_items < 0) {
    std::ostringstream ss;
    ss << "negative dimensions (" << num_users << ", " << num_items << ")";
    throw InvalidIndex(ss.str());
  }

  // First pass: validate and bucket by user, in input order.
  user_ptr_.assign(num_users_ + 1, 0);
  int64_t dropped = 0;
  for (size_t k = 0; k < interactions.size(); ++k) {
    const Interaction& rec = interactions[k];
    if (rec.user < 0 || rec.user >= num_users_ ||
        rec.item < 0 || rec.item >= num_items_) {
      std::ostringstream ss;
      ss << "record " << k << " (" << rec.user << ", " << rec.item
         << ") outside [0, " << num_users_ << ") x [0, " << num_items_ << ")";
      throw InvalidIndex(ss.str());
    }
    if (rec.count == 0) {
      VLOG(1) << "Dropping zero-count record (" << rec.user << ", "
        << rec.item << ")";
      ++dropped;
      continue;
    }
    ++user_ptr_[rec.user + 1];
  }
  for (int u = 0; u < num_users_; ++u) {
    user_ptr_[u + 1] += user_ptr_[u];
  }
  std::vector<Entry> unordered(user_ptr_[num_users_]);
  std::vector<int64_t> next(user_ptr_.begin(), user_ptr_.end() - 1);
  for (size_t k = 0; k < interactions.size(); ++k) {
    const Interaction& rec = interactions[k];
    if (rec.count == 0) {
      continue;
    }
    Entry& e = unordered[next[rec.user]++];
    e.index = rec.item;
    e.count = rec.count;
  }

  // Two transposes: the first sorts users inside each item column, the
  // second sorts items inside each user row.
  Transpose(user_ptr_, unordered, num_items_, &item_ptr_, &by_item_);
  Transpose(item_ptr_, by_item_, num_users_, &user_ptr_, &by_user_);

  LOG(INFO) << "Built interaction store: " << num_users_ << " users, "
    << num_items_ << " items, " << by_user_.size() << " interactions ("
    << dropped << " zero-count dropped) in " << timer.elapsed()
    << " seconds.";
}

EntryRange InteractionStore::ItemsForUser(int user) const {
  CHECK_GE(user, 0);
  CHECK_LT(user, num_users_);
  const Entry* base = by_user_.data();
  return EntryRange(base + user_ptr_[user], base + user_ptr_[user + 1]);
}

EntryRange InteractionStore::UsersForItem(int item) const {
  CHECK_GE(item, 0);
  CHECK_LT(item, num_items_);
  const Entry* base = by_item_.data();
  return EntryRange(base + item_ptr_[item], base + item_ptr_[item + 1]);
}

uint32_t InteractionStore::CountFor(int user, int item) const {
  if (user < 0 || user >= num_users_ || item < 0 || item >= num_items_) {
    return 0;
  }
  EntryRange row = ItemsForUser(user);
  const Entry* it = std::lower_bound(row.begin(), row.end(), item,
      [](const Entry& e, int target) { return e.index < target; });
  if (it != row.end() && it->index == item) {
    return it->count;
  }
  return 0;
}

bool InteractionStore::Contains(int user, int item) const {
  return CountFor(user, item) > 0;
}

}  // namespace ials
