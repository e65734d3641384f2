#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace ials {

// One implicit observation, e.g. the number of times a user checked out an
// item. Indices are dense and zero-based.
struct Interaction {
  int user;
  int item;
  uint32_t count;

  Interaction() : user(0), item(0), count(0) { }
  Interaction(int u, int i, uint32_t c) : user(u), item(i), count(c) { }
};

// (secondary index, count) pair inside a row or column of the store.
struct Entry {
  int index;
  uint32_t count;
};

// Read-only view of a contiguous run of entries.
class EntryRange {
public:
  typedef const Entry* const_iterator;

  EntryRange(const Entry* begin, const Entry* end)
    : begin_(begin), end_(end) { }

  const_iterator begin() const { return begin_; }
  const_iterator end() const { return end_; }
  size_t size() const { return static_cast<size_t>(end_ - begin_); }
  bool empty() const { return begin_ == end_; }
  const Entry& operator[](size_t k) const { return begin_[k]; }

private:
  const Entry* begin_;
  const Entry* end_;
};

// The sparse observation matrix R, held twice: compressed by user (each row
// lists touched items in ascending order) and compressed by item (each column
// lists touching users in ascending order). Immutable once built.
class InteractionStore {
public:
  // Throws InvalidIndex if a record lies outside [0, num_users) x
  // [0, num_items). Records with a zero count are dropped. Duplicate
  // (user, item) pairs are the caller's responsibility.
  InteractionStore(const std::vector<Interaction>& interactions,
                   int num_users, int num_items);

  EntryRange ItemsForUser(int user) const;
  EntryRange UsersForItem(int item) const;

  // Observation count for (user, item), 0 when the pair was never touched.
  uint32_t CountFor(int user, int item) const;
  bool Contains(int user, int item) const;

  int NumUsers() const { return num_users_; }
  int NumItems() const { return num_items_; }
  int64_t NumInteractions() const { return static_cast<int64_t>(by_user_.size()); }

private:
  int num_users_;
  int num_items_;

  // CSR: by_user_[user_ptr_[u] .. user_ptr_[u+1]) are the items of user u.
  std::vector<int64_t> user_ptr_;
  std::vector<Entry> by_user_;

  // CSC: by_item_[item_ptr_[i] .. item_ptr_[i+1]) are the users of item i.
  std::vector<int64_t> item_ptr_;
  std::vector<Entry> by_item_;
};

}  // namespace ials
