#pragma once

#include <stdexcept>
#include <string>

namespace ials {

// Base class of every error raised by the library.
class IalsError : public std::runtime_error {
public:
  explicit IalsError(const std::string& message)
    : std::runtime_error(message) { }
};

// An interaction references a user or item outside the densified range.
// Indicates a broken upstream id mapping; fatal to the training run.
class InvalidIndex : public IalsError {
public:
  explicit InvalidIndex(const std::string& message) : IalsError(message) { }
};

// Bad hyperparameters, malformed input lines or mismatched factor shapes.
class InvalidArgument : public IalsError {
public:
  explicit InvalidArgument(const std::string& message) : IalsError(message) { }
};

enum class FactorSide {
  kUser,
  kItem
};

// A regularized normal equation for one factor row was not positive
// definite. Reachable when lambda is zero or negligible against degenerate
// factors.
class SingularSystem : public IalsError {
public:
  SingularSystem(FactorSide side, int row, const std::string& message)
    : IalsError(message), side_(side), row_(row) { }

  FactorSide side() const { return side_; }
  int row() const { return row_; }

private:
  FactorSide side_;
  int row_;
};

class UnknownUser : public IalsError {
public:
  explicit UnknownUser(int user)
    : IalsError("unknown user " + std::to_string(user)), user_(user) { }

  int user() const { return user_; }

private:
  int user_;
};

class UnknownItem : public IalsError {
public:
  explicit UnknownItem(int item)
    : IalsError("unknown item " + std::to_string(item)), item_(item) { }

  int item() const { return item_; }

private:
  int item_;
};

}  // namespace ials
