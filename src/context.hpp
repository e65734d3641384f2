#pragma once

#include <cstdint>
#include <map>
#include <string>

#include <boost/thread/mutex.hpp>

namespace ials {
namespace util {

// Process-wide configuration. Values come from gflags command line flags;
// set() installs an override that takes precedence (used by tests and by
// embedders that do not parse a command line).
class Context {
public:
  static Context& get_instance();

  int32_t get_int32(const std::string& key);
  double get_double(const std::string& key);
  bool get_bool(const std::string& key);
  std::string get_string(const std::string& key);

  void set(const std::string& key, const std::string& value);
  void clear_overrides();

private:
  Context() { }
  Context(const Context&);
  Context& operator=(const Context&);

  std::string get_raw(const std::string& key);

  boost::mutex mutex_;
  std::map<std::string, std::string> overrides_;
};

}  // namespace util
}  // namespace ials
