#include "context.hpp"

#include <cstdlib>
#include <boost/thread/lock_guard.hpp>
#include <gflags/gflags.h>
#include <glog/logging.h>

namespace ials {
namespace util {

Context& Context::get_instance() {
  static Context instance;
  return instance;
}

std::string Context::get_raw(const std::string& key) {
  {
    boost::lock_guard<boost::mutex> lock(mutex_);
    std::map<std::string, std::string>::const_iterator it =
      overrides_.find(key);
    if (it != overrides_.end()) {
      return it->second;
    }
  }
  std::string value;
  CHECK(google::GetCommandLineOption(key.c_str(), &value))
    << "No flag or override named '" << key << "'";
  return value;
}

int32_t Context::get_int32(const std::string& key) {
  std::string raw = get_raw(key);
  char* end = NULL;
  long value = strtol(raw.c_str(), &end, 10);
  CHECK(end != raw.c_str() && *end == '\0')
    << "Config '" << key << "' is not an integer: " << raw;
  return static_cast<int32_t>(value);
}

double Context::get_double(const std::string& key) {
  std::string raw = get_raw(key);
  char* end = NULL;
  double value = strtod(raw.c_str(), &end);
  CHECK(end != raw.c_str() && *end == '\0')
    << "Config '" << key << "' is not a number: " << raw;
  return value;
}

bool Context::get_bool(const std::string& key) {
  std::string raw = get_raw(key);
  if (raw == "true" || raw == "1") {
    return true;
  }
  CHECK(raw == "false" || raw == "0")
    << "Config '" << key << "' is not a boolean: " << raw;
  return false;
}

std::string Context::get_string(const std::string& key) {
  return get_raw(key);
}

void Context::set(const std::string& key, const std::string& value) {
  boost::lock_guard<boost::mutex> lock(mutex_);
  overrides_[key] = value;
}

void Context::clear_overrides() {
  boost::lock_guard<boost::mutex> lock(mutex_);
  overrides_.clear();
}

}  // namespace util
}  // namespace ials
