#include "als_engine.hpp"
#include "context.hpp"
#include "high_resolution_timer.hpp"
#include "ials_error.hpp"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <boost/format.hpp>
#include <glog/logging.h>

namespace ials {

namespace {

void ThrowParseError(const std::string& file, int line_no,
    const std::string& what) {
  std::ostringstream ss;
  ss << file << ":" << line_no << ": " << what;
  throw InvalidArgument(ss.str());
}

// Largest id a data file may name; the inferred dimension is id + 1.
const long long kMaxId = INT_MAX - 1;

// Parses a base-10 integer in [min_value, max_value] starting at begin.
// *end is left just past the digits.
bool ParseInteger(const char* begin, char** end, long long min_value,
    long long max_value, long long* value) {
  errno = 0;
  long long v = strtoll(begin, end, 10);
  if (*end == begin || errno == ERANGE || v < min_value || v > max_value) {
    return false;
  }
  *value = v;
  return true;
}

bool IsSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

const char* SkipSpace(const char* ptr) {
  while (IsSpace(*ptr)) ++ptr;
  return ptr;
}

void WriteFile(const std::string& path, const std::string& contents) {
  std::ofstream stream(path.c_str());
  if (!stream) {
    throw InvalidArgument("cannot open " + path + " for writing");
  }
  stream << contents;
  LOG(INFO) << "Wrote " << path;
}

std::string PrintMatrix(const FactorMatrix& m) {
  std::stringstream ss;
  for (int i = 0; i < m.rows(); ++i) {
    for (int j = 0; j < m.cols(); ++j) {
      ss << m(i, j) << " ";
    }
    ss << std::endl;
  }
  return ss.str();
}

}  // anonymous namespace

AlsEngine::AlsEngine() : N_(0), M_(0) {
  util::Context& context = util::Context::get_instance();
  options_.num_factors = context.get_int32("rank");
  options_.lambda = context.get_double("lambda");
  options_.alpha = context.get_double("alpha");
  options_.num_iterations = context.get_int32("num_iterations");
  options_.seed = static_cast<uint32_t>(context.get_int32("seed"));
  options_.num_threads = context.get_int32("num_threads");
  options_.compute_loss = context.get_bool("compute_loss");
  output_file_ = context.get_string("output_file");
  recommend_user_ = context.get_int32("recommend_user");
  top_n_ = context.get_int32("top_n");
  options_.Validate();
}

void AlsEngine::ReadData(const std::string& file) {
  util::HighResolutionTimer timer;
  char *line = NULL, *ptr = NULL, *endptr = NULL;
  size_t num_bytes = 0;
  FILE *data_stream = fopen(file.c_str(), "r");
  if (data_stream == NULL) {
    throw InvalidArgument("cannot open data file " + file);
  }
  LOG(INFO) << "Reading from data file " << file;
  data_.clear();

  // Read first line: #-users #-items
  int line_no = 1;
  if (getline(&line, &num_bytes, data_stream) == -1) {
    free(line);
    fclose(data_stream);
    ThrowParseError(file, line_no, "missing '#users #items' header");
  }
  long long value = 0;
  bool header_ok = ParseInteger(line, &endptr, 0, INT_MAX, &value);
  N_ = static_cast<int>(value);
  ptr = endptr;
  header_ok = header_ok && ParseInteger(ptr, &endptr, 0, INT_MAX, &value);
  M_ = static_cast<int>(value);
  if (!header_ok || *SkipSpace(endptr) != '\0') {
    free(line);
    fclose(data_stream);
    ThrowParseError(file, line_no, "bad '#users #items' header");
  }
  LOG(INFO) << "(#-users, #-items) = (" << N_ << ", " << M_ << ")";

  std::string error;
  while (error.empty() && getline(&line, &num_bytes, data_stream) != -1) {
    ++line_no;
    if (*SkipSpace(line) == '\0') {
      continue;   // blank line
    }
    long long user = 0;   // Read the user id.
    if (!ParseInteger(line, &endptr, 0, kMaxId, &user)) {
      error = "expected a user id";
      break;
    }
    ptr = endptr;
    while (true) {
      if (!IsSpace(*ptr) && *ptr != '\0') {
        error = "expected whitespace between item:count pairs";
        break;
      }
      while (IsSpace(*ptr)) ++ptr;  // goto next non-space char
      if (*ptr == '\0') {
        break;
      }
      // read an item:count pair
      long long item = 0;
      if (!ParseInteger(ptr, &endptr, 0, kMaxId, &item) || *endptr != ':') {
        error = "expected item:count";
        break;
      }
      ptr = endptr + 1;
      long long count = 0;
      if (IsSpace(*ptr) ||
          !ParseInteger(ptr, &endptr, 0, UINT32_MAX, &count)) {
        error = "expected a count in [0, 2^32)";
        break;
      }
      ptr = endptr;
      data_.push_back(Interaction(static_cast<int>(user),
            static_cast<int>(item), static_cast<uint32_t>(count)));
    }
  }
  free(line);
  fclose(data_stream);
  if (!error.empty()) {
    ThrowParseError(file, line_no, error);
  }
  LOG(INFO) << "Done reading " << data_.size() << " interactions in "
    << timer.elapsed() << " seconds.";
}

void AlsEngine::ReadSparseMatrix(const std::string& inputfile) {
  util::HighResolutionTimer timer;
  data_.clear();
  N_ = 0;
  M_ = 0;
  std::ifstream inputstream(inputfile.c_str());
  if (!inputstream) {
    throw InvalidArgument("cannot open data file " + inputfile);
  }
  std::string line;
  int line_no = 0;
  while (std::getline(inputstream, line)) {
    ++line_no;
    const char* ptr = line.c_str();
    if (*SkipSpace(ptr) == '\0') {
      continue;   // blank line
    }
    char* endptr = NULL;
    long long user = 0, item = 0, count = 0;
    bool ok = ParseInteger(ptr, &endptr, 0, kMaxId, &user);
    ok = ok && IsSpace(*endptr) &&
      ParseInteger(endptr, &endptr, 0, kMaxId, &item);
    ok = ok && IsSpace(*endptr) &&
      ParseInteger(endptr, &endptr, 0, UINT32_MAX, &count);
    if (!ok || *SkipSpace(endptr) != '\0') {
      ThrowParseError(inputfile, line_no, "expected 'user item count'");
    }
    data_.push_back(Interaction(static_cast<int>(user), static_cast<int>(item),
          static_cast<uint32_t>(count)));
    N_ = std::max(N_, static_cast<int>(user) + 1);
    M_ = std::max(M_, static_cast<int>(item) + 1);
  }
  util::Context& context = util::Context::get_instance();
  if (context.get_int32("num_users") > 0) {
    N_ = context.get_int32("num_users");
  }
  if (context.get_int32("num_items") > 0) {
    M_ = context.get_int32("num_items");
  }
  LOG(INFO) << "Done reading " << data_.size() << " interactions in "
    << timer.elapsed() << " seconds. (N, M) = (" << N_ << ", " << M_ << ")";
}

void AlsEngine::Start() {
  store_ = std::make_shared<InteractionStore>(data_, N_, M_);

  AlsSolver solver(*store_, options_);
  factors_ = solver.Run();
  losses_ = solver.IterationLosses();

  if (!output_file_.empty()) {
    WriteFile((boost::format("%s.X") % output_file_).str(), PrintX());
    WriteFile((boost::format("%s.Y") % output_file_).str(), PrintY());
  }

  if (recommend_user_ >= 0) {
    Scorer scorer(factors_, store_);
    std::vector<ScoredItem> recs = scorer.Recommend(recommend_user_, top_n_);
    std::stringstream ss;
    for (size_t r = 0; r < recs.size(); ++r) {
      ss << " " << recs[r].item << ":" << recs[r].score;
    }
    LOG(INFO) << "Top " << top_n_ << " for user " << recommend_user_ << ":"
      << ss.str();
  }
}

std::string AlsEngine::PrintX() const {
  CHECK(factors_) << "PrintX() before Start()";
  return PrintMatrix(factors_->UserFactors());
}

std::string AlsEngine::PrintY() const {
  CHECK(factors_) << "PrintY() before Start()";
  return PrintMatrix(factors_->ItemFactors());
}

}  // namespace ials
