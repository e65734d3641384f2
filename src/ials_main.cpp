#include "als_engine.hpp"
#include "ials_error.hpp"
#include <gflags/gflags.h>
#include <glog/logging.h>
#include <string>

// Input
DEFINE_string(data_file, "", "Path to the interaction data file.");
DEFINE_string(input_format, "triples",
    "'triples' for 'user item count' lines, 'rows' for a '#users #items' "
    "header followed by 'user item:count ...' lines.");
DEFINE_int32(num_users, 0,
    "Number of users for 'triples' input (0 infers the largest id + 1).");
DEFINE_int32(num_items, 0,
    "Number of items for 'triples' input (0 infers the largest id + 1).");

// Model
DEFINE_int32(rank, 10, "Number of latent factors k.");
DEFINE_double(lambda, 0.1, "L2 regularization.");
DEFINE_double(alpha, 40.0, "Confidence scale: c = 1 + alpha * count.");
DEFINE_int32(num_iterations, 15, "Number of ALS iterations.");
DEFINE_int32(seed, 12345, "Factor initialization seed.");
DEFINE_int32(num_threads, 0, "Worker threads (0 = hardware concurrency).");
DEFINE_bool(compute_loss, false, "Log the weighted loss every iteration.");

// Output
DEFINE_string(output_file, "",
    "Factors go to output_file.X and output_file.Y. Empty disables.");
DEFINE_int32(recommend_user, -1, "Log recommendations for this user.");
DEFINE_int32(top_n, 10, "Number of recommendations to log.");

int main(int argc, char* argv[]) {
  google::SetUsageMessage("Implicit-feedback ALS matrix factorization");
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);
  if (FLAGS_data_file.empty()) {
    LOG(FATAL) << "usage: need --data_file";
  }

  try {
    ials::AlsEngine als_engine;
    if (FLAGS_input_format == "rows") {
      als_engine.ReadData(FLAGS_data_file);
    } else if (FLAGS_input_format == "triples") {
      als_engine.ReadSparseMatrix(FLAGS_data_file);
    } else {
      LOG(FATAL) << "unknown --input_format " << FLAGS_input_format;
    }
    als_engine.Start();
  } catch (const ials::IalsError& e) {
    LOG(ERROR) << e.what();
    return 1;
  }
  return 0;
}
