#pragma once

#include <memory>
#include <string>
#include <vector>

#include "als_solver.hpp"
#include "factor_store.hpp"
#include "interaction_store.hpp"
#include "scorer.hpp"

namespace ials {

// Drives one training run from a data file: reads interactions, trains,
// writes factors and reports recommendations. Settings come from
// util::Context.
class AlsEngine {
public:
  AlsEngine();

  // Reads the row format. The first line holds "#users #items", every
  // following line is a user id followed by item:count pairs, e.g.
  //
  // 3 4
  // 0 0:1 1:3
  // 1 1:1
  // 2 2:5
  void ReadData(const std::string& file);

  // Reads whitespace-separated (user, item, count) triples, one per line,
  // where user>=0 and item>=0. For example:
  //
  // 0 0 1
  // 0 1 3
  // 2 2 5
  //
  // Dimensions are the largest ids seen plus one unless the num_users /
  // num_items settings are positive.
  void ReadSparseMatrix(const std::string& inputfile);

  // Builds the interaction store and trains. Writes <output_file>.X and
  // <output_file>.Y when output_file is non-empty and logs the top_n list of
  // recommend_user when it is >= 0.
  void Start();

  std::string PrintX() const;
  std::string PrintY() const;

  const AlsOptions& options() const { return options_; }
  int num_users() const { return N_; }
  int num_items() const { return M_; }
  const std::vector<Interaction>& interactions() const { return data_; }

  // Valid after Start().
  std::shared_ptr<const InteractionStore> store() const { return store_; }
  std::shared_ptr<const FactorStore> factors() const { return factors_; }
  const std::vector<double>& losses() const { return losses_; }

private:
  // Dimension of the interaction matrix.
  int N_;  // # of users
  int M_;  // # of items

  std::vector<Interaction> data_;
  AlsOptions options_;

  std::string output_file_;
  int recommend_user_;
  int top_n_;

  std::shared_ptr<const InteractionStore> store_;
  std::shared_ptr<const FactorStore> factors_;
  std::vector<double> losses_;
};

}  // namespace ials
