#pragma once

#include <atomic>
#include <cstdint>
#include <exception>
#include <memory>
#include <vector>

#include <boost/thread/barrier.hpp>
#include <boost/thread/mutex.hpp>

#include "factor_store.hpp"
#include "ials_error.hpp"

namespace ials {

class InteractionStore;

struct AlsOptions {
  int num_factors;        // k
  double lambda;          // L2 regularization
  double alpha;           // confidence scale
  int num_iterations;
  uint32_t seed;          // initialization RNG seed
  int num_threads;        // 0 picks the hardware concurrency
  bool compute_loss;      // evaluate the objective after every iteration
  double init_scale;      // initial entries are uniform in [-s, s)

  AlsOptions() : num_factors(10), lambda(0.1), alpha(40.0),
    num_iterations(15), seed(12345), num_threads(0), compute_loss(false),
    init_scale(0.1) { }

  // Throws InvalidArgument.
  void Validate() const;
};

// Implicit-feedback alternating least squares (Hu, Koren, Volinsky 2008).
//
// Each iteration recomputes every user row holding the item factors fixed,
// then every item row holding the user factors fixed. For a user u with
// touched items T(u) the row solves
//
//   (Y^T Y + sum_{i in T(u)} (c_ui - 1) y_i y_i^T + lambda I) x_u
//       = sum_{i in T(u)} c_ui y_i
//
// so the work per row is O(|T(u)| k^2 + k^3); the Gramian Y^T Y is formed
// once per half-step. Rows without any touch keep their initial value.
//
// Rows of a half-step are split into contiguous ranges, one per worker
// thread. Workers persist for the whole run and meet at a barrier between
// half-steps; worker 0 forms the Gramian while the others wait.
class AlsSolver {
public:
  // store must outlive the solver. Throws InvalidArgument.
  AlsSolver(const InteractionStore& store, const AlsOptions& options);

  // Seeds X and Y from options.seed. Called by the constructor; call again to
  // restart from scratch.
  void Initialize();

  // Runs options.num_iterations more iterations (fewer if Cancel() is
  // called) and returns the last complete snapshot. Every completed iteration is
  // also published to slot when one is given. Throws SingularSystem.
  std::shared_ptr<const FactorStore> Run(FactorStoreSlot* slot = NULL);

  // Stops Run() at the next iteration boundary. Safe from any thread. The
  // request is consumed by the Run() it stops (or the next one, which then
  // returns at once) and dropped by Initialize().
  void Cancel() { cancel_requested_ = true; }

  // Single half-steps, mostly useful for tests and diagnostics.
  void SolveUsers();
  void SolveItems();

  // Weighted objective over the full user x item grid plus the L2 penalty.
  double Loss() const;

  // Loss after each completed iteration when options.compute_loss is set.
  const std::vector<double>& IterationLosses() const { return losses_; }

  int CompletedIterations() const { return completed_iterations_; }

  const FactorMatrix& UserFactors() const { return X_; }
  const FactorMatrix& ItemFactors() const { return Y_; }

  std::shared_ptr<const FactorStore> Snapshot() const;

private:
  // Solves rows [begin, end) of one side. Stops early once any worker failed.
  void SolveRange(FactorSide side, int begin, int end);

  // Solves a single row into *dst. Throws SingularSystem.
  void SolveRow(FactorSide side, int row, const FactorMatrix& fixed,
      FactorMatrix* dst) const;

  void ComputeGramian(FactorSide side);

  // Body of one worker thread in Run().
  void Worker(int rank, int num_workers, boost::barrier* barrier,
      FactorStoreSlot* slot);

  // Runs one half-step over all rows with a fresh set of workers.
  void HalfStep(FactorSide side);

  void RecordFailure();
  void RethrowFailure();

  const InteractionStore& store_;
  const AlsOptions options_;
  int num_threads_;

  FactorMatrix X_;   // num_users x k
  FactorMatrix Y_;   // num_items x k

  // Gramian of the side held fixed in the current half-step.
  Eigen::MatrixXd gramian_;

  std::vector<double> losses_;
  int completed_iterations_;

  std::atomic<bool> cancel_requested_;
  std::atomic<bool> failed_;
  bool stop_;
  boost::mutex failure_mutex_;
  std::exception_ptr failure_;
};

// Builds and runs a solver. Throws InvalidArgument or SingularSystem.
std::shared_ptr<const FactorStore> Train(const InteractionStore& store,
    const AlsOptions& options);

}  // namespace ials
