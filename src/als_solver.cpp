#include "als_solver.hpp"
#include "confidence_model.hpp"
#include "interaction_store.hpp"
#include "high_resolution_timer.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <sstream>
#include <boost/thread/lock_guard.hpp>
#include <boost/thread/thread.hpp>
#include <glog/logging.h>

namespace ials {

namespace {

// Reciprocal condition estimates of the k x k normal equation. Below
// kSingularRcond the system is treated as singular; rounding noise alone
// keeps an exactly rank deficient Cholesky pivot around 1e-16. Between the
// two the solve is logged and kept.
const double kSingularRcond = 1e-12;
const double kIllConditionedRcond = 1e-8;

int64_t RangeBegin(int num_rows, int rank, int num_workers) {
  return static_cast<int64_t>(num_rows) * rank / num_workers;
}

const char* SideName(FactorSide side) {
  return side == FactorSide::kUser ? "user" : "item";
}

}  // anonymous namespace

void AlsOptions::Validate() const {
  std::ostringstream ss;
  if (num_factors <= 0) {
    ss << "num_factors must be positive, got " << num_factors;
  } else if (!(lambda >= 0.0)) {
    ss << "lambda must be non-negative, got " << lambda;
  } else if (!(alpha >= 0.0)) {
    ss << "alpha must be non-negative, got " << alpha;
  } else if (num_iterations <= 0) {
    ss << "num_iterations must be positive, got " << num_iterations;
  } else if (num_threads < 0) {
    ss << "num_threads must be non-negative, got " << num_threads;
  } else if (!(init_scale > 0.0)) {
    ss << "init_scale must be positive, got " << init_scale;
  } else {
    return;
  }
  throw InvalidArgument(ss.str());
}

AlsSolver::AlsSolver(const InteractionStore& store, const AlsOptions& options)
  : store_(store), options_(options), num_threads_(options.num_threads),
  completed_iterations_(0), cancel_requested_(false), failed_(false),
  stop_(false) {
  options_.Validate();
  if (num_threads_ == 0) {
    num_threads_ = std::max(1u, boost::thread::hardware_concurrency());
  }
  X_.resize(store_.NumUsers(), options_.num_factors);
  Y_.resize(store_.NumItems(), options_.num_factors);
  Initialize();
}

void AlsSolver::Initialize() {
  std::mt19937 rng_engine(options_.seed);
  std::uniform_real_distribution<double> dist(-options_.init_scale,
      options_.init_scale);
  for (int u = 0; u < X_.rows(); ++u) {
    for (int k = 0; k < X_.cols(); ++k) {
      X_(u, k) = dist(rng_engine);
    }
  }
  for (int i = 0; i < Y_.rows(); ++i) {
    for (int k = 0; k < Y_.cols(); ++k) {
      Y_(i, k) = dist(rng_engine);
    }
  }
  losses_.clear();
  completed_iterations_ = 0;
  cancel_requested_ = false;
}

void AlsSolver::ComputeGramian(FactorSide side) {
  const FactorMatrix& fixed = side == FactorSide::kUser ? Y_ : X_;
  gramian_.noalias() = fixed.transpose() * fixed;
}

void AlsSolver::SolveRow(FactorSide side, int row, const FactorMatrix& fixed,
    FactorMatrix* dst) const {
  const EntryRange touched = side == FactorSide::kUser ?
    store_.ItemsForUser(row) : store_.UsersForItem(row);
  if (touched.empty()) {
    // Nothing to learn from; the row keeps its initialization.
    return;
  }

  const int k = options_.num_factors;
  Eigen::MatrixXd A = gramian_;
  Eigen::VectorXd b = Eigen::VectorXd::Zero(k);
  for (EntryRange::const_iterator it = touched.begin(); it != touched.end();
      ++it) {
    const double c = ConfidenceModel::Confidence(it->count, options_.alpha);
    const Eigen::VectorXd f = fixed.row(it->index).transpose();
    // Only the lower triangle of A is maintained from here on.
    A.selfadjointView<Eigen::Lower>().rankUpdate(f, c - 1.0);
    b.noalias() += c * f;
  }
  A.diagonal().array() += options_.lambda;

  Eigen::LLT<Eigen::MatrixXd, Eigen::Lower> llt(A);
  const double rcond = llt.info() == Eigen::Success ? llt.rcond() : 0.0;
  if (!(rcond > kSingularRcond)) {
    std::ostringstream ss;
    ss << "normal equation for " << SideName(side) << " " << row
       << " is not positive definite (rcond " << rcond << ", lambda "
       << options_.lambda << ")";
    throw SingularSystem(side, row, ss.str());
  }
  if (rcond < kIllConditionedRcond) {
    LOG(WARNING) << "Ill-conditioned normal equation for " << SideName(side)
      << " " << row << ": rcond = " << rcond;
  }
  Eigen::VectorXd x = llt.solve(b);
  if (!x.allFinite()) {
    std::ostringstream ss;
    ss << "non-finite solution for " << SideName(side) << " " << row;
    throw SingularSystem(side, row, ss.str());
  }
  dst->row(row) = x.transpose();
}

void AlsSolver::SolveRange(FactorSide side, int begin, int end) {
  const FactorMatrix& fixed = side == FactorSide::kUser ? Y_ : X_;
  FactorMatrix* dst = side == FactorSide::kUser ? &X_ : &Y_;
  for (int row = begin; row < end; ++row) {
    if (failed_) {
      return;
    }
    try {
      SolveRow(side, row, fixed, dst);
    } catch (...) {
      RecordFailure();
      return;
    }
  }
}

void AlsSolver::RecordFailure() {
  boost::lock_guard<boost::mutex> lock(failure_mutex_);
  if (!failure_) {
    failure_ = std::current_exception();
  }
  failed_ = true;
}

void AlsSolver::RethrowFailure() {
  if (failure_) {
    std::exception_ptr failure = failure_;
    failure_ = std::exception_ptr();
    failed_ = false;
    std::rethrow_exception(failure);
  }
}

void AlsSolver::HalfStep(FactorSide side) {
  failed_ = false;
  ComputeGramian(side);
  const int num_rows = side == FactorSide::kUser ?
    store_.NumUsers() : store_.NumItems();
  boost::thread_group workers;
  for (int rank = 0; rank < num_threads_; ++rank) {
    const int begin = RangeBegin(num_rows, rank, num_threads_);
    const int end = RangeBegin(num_rows, rank + 1, num_threads_);
    workers.create_thread([this, side, begin, end]() {
      SolveRange(side, begin, end);
    });
  }
  workers.join_all();
  RethrowFailure();
}

void AlsSolver::SolveUsers() {
  HalfStep(FactorSide::kUser);
}

void AlsSolver::SolveItems() {
  HalfStep(FactorSide::kItem);
}

void AlsSolver::Worker(int rank, int num_workers, boost::barrier* barrier,
    FactorStoreSlot* slot) {
  const int num_users = store_.NumUsers();
  const int num_items = store_.NumItems();
  const bool is_leading = rank == 0;
  const int user_begin = RangeBegin(num_users, rank, num_workers);
  const int user_end = RangeBegin(num_users, rank + 1, num_workers);
  const int item_begin = RangeBegin(num_items, rank, num_workers);
  const int item_end = RangeBegin(num_items, rank + 1, num_workers);

  for (int iter = 0; iter < options_.num_iterations; ++iter) {
    util::HighResolutionTimer iter_timer;

    // X given Y.
    if (is_leading) {
      ComputeGramian(FactorSide::kUser);
    }
    barrier->wait();
    SolveRange(FactorSide::kUser, user_begin, user_end);
    barrier->wait();

    // Y given X.
    if (is_leading && !failed_) {
      ComputeGramian(FactorSide::kItem);
    }
    barrier->wait();
    SolveRange(FactorSide::kItem, item_begin, item_end);
    barrier->wait();

    if (is_leading) {
      if (!failed_) {
        try {
          const int version = completed_iterations_ + 1;
          std::ostringstream loss_str;
          double loss = 0.0;
          if (options_.compute_loss) {
            loss = Loss();
            loss_str << ", loss = " << loss;
          }
          if (slot != NULL) {
            slot->Publish(std::make_shared<FactorStore>(X_, Y_, version));
          }
          // The iteration counts as complete only once it is published.
          if (options_.compute_loss) {
            losses_.push_back(loss);
          }
          completed_iterations_ = version;
          LOG(INFO) << "Iteration " << completed_iterations_ << "/"
            << options_.num_iterations << loss_str.str() << ". Time = "
            << iter_timer.elapsed() << " seconds.";
        } catch (...) {
          RecordFailure();
        }
      }
      stop_ = failed_ || cancel_requested_;
    }
    barrier->wait();
    if (stop_) {
      break;
    }
  }
}

std::shared_ptr<const FactorStore> AlsSolver::Run(FactorStoreSlot* slot) {
  if (cancel_requested_.exchange(false)) {
    LOG(INFO) << "Training cancelled before the first iteration.";
    return Snapshot();
  }
  util::HighResolutionTimer timer;
  const int start_iterations = completed_iterations_;
  failed_ = false;
  stop_ = false;
  LOG(INFO) << "Training ALS: " << store_.NumUsers() << " users, "
    << store_.NumItems() << " items, " << store_.NumInteractions()
    << " interactions, k = " << options_.num_factors << ", lambda = "
    << options_.lambda << ", alpha = " << options_.alpha << ", "
    << num_threads_ << " threads.";

  boost::barrier barrier(num_threads_);
  boost::thread_group workers;
  for (int rank = 0; rank < num_threads_; ++rank) {
    const int num_workers = num_threads_;
    workers.create_thread([this, rank, num_workers, &barrier, slot]() {
      Worker(rank, num_workers, &barrier, slot);
    });
  }
  workers.join_all();
  // A cancel applies to one Run() only.
  const bool cancelled = cancel_requested_.exchange(false);
  RethrowFailure();

  if (cancelled &&
      completed_iterations_ - start_iterations < options_.num_iterations) {
    LOG(INFO) << "Training cancelled after " << completed_iterations_
      << " iterations.";
  }
  LOG(INFO) << "Training done in " << timer.elapsed() << " seconds.";
  return Snapshot();
}

double AlsSolver::Loss() const {
  // Sum over every (u, i) of (x_u . y_i)^2, as if all pairs were untouched.
  const Eigen::MatrixXd XtX = X_.transpose() * X_;
  const Eigen::MatrixXd YtY = Y_.transpose() * Y_;
  double loss = (XtX.array() * YtY.array()).sum();

  // Replace the untouched term by c (1 - s)^2 on the touched pairs.
  for (int u = 0; u < store_.NumUsers(); ++u) {
    const EntryRange items = store_.ItemsForUser(u);
    for (EntryRange::const_iterator it = items.begin(); it != items.end();
        ++it) {
      const double s = X_.row(u).dot(Y_.row(it->index));
      const double c = ConfidenceModel::Confidence(it->count, options_.alpha);
      loss += c * (1.0 - s) * (1.0 - s) - s * s;
    }
  }
  loss += options_.lambda * (X_.squaredNorm() + Y_.squaredNorm());
  return loss;
}

std::shared_ptr<const FactorStore> AlsSolver::Snapshot() const {
  return std::make_shared<FactorStore>(X_, Y_, completed_iterations_);
}

std::shared_ptr<const FactorStore> Train(const InteractionStore& store,
    const AlsOptions& options) {
  AlsSolver solver(store, options);
  return solver.Run();
}

}  // namespace ials
