#ifndef HAPLOMIX_EM_H_
#define HAPLOMIX_EM_H_

#include <vector>

#include <Eigen/Dense>
#include <absl/random/bit_gen_ref.h>

#include "ctpl_stl.h"

namespace haplomix {

// Mixture proportions by Expectation-Maximization
// ===============================================
//
// We observe reads j = 0..J-1, each of which originates from one of the haplogroups g = 0..G-1 in a
// mixture with (unknown) proportions theta_g.  The input is the J x G matrix of log-likelihoods
// `read_hap_mat(j,g) = log P(read j | haplogroup g)` and a weight w_j per read (usually the number of
// times that a read was observed).  EM alternates between
//
//  E-step: z_jg = theta_g P(j|g) / sum_g' theta_g' P(j|g')       (posterior that read j came from g)
//  M-step: theta_g = sum_j w_j z_jg / sum_g' sum_j w_j z_jg'      (new mixture proportions)
//
// All of this is done in log space, so both z ("read_mix") and theta ("props") are held as logs.

// Reads x haplogroups.  Row-major, since the E-step works one read at a time
using Read_hap_matrix = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

struct Em_options {
  double init_alpha = 1.0;   // Concentration of the symmetric Dirichlet from which initial proportions are drawn
  double tolerance = 1e-4;   // Stop when sum_g |theta_g - theta_g'| between consecutive estimates drops below this
  int max_iter = 1000;       // Max EM steps per restart (not converging is not an error)
  int n_multi = 1;           // Number of independent restarts, averaged geometrically at the end
  bool verbose = false;      // Progress to std::cerr
};

// Outcome of one EM restart (log space)
struct Em_run {
  Eigen::VectorXd log_props{};
  Read_hap_matrix log_read_mix{};
  int iterations{0};
  bool converged{false};
};

// Outcome of `run_em` (natural space)
struct Em_result {
  Eigen::VectorXd props{};            // one per haplogroup
  Read_hap_matrix read_mix{};         // same shape as the input matrix
  std::vector<int> iterations{};      // per restart
  std::vector<bool> converged{};      // per restart
};

// Log of a draw from a symmetric Dirichlet(alpha, ..., alpha).
// The underlying Gamma draws are made in log space, so tiny `alpha` never underflows to log(0) = -inf.
auto init_ln_props(int num_haps, double alpha, absl::BitGenRef bitgen) -> Eigen::VectorXd;

// True if sum_g |exp(ln_props[g]) - exp(last_ln_props[g])| < tolerance
auto converged(const Eigen::VectorXd& ln_props, const Eigen::VectorXd& last_ln_props, double tolerance) -> bool;

// One E-step followed by one M-step.  Overwrites `read_mix_mat` with the log posteriors computed from
// `ln_props`, then `new_props` with the resulting log proportions (both are resized as needed).
// Throws std::invalid_argument if `weights` or `ln_props` don't match `read_hap_mat`.
auto em_step(
    const Read_hap_matrix& read_hap_mat,
    const Eigen::VectorXd& weights,
    const Eigen::VectorXd& ln_props,
    Read_hap_matrix& read_mix_mat,
    Eigen::VectorXd& new_props)
    -> void;

// Throws std::invalid_argument unless `read_hap_mat`, `weights` and `options` make sense together
auto check_em_inputs(
    const Read_hap_matrix& read_hap_mat,
    const Eigen::VectorXd& weights,
    const Em_options& options)
    -> void;

// A single EM restart from the given initial log proportions.  Runs until convergence or
// `options.max_iter` steps, whichever comes first, and returns the last estimate either way.
// `options.n_multi` and `options.init_alpha` are ignored here.
// Throws std::invalid_argument if `options.max_iter < 1` or if the shapes don't line up.
auto run_em_once(
    const Read_hap_matrix& read_hap_mat,
    const Eigen::VectorXd& weights,
    Eigen::VectorXd ln_init_props,
    const Em_options& options)
    -> Em_run;

// Full EM: `options.n_multi` restarts, each from its own Dirichlet draw (all drawn from `bitgen` up front,
// in restart order).  If `thread_pool` is given, restarts run on it concurrently.
//
// Restarts are combined by averaging their *log* proportions and *log* posteriors and exponentiating
// once at the end, i.e., a geometric mean.  Nothing is renormalized afterwards, so with n_multi > 1 the
// proportions and each posterior row can sum to slightly less than 1.
auto run_em(
    const Read_hap_matrix& read_hap_mat,
    const Eigen::VectorXd& weights,
    const Em_options& options,
    absl::BitGenRef bitgen,
    ctpl::thread_pool* thread_pool = nullptr)
    -> Em_result;

}  // namespace haplomix

#endif // HAPLOMIX_EM_H_
