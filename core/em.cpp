#include "em.h"

#include <cmath>
#include <future>
#include <iostream>
#include <random>
#include <stdexcept>

#include <absl/log/check.h>
#include <absl/random/distributions.h>
#include <absl/strings/str_format.h>

#include "log_space.h"

namespace haplomix {

auto init_ln_props(int num_haps, double alpha, absl::BitGenRef bitgen) -> Eigen::VectorXd {
  // For alpha < 1, Gamma(alpha) draws routinely underflow to 0.  Instead, we use
  // X ~ Gamma(alpha+1), U ~ Uniform(0,1)  =>  X U^(1/alpha) ~ Gamma(alpha), and take logs of both factors.
  auto boosted = alpha < 1.0;
  auto gamma = std::gamma_distribution<double>{boosted ? alpha + 1.0 : alpha, 1.0};

  auto ln_props = Eigen::VectorXd(num_haps);
  for (auto g = 0; g != num_haps; ++g) {
    ln_props(g) = std::log(gamma(bitgen));
    if (boosted) {
      ln_props(g) += std::log(absl::Uniform(absl::IntervalOpenOpen, bitgen, 0.0, 1.0)) / alpha;
    }
  }
  normalize_in_log_space(ln_props);
  return ln_props;
}

auto converged(const Eigen::VectorXd& ln_props, const Eigen::VectorXd& last_ln_props, double tolerance) -> bool {
  DCHECK_EQ(ln_props.size(), last_ln_props.size());
  auto total_change = (ln_props.array().exp() - last_ln_props.array().exp()).abs().sum();
  return total_change < tolerance;
}

auto em_step(
    const Read_hap_matrix& read_hap_mat,
    const Eigen::VectorXd& weights,
    const Eigen::VectorXd& ln_props,
    Read_hap_matrix& read_mix_mat,
    Eigen::VectorXd& new_props)
    -> void {

  auto num_reads = read_hap_mat.rows();
  auto num_haps = read_hap_mat.cols();
  if (ln_props.size() != num_haps) {
    throw std::invalid_argument(absl::StrFormat(
        "Proportion vector has %d entries, but there are %d haplogroups", ln_props.size(), num_haps));
  }
  if (weights.size() != num_reads) {
    throw std::invalid_argument(absl::StrFormat(
        "There are %d weights for %d reads", weights.size(), num_reads));
  }

  // E-step: z_jg - probability that read j originates from haplogroup g given the current proportions
  read_mix_mat = read_hap_mat.rowwise() + ln_props.transpose();
  for (auto j = Eigen::Index{0}; j != num_reads; ++j) {
    normalize_in_log_space(read_mix_mat.row(j));
  }

  // M-step: theta_g - contribution of g to the mixture
  new_props.resize(num_haps);
  for (auto g = Eigen::Index{0}; g != num_haps; ++g) {
    new_props(g) = log_sum_exp(read_mix_mat.col(g), weights);
  }
  normalize_in_log_space(new_props);
}

static auto check_max_iter(int max_iter) -> void {
  if (max_iter < 1) {
    throw std::invalid_argument(absl::StrFormat(
        "There must be at least 1 EM iteration per run (got %d)", max_iter));
  }
}

auto check_em_inputs(
    const Read_hap_matrix& read_hap_mat,
    const Eigen::VectorXd& weights,
    const Em_options& options)
    -> void {

  if (read_hap_mat.cols() == 0) {
    throw std::invalid_argument("Read-haplogroup matrix has no haplogroups");
  }
  if (weights.size() != read_hap_mat.rows()) {
    throw std::invalid_argument(absl::StrFormat(
        "There are %d weights for %d reads", weights.size(), read_hap_mat.rows()));
  }
  for (auto j = Eigen::Index{0}; j != weights.size(); ++j) {
    if (not (weights(j) >= 0.0) || std::isinf(weights(j))) {
      throw std::invalid_argument(absl::StrFormat("Weight of read %d is %g", j, weights(j)));
    }
  }
  if (read_hap_mat.array().isNaN().any()) {
    throw std::invalid_argument("Read-haplogroup matrix contains NaN log-likelihoods");
  }
  if ((read_hap_mat.array() == k_pos_inf).any()) {
    throw std::invalid_argument("Read-haplogroup matrix contains +inf log-likelihoods");
  }

  if (not (options.init_alpha > 0.0)) {
    throw std::invalid_argument(absl::StrFormat(
        "Dirichlet concentration must be positive (got %g)", options.init_alpha));
  }
  if (not (options.tolerance >= 0.0)) {
    throw std::invalid_argument(absl::StrFormat(
        "Convergence tolerance must be non-negative (got %g)", options.tolerance));
  }
  check_max_iter(options.max_iter);
  if (options.n_multi < 1) {
    throw std::invalid_argument(absl::StrFormat(
        "There must be at least 1 EM run (got %d)", options.n_multi));
  }
}

auto run_em_once(
    const Read_hap_matrix& read_hap_mat,
    const Eigen::VectorXd& weights,
    Eigen::VectorXd ln_init_props,
    const Em_options& options)
    -> Em_run {

  check_max_iter(options.max_iter);

  // Each run owns its buffers: `props` feeds an iteration, `new_props` receives its outcome
  auto props = std::move(ln_init_props);
  auto new_props = Eigen::VectorXd(props.size());
  auto read_mix_mat = Read_hap_matrix(read_hap_mat.rows(), read_hap_mat.cols());

  auto iterations = 0;
  auto has_converged = false;
  for (auto iter_round = 0; iter_round < options.max_iter; ++iter_round) {
    if (options.verbose && (iter_round + 1) % 10 == 0) {
      std::cerr << '.';
    }

    em_step(read_hap_mat, weights, props, read_mix_mat, new_props);
    ++iterations;

    // Compare what went into this step with what came out of it
    if (converged(new_props, props, options.tolerance)) {
      has_converged = true;
      if (options.verbose) {
        std::cerr << absl::StreamFormat("\nConverged! (%d)\n", iter_round + 1);
      }
      break;
    }
    props.swap(new_props);
  }
  if (not has_converged) {
    // `props` holds the last estimate after the final swap
    props.swap(new_props);
    if (options.verbose) {
      std::cerr << absl::StreamFormat("\nDid not converge after %d iterations\n", iterations);
    }
  }

  return Em_run{
    .log_props = std::move(new_props),
    .log_read_mix = std::move(read_mix_mat),
    .iterations = iterations,
    .converged = has_converged};
}

auto run_em(
    const Read_hap_matrix& read_hap_mat,
    const Eigen::VectorXd& weights,
    const Em_options& options,
    absl::BitGenRef bitgen,
    ctpl::thread_pool* thread_pool)
    -> Em_result {

  check_em_inputs(read_hap_mat, weights, options);

  auto num_haps = static_cast<int>(read_hap_mat.cols());
  auto n_multi = options.n_multi;

  // Initial haplogroup proportions for every run, drawn in run order
  auto ln_inits = std::vector<Eigen::VectorXd>{};
  ln_inits.reserve(n_multi);
  for (auto i = 0; i != n_multi; ++i) {
    ln_inits.push_back(init_ln_props(num_haps, options.init_alpha, bitgen));
  }

  auto runs = std::vector<Em_run>{};
  runs.reserve(n_multi);
  if (thread_pool != nullptr && n_multi > 1) {
    auto quiet_options = options;
    quiet_options.verbose = false;  // Dots from concurrent runs would interleave

    auto pending_runs = std::vector<std::future<Em_run>>{};
    for (auto i = 0; i != n_multi; ++i) {
      pending_runs.push_back(thread_pool->push(
          [&read_hap_mat, &weights, &quiet_options, &ln_init = ln_inits[i]](int /*thread_id*/) {
            return run_em_once(read_hap_mat, weights, std::move(ln_init), quiet_options);
          }));
    }
    // Let every run finish before collecting results, so none outlives the data it refers to
    for (auto& pending_run : pending_runs) {
      pending_run.wait();
    }
    for (auto i = 0; i != n_multi; ++i) {
      runs.push_back(pending_runs[i].get());
      if (options.verbose) {
        std::cerr << absl::StreamFormat(
            "EM run %d: %s after %d iterations\n",
            i + 1, runs.back().converged ? "converged" : "stopped", runs.back().iterations);
      }
    }
  } else {
    for (auto i = 0; i != n_multi; ++i) {
      if (options.verbose) {
        std::cerr << absl::StreamFormat("Starting EM run %d...\n", i + 1);
      }
      runs.push_back(run_em_once(read_hap_mat, weights, std::move(ln_inits[i]), options));
    }
  }

  // Average in log space, then exponentiate once
  Eigen::VectorXd sum_log_props = Eigen::VectorXd::Zero(num_haps);
  Read_hap_matrix sum_log_read_mix = Read_hap_matrix::Zero(read_hap_mat.rows(), num_haps);
  auto result = Em_result{};
  for (const auto& run : runs) {
    sum_log_props += run.log_props;
    sum_log_read_mix += run.log_read_mix;
    result.iterations.push_back(run.iterations);
    result.converged.push_back(run.converged);
  }

  result.props = (sum_log_props / static_cast<double>(n_multi)).array().exp().matrix();
  result.read_mix = (sum_log_read_mix / static_cast<double>(n_multi)).array().exp().matrix();

  return result;
}

}  // namespace haplomix
