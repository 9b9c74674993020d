#ifndef HAPLOMIX_LOG_SPACE_H_
#define HAPLOMIX_LOG_SPACE_H_

#include <algorithm>
#include <cmath>
#include <limits>

#include <Eigen/Dense>

#include <absl/log/check.h>

namespace haplomix {

inline constexpr double k_neg_inf = -std::numeric_limits<double>::infinity();
inline constexpr double k_pos_inf = +std::numeric_limits<double>::infinity();

// log(sum_i exp(a_i)), computed as a_max + log(sum_i exp(a_i - a_max)) so that nothing overflows.
// An empty vector or a vector of -inf values gives -inf (never NaN).
template<typename Derived>
auto log_sum_exp(const Eigen::MatrixBase<Derived>& a) -> double {
  if (a.size() == 0) {
    return k_neg_inf;
  }
  auto a_max = a.maxCoeff();
  if (std::isinf(a_max)) {
    return a_max;  // all -inf (or some +inf)
  }
  return a_max + std::log((a.array() - a_max).exp().sum());
}

// log(sum_i b_i exp(a_i)) for non-negative weights b_i.  Terms with b_i == 0 drop out entirely,
// even if a_i is +/-inf.  If every term drops out, the result is -inf.
template<typename Derived_a, typename Derived_b>
auto log_sum_exp(const Eigen::MatrixBase<Derived_a>& a, const Eigen::MatrixBase<Derived_b>& b) -> double {
  DCHECK_EQ(a.size(), b.size());

  auto a_max = k_neg_inf;
  for (auto i = Eigen::Index{0}; i != a.size(); ++i) {
    if (b(i) != 0.0) {
      a_max = std::max(a_max, a(i));
    }
  }
  if (std::isinf(a_max)) {
    return a_max;
  }

  auto sum = 0.0;
  for (auto i = Eigen::Index{0}; i != a.size(); ++i) {
    if (b(i) != 0.0) {
      sum += b(i) * std::exp(a(i) - a_max);
    }
  }
  return a_max + std::log(sum);
}

// Shifts `a` so that sum_i exp(a_i) == 1.  If every entry is -inf, `a` is left untouched
// (i.e., every entry keeps probability 0 instead of becoming NaN).  Returns the log normalizer.
//
// `a` may be a writable expression such as `m.row(j)`, hence the const_cast (the usual Eigen idiom
// for functions that write into their argument).
template<typename Derived>
auto normalize_in_log_space(const Eigen::MatrixBase<Derived>& a_in) -> double {
  auto& a = const_cast<Eigen::MatrixBase<Derived>&>(a_in);
  auto log_norm = log_sum_exp(a);
  if (std::isfinite(log_norm)) {
    a.array() -= log_norm;
  }
  return log_norm;
}

}  // namespace haplomix

#endif // HAPLOMIX_LOG_SPACE_H_
