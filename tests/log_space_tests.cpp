#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <cmath>

#include "log_space.h"

namespace haplomix {

TEST(Log_space_test, log_sum_exp) {
  EXPECT_THAT(log_sum_exp(Eigen::VectorXd{{std::log(1.0), std::log(2.0), std::log(3.0)}}),
              testing::DoubleNear(std::log(6.0), 1e-12));

  // Huge magnitudes don't overflow
  EXPECT_THAT(log_sum_exp(Eigen::VectorXd{{1000.0, 1000.0}}), testing::DoubleNear(1000.0 + std::log(2.0), 1e-9));
  EXPECT_THAT(log_sum_exp(Eigen::VectorXd{{-1000.0, -1000.0}}), testing::DoubleNear(-1000.0 + std::log(2.0), 1e-9));

  // -inf entries contribute nothing
  EXPECT_THAT(log_sum_exp(Eigen::VectorXd{{k_neg_inf, 0.0}}), testing::DoubleNear(0.0, 1e-12));
}

TEST(Log_space_test, log_sum_exp_degenerate) {
  EXPECT_THAT(log_sum_exp(Eigen::VectorXd{}), testing::Eq(k_neg_inf));
  EXPECT_THAT(log_sum_exp(Eigen::VectorXd{{k_neg_inf, k_neg_inf}}), testing::Eq(k_neg_inf));
}

TEST(Log_space_test, log_sum_exp_of_rows_and_columns) {
  auto m = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>{
    {std::log(1.0), std::log(3.0)},
    {std::log(2.0), std::log(5.0)}};

  EXPECT_THAT(log_sum_exp(m.row(1)), testing::DoubleNear(std::log(7.0), 1e-12));
  EXPECT_THAT(log_sum_exp(m.col(1)), testing::DoubleNear(std::log(8.0), 1e-12));
}

TEST(Log_space_test, weighted_log_sum_exp) {
  auto a = Eigen::VectorXd{{std::log(0.25), std::log(0.75)}};
  EXPECT_THAT(log_sum_exp(a, Eigen::VectorXd{{1.0, 3.0}}), testing::DoubleNear(std::log(2.5), 1e-12));

  // Zero-weight terms drop out, even at -inf
  EXPECT_THAT(log_sum_exp(Eigen::VectorXd{{k_neg_inf, 0.0}}, Eigen::VectorXd{{0.0, 2.0}}),
              testing::DoubleNear(std::log(2.0), 1e-12));
  EXPECT_THAT(log_sum_exp(Eigen::VectorXd{{5.0, 7.0}}, Eigen::VectorXd{{0.0, 0.0}}), testing::Eq(k_neg_inf));
  EXPECT_THAT(log_sum_exp(Eigen::VectorXd{{k_neg_inf, k_neg_inf}}, Eigen::VectorXd{{1.0, 1.0}}),
              testing::Eq(k_neg_inf));
}

TEST(Log_space_test, normalize_in_log_space) {
  auto a = Eigen::VectorXd{{std::log(1.0), std::log(3.0)}};
  auto log_norm = normalize_in_log_space(a);

  EXPECT_THAT(log_norm, testing::DoubleNear(std::log(4.0), 1e-12));
  EXPECT_THAT(std::exp(a(0)), testing::DoubleNear(0.25, 1e-12));
  EXPECT_THAT(std::exp(a(1)), testing::DoubleNear(0.75, 1e-12));
}

TEST(Log_space_test, normalize_one_row_in_place) {
  auto m = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>{
    {std::log(1.0), std::log(3.0)},
    {std::log(2.0), std::log(2.0)}};

  normalize_in_log_space(m.row(0));

  EXPECT_THAT(std::exp(m(0, 0)), testing::DoubleNear(0.25, 1e-12));
  EXPECT_THAT(std::exp(m(0, 1)), testing::DoubleNear(0.75, 1e-12));
  EXPECT_THAT(m(1, 0), testing::DoubleEq(std::log(2.0)));  // other rows untouched
}

TEST(Log_space_test, normalize_all_neg_inf_stays_put) {
  auto a = Eigen::VectorXd{{k_neg_inf, k_neg_inf, k_neg_inf}};
  auto log_norm = normalize_in_log_space(a);

  EXPECT_THAT(log_norm, testing::Eq(k_neg_inf));
  for (auto i = 0; i != a.size(); ++i) {
    EXPECT_THAT(a(i), testing::Eq(k_neg_inf));
  }
  EXPECT_FALSE(a.array().isNaN().any());
}

}  // namespace haplomix
