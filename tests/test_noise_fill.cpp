// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include <gtest/gtest.h>

#include <cmath>

#include "ddatmos/exceptions.hpp"
#include "ddatmos/steps/noise_fill.hpp"

using namespace ddatmos;

class NoiseFillTest : public ::testing::Test {
 protected:
  static constexpr int n = 50;
  static constexpr int m = 40;

  Eigen::MatrixXf data = Eigen::MatrixXf::Constant(n, m, -7.0f);
  Mask mask = Mask::Constant(n, m, false);
  Eigen::VectorXf mean = Eigen::VectorXf::Constant(n, 10.0f);
  Eigen::VectorXf sd = Eigen::VectorXf::Constant(n, 2.0f);

  void SetUp() override {
    mask.leftCols(m / 2).setConstant(true);
    data(0, m - 1) = NAN;
  }
};

TEST_F(NoiseFillTest, UnmaskedBinsKeepData) {
  auto noisy = replaceMaskWithNoise(data, mask, mean, sd, 0.0f, 1u);

  for (int r = 0; r < n; ++r) {
    for (int c = m / 2; c < m; ++c) {
      if (r == 0 && c == m - 1) {
        EXPECT_TRUE(std::isnan(noisy(r, c)));
      } else {
        EXPECT_FLOAT_EQ(noisy(r, c), -7.0f);
      }
    }
  }
}

TEST_F(NoiseFillTest, MaskedBinsFollowProfileStatistics) {
  auto noisy = replaceMaskWithNoise(data, mask, mean, sd, 0.0f, 3u);

  const Eigen::MatrixXf filled = noisy.leftCols(m / 2);
  const float sample_mean = filled.mean();
  const float sample_sd = std::sqrt(
      (filled.array() - sample_mean).square().sum() / (filled.size() - 1));

  // 1000 draws: standard error of the mean ~0.06
  EXPECT_NEAR(sample_mean, 10.0f, 0.3f);
  EXPECT_NEAR(sample_sd, 2.0f, 0.3f);
}

TEST_F(NoiseFillTest, DrawsAreClampedToVmin) {
  mean.setConstant(0.0f);
  sd.setConstant(1.0f);

  auto noisy = replaceMaskWithNoise(data, mask, mean, sd, 0.0f, 11u);

  EXPECT_GE(noisy.leftCols(m / 2).minCoeff(), 0.0f);
  // About half the draws fall below zero and are raised to exactly vmin
  EXPECT_GT((noisy.leftCols(m / 2).array() == 0.0f).count(), 0);
}

TEST_F(NoiseFillTest, ZeroSdGivesMean) {
  sd.setZero();
  mean(3) = -4.0f;

  auto noisy = replaceMaskWithNoise(data, mask, mean, sd, -1.0f, 5u);

  EXPECT_FLOAT_EQ(noisy(0, 0), 10.0f);
  EXPECT_FLOAT_EQ(noisy(3, 0), -1.0f);  // clamped
}

TEST_F(NoiseFillTest, SameSeedReproduces) {
  auto a = replaceMaskWithNoise(data, mask, mean, sd, 0.0f, 42u);
  auto b = replaceMaskWithNoise(data, mask, mean, sd, 0.0f, 42u);
  auto c = replaceMaskWithNoise(data, mask, mean, sd, 0.0f, 43u);

  EXPECT_TRUE(a.leftCols(m / 2).isApprox(b.leftCols(m / 2)));
  EXPECT_FALSE(a.leftCols(m / 2).isApprox(c.leftCols(m / 2)));
}

TEST_F(NoiseFillTest, ConfigOverload) {
  config::NoiseFill cfg;
  cfg.seed = 42u;
  cfg.vmin = 0.0f;

  auto a = replaceMaskWithNoise(data, mask, mean, sd, cfg);
  auto b = replaceMaskWithNoise(data, mask, mean, sd, 0.0f, 42u);

  EXPECT_TRUE(a.leftCols(m / 2).isApprox(b.leftCols(m / 2)));
}

TEST_F(NoiseFillTest, InputIsNotModified) {
  const Eigen::MatrixXf before = data;
  replaceMaskWithNoise(data, mask, mean, sd);

  EXPECT_TRUE(data.leftCols(m / 2).isApprox(before.leftCols(m / 2)));
}

TEST_F(NoiseFillTest, ShapeMismatchThrows) {
  EXPECT_THROW(replaceMaskWithNoise(data, Mask::Constant(n, m + 1, false),
                                    mean, sd),
               ShapeMismatchError);
  EXPECT_THROW(replaceMaskWithNoise(data, mask,
                                    Eigen::VectorXf::Zero(n - 1), sd),
               ShapeMismatchError);
}

TEST_F(NoiseFillTest, NegativeSdThrows) {
  sd(7) = -1.0f;
  EXPECT_THROW(replaceMaskWithNoise(data, mask, mean, sd), std::invalid_argument);
}
