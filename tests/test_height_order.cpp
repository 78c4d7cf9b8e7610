// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include <gtest/gtest.h>

#include <cmath>

#include "ddatmos/exceptions.hpp"
#include "ddatmos/height_order.hpp"

using namespace ddatmos;

namespace {

Eigen::VectorXf vec(std::initializer_list<float> values) {
  Eigen::VectorXf v(static_cast<Eigen::Index>(values.size()));
  Eigen::Index i = 0;
  for (float x : values) v(i++) = x;
  return v;
}

}  // namespace

TEST(HeightOrderTest, Ascending) {
  EXPECT_EQ(detectHeightOrder(vec({0.0f, 1.0f, 2.0f, 3.0f, 4.0f})),
            HeightOrder::Ascending);
}

TEST(HeightOrderTest, Descending) {
  EXPECT_EQ(detectHeightOrder(vec({20000.0f, 19970.0f, 19940.0f, -30.0f})),
            HeightOrder::Descending);
}

TEST(HeightOrderTest, UnevenSpacingIsStillOrdered) {
  EXPECT_EQ(detectHeightOrder(vec({0.0f, 0.5f, 4.0f, 4.1f})),
            HeightOrder::Ascending);
}

TEST(HeightOrderTest, MixedSignsThrow) {
  EXPECT_THROW(detectHeightOrder(vec({1.0f, 2.0f, 4.0f, 3.0f})),
               OrderingError);
}

TEST(HeightOrderTest, RepeatedValueThrows) {
  EXPECT_THROW(detectHeightOrder(vec({3.0f, 2.0f, 2.0f, 1.0f})),
               OrderingError);
}

TEST(HeightOrderTest, NaNThrows) {
  EXPECT_THROW(detectHeightOrder(vec({0.0f, NAN, 2.0f})), OrderingError);
}

TEST(HeightOrderTest, ShortVectorsCountAsAscending) {
  EXPECT_EQ(detectHeightOrder(Eigen::VectorXf(0)), HeightOrder::Ascending);
  EXPECT_EQ(detectHeightOrder(vec({5.0f})), HeightOrder::Ascending);
}

TEST(HeightOrderTest, ErrorMessage) {
  try {
    detectHeightOrder(vec({1.0f, 2.0f, 4.0f, 3.0f}));
    FAIL() << "expected OrderingError";
  } catch (const OrderingError& e) {
    EXPECT_EQ(e.getMessage(), "heights isn't ordered");
  }
}

TEST(HeightOrderTest, ToString) {
  EXPECT_STREQ(toString(HeightOrder::Ascending), "ascending");
  EXPECT_STREQ(toString(HeightOrder::Descending), "descending");
}
