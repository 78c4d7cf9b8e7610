// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "ddatmos/height_order.hpp"

#include "ddatmos/exceptions.hpp"

namespace ddatmos {

HeightOrder detectHeightOrder(const Eigen::VectorXf& heights) {
  const Eigen::Index m = heights.size();
  if (m < 2) return HeightOrder::Ascending;

  const Eigen::ArrayXf dh =
      heights.tail(m - 1).array() - heights.head(m - 1).array();

  // NaN differences fail both comparisons
  if ((dh > 0.0f).all()) return HeightOrder::Ascending;
  if ((dh < 0.0f).all()) return HeightOrder::Descending;

  throw OrderingError("HeightOrder", "heights isn't ordered");
}

}  // namespace ddatmos
