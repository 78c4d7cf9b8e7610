// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * mask_types.hpp
 *
 * Array types shared by the mask processing steps.
 * Rows are profiles (time samples), columns are range/height bins.
 *
 *  Created on: Oct 2026
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DDATMOS_MASK_TYPES_HPP
#define DDATMOS_MASK_TYPES_HPP

#include <Eigen/Core>
#include <optional>
#include <string>
#include <vector>

namespace ddatmos {

/// Boolean (n_profiles x n_bins) mask. true marks a cloudy bin.
using Mask = Eigen::Matrix<bool, Eigen::Dynamic, Eigen::Dynamic>;

/// Per-profile ground bin. std::nullopt means no ground was detected.
using GroundBins = std::vector<std::optional<int>>;

/// Direction of the height coordinate along the bin axis.
enum class HeightOrder { Ascending, Descending };

inline const char* toString(HeightOrder order) {
  return order == HeightOrder::Ascending ? "ascending" : "descending";
}

/// "(rows, cols)" for log and error messages.
template <typename Derived>
std::string shapeString(const Eigen::EigenBase<Derived>& m) {
  return "(" + std::to_string(m.rows()) + ", " + std::to_string(m.cols()) +
         ")";
}

}  // namespace ddatmos

#endif  // DDATMOS_MASK_TYPES_HPP
