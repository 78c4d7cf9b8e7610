// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * height_order.hpp
 *
 * Height coordinate ordering check.
 *
 *  Created on: Oct 2026
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DDATMOS_HEIGHT_ORDER_HPP
#define DDATMOS_HEIGHT_ORDER_HPP

#include <Eigen/Core>

#include "ddatmos/mask_types.hpp"

namespace ddatmos {

/**
 * @brief Classifies the bin heights as ascending or descending.
 *
 * Every first difference must have the same strict sign. Fewer than two
 * heights count as ascending.
 *
 * @throws OrderingError on mixed signs, repeated heights or NaN.
 */
HeightOrder detectHeightOrder(const Eigen::VectorXf& heights);

}  // namespace ddatmos

#endif  // DDATMOS_HEIGHT_ORDER_HPP
