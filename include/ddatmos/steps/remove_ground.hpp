// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * remove_ground.hpp
 *
 * Removal of the ground return band from a combined cloud mask.
 *
 *  Created on: Oct 2026
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DDATMOS_STEPS_REMOVE_GROUND_HPP
#define DDATMOS_STEPS_REMOVE_GROUND_HPP

#include <Eigen/Core>
#include <memory>

#include "ddatmos/config/steps.hpp"
#include "ddatmos/mask_types.hpp"

namespace spdlog {
class logger;
}

namespace ddatmos {

struct GroundRemovalResult {
  Mask cloud_mask_no_ground;  ///< cloud_mask with the ground band cleared
  Mask ground_mask;           ///< cloud_mask values inside the ground band only
};

/**
 * @brief Converts a NaN-sentinel ground bin vector into GroundBins.
 *
 * Finite values are truncated toward zero. NaN and infinities become
 * std::nullopt.
 */
GroundBins toGroundBins(const Eigen::VectorXf& ground_bin);

/**
 * @brief Splits the ground return band out of a cloud mask.
 *
 * For every profile i with a ground bin g, the bins [g, g + ground_width)
 * are cleared in the returned cloud mask and copied from cloud_mask into the
 * ground mask. Both bounds are clamped to [0, n_bins], so a band running off
 * either end of the profile is truncated. Profiles without a ground bin pass
 * through unchanged and get an all-false ground row.
 *
 * The band is taken in increasing bin index for both height orders.
 * layer_mask only takes part in shape validation.
 *
 * @param layer_mask Consolidated layer mask (n, m)
 * @param ground_bin Ground bin per profile (n)
 * @param cloud_mask Combined cloud mask (n, m), not modified
 * @param ground_width Number of bins in the ground band (>= 0)
 * @param heights Bin heights (m), strictly monotonic
 * @param verbose Log progress through logger
 * @param logger Diagnostic sink (default: spdlog default logger)
 *
 * @throws ShapeMismatchError if the input shapes disagree
 * @throws std::invalid_argument if ground_width < 0
 * @throws OrderingError if heights is not strictly monotonic
 */
GroundRemovalResult removeGroundFromMask(
    const Mask& layer_mask, const GroundBins& ground_bin,
    const Mask& cloud_mask, int ground_width, const Eigen::VectorXf& heights,
    bool verbose = false, std::shared_ptr<spdlog::logger> logger = nullptr);

/// Same as above, with ground bins given as a NaN-sentinel vector.
GroundRemovalResult removeGroundFromMask(
    const Mask& layer_mask, const Eigen::VectorXf& ground_bin,
    const Mask& cloud_mask, int ground_width, const Eigen::VectorXf& heights,
    bool verbose = false, std::shared_ptr<spdlog::logger> logger = nullptr);

/// Same as above, with width and verbosity taken from config.
GroundRemovalResult removeGroundFromMask(
    const Mask& layer_mask, const GroundBins& ground_bin,
    const Mask& cloud_mask, const Eigen::VectorXf& heights,
    const config::GroundRemoval& config,
    std::shared_ptr<spdlog::logger> logger = nullptr);

}  // namespace ddatmos

#endif  // DDATMOS_STEPS_REMOVE_GROUND_HPP
