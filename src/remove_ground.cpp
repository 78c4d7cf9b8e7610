// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * remove_ground.cpp
 *
 * Removal of the ground return band from a combined cloud mask.
 *
 *  Created on: Oct 2026
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "ddatmos/steps/remove_ground.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include "ddatmos/exceptions.hpp"
#include "ddatmos/height_order.hpp"

namespace ddatmos {

namespace {

constexpr auto kStep = "GroundRemoval";

void validateShapes(const Mask& layer_mask, const GroundBins& ground_bin,
                    const Mask& cloud_mask, const Eigen::VectorXf& heights) {
  if (layer_mask.rows() != cloud_mask.rows() ||
      layer_mask.cols() != cloud_mask.cols()) {
    throw ShapeMismatchError(kStep, "layer_mask " + shapeString(layer_mask) +
                                        " does not match cloud_mask " +
                                        shapeString(cloud_mask));
  }
  if (static_cast<Eigen::Index>(ground_bin.size()) != cloud_mask.rows()) {
    throw ShapeMismatchError(
        kStep, "ground_bin has " + std::to_string(ground_bin.size()) +
                   " entries, expected " + std::to_string(cloud_mask.rows()));
  }
  if (heights.size() != cloud_mask.cols()) {
    throw ShapeMismatchError(
        kStep, "heights has " + std::to_string(heights.size()) +
                   " entries, expected " + std::to_string(cloud_mask.cols()));
  }
}

}  // namespace

GroundBins toGroundBins(const Eigen::VectorXf& ground_bin) {
  constexpr double kMin = std::numeric_limits<int>::min();
  constexpr double kMax = std::numeric_limits<int>::max();

  GroundBins bins(ground_bin.size());
  for (Eigen::Index i = 0; i < ground_bin.size(); ++i) {
    const float g = ground_bin(i);
    if (!std::isfinite(g)) continue;
    bins[i] = static_cast<int>(
        std::clamp(std::trunc(static_cast<double>(g)), kMin, kMax));
  }
  return bins;
}

GroundRemovalResult removeGroundFromMask(const Mask& layer_mask,
                                         const GroundBins& ground_bin,
                                         const Mask& cloud_mask,
                                         int ground_width,
                                         const Eigen::VectorXf& heights,
                                         bool verbose,
                                         std::shared_ptr<spdlog::logger> logger) {
  if (!logger) logger = spdlog::default_logger();

  validateShapes(layer_mask, ground_bin, cloud_mask, heights);
  if (ground_width < 0) {
    throw std::invalid_argument("[GroundRemoval] ground_width must be >= 0, got " +
                                std::to_string(ground_width));
  }
  const HeightOrder order = detectHeightOrder(heights);

  const Eigen::Index n_prof = cloud_mask.rows();
  const std::int64_t n_bins = cloud_mask.cols();

  if (verbose) {
    logger->info("[GroundRemoval] {} profiles x {} bins, heights {}, width {}",
                 n_prof, n_bins, toString(order), ground_width);
  }

  GroundRemovalResult result;
  result.cloud_mask_no_ground = cloud_mask;
  result.ground_mask = Mask::Constant(cloud_mask.rows(), cloud_mask.cols(), false);

  Eigen::Index profiles_with_ground = 0;
  Eigen::Index bins_removed = 0;

  for (Eigen::Index i = 0; i < n_prof; ++i) {
    const auto& g = ground_bin[i];
    if (!g) continue;
    ++profiles_with_ground;

    // Band [lo, hi), clamped to the profile (no negative-index wraparound)
    const std::int64_t lo = std::clamp<std::int64_t>(*g, 0, n_bins);
    const std::int64_t hi =
        std::clamp<std::int64_t>(static_cast<std::int64_t>(*g) + ground_width,
                                 0, n_bins);
    if (lo >= hi) continue;

    const Eigen::Index len = hi - lo;
    result.ground_mask.row(i).segment(lo, len) =
        cloud_mask.row(i).segment(lo, len);
    result.cloud_mask_no_ground.row(i).segment(lo, len).setConstant(false);
    bins_removed += result.ground_mask.row(i).segment(lo, len).count();
  }

  if (verbose) {
    logger->info("[GroundRemoval] {}/{} profiles have a ground bin, {} cloudy "
                 "bins moved to the ground mask",
                 profiles_with_ground, n_prof, bins_removed);
  }

  return result;
}

GroundRemovalResult removeGroundFromMask(const Mask& layer_mask,
                                         const Eigen::VectorXf& ground_bin,
                                         const Mask& cloud_mask,
                                         int ground_width,
                                         const Eigen::VectorXf& heights,
                                         bool verbose,
                                         std::shared_ptr<spdlog::logger> logger) {
  return removeGroundFromMask(layer_mask, toGroundBins(ground_bin), cloud_mask,
                              ground_width, heights, verbose, std::move(logger));
}

GroundRemovalResult removeGroundFromMask(const Mask& layer_mask,
                                         const GroundBins& ground_bin,
                                         const Mask& cloud_mask,
                                         const Eigen::VectorXf& heights,
                                         const config::GroundRemoval& config,
                                         std::shared_ptr<spdlog::logger> logger) {
  return removeGroundFromMask(layer_mask, ground_bin, cloud_mask,
                              config.ground_width, heights, config.verbose,
                              std::move(logger));
}

}  // namespace ddatmos
