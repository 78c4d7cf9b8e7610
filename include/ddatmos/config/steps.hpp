// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * steps.hpp
 *
 * Per-step configuration for mask processing.
 *
 *  Created on: Oct 2026
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DDATMOS_CONFIG_STEPS_HPP
#define DDATMOS_CONFIG_STEPS_HPP

#include <cstdint>
#include <optional>

namespace ddatmos::config {

/// Ground band removal from the combined cloud mask.
struct GroundRemoval {
  int ground_width = 3;  ///< Bins spread by the ground return [bins]
  bool verbose = false;
};

/// Logical combination of per-pass cloud masks.
struct MaskCombination {
  int min_cluster_size = 300;  ///< Smaller 4-connected clusters are cleared (0: keep all)
  bool verbose = false;
};

/// Backfilling of masked bins with per-profile Gaussian noise.
struct NoiseFill {
  float vmin = 0.0f;                   ///< Lower clamp for drawn noise
  std::optional<std::uint64_t> seed;   ///< Unset: non-deterministic seed
  bool verbose = false;
};

}  // namespace ddatmos::config

#endif  // DDATMOS_CONFIG_STEPS_HPP
