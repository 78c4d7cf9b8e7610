// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * combine_masks.hpp
 *
 * Logical combination of per-pass cloud masks with small cluster removal.
 *
 *  Created on: Oct 2026
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DDATMOS_STEPS_COMBINE_MASKS_HPP
#define DDATMOS_STEPS_COMBINE_MASKS_HPP

#include <memory>
#include <vector>

#include "ddatmos/config/steps.hpp"
#include "ddatmos/mask_types.hpp"

namespace spdlog {
class logger;
}

namespace ddatmos {

/**
 * @brief Clears 4-connected clusters with fewer than min_cluster_size bins.
 *
 * Clusters of exactly min_cluster_size bins are kept. A size <= 0 returns
 * the mask unchanged.
 */
Mask removeSmallClusters(const Mask& mask, int min_cluster_size);

/**
 * @brief ORs the masks together, then removes small clusters.
 *
 * @param masks Per-pass cloud masks, all of the same shape
 * @param min_cluster_size Minimum cluster size kept (0: keep everything)
 * @param verbose Log progress through logger
 * @param logger Diagnostic sink (default: spdlog default logger)
 *
 * @throws std::invalid_argument if masks is empty
 * @throws ShapeMismatchError if the masks differ in shape
 */
Mask combineMasks(const std::vector<Mask>& masks, int min_cluster_size = 0,
                  bool verbose = false,
                  std::shared_ptr<spdlog::logger> logger = nullptr);

Mask combineMasks(const std::vector<Mask>& masks,
                  const config::MaskCombination& config,
                  std::shared_ptr<spdlog::logger> logger = nullptr);

}  // namespace ddatmos

#endif  // DDATMOS_STEPS_COMBINE_MASKS_HPP
