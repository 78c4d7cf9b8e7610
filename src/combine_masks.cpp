// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * combine_masks.cpp
 *
 * Logical combination of per-pass cloud masks with small cluster removal.
 *
 *  Created on: Oct 2026
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "ddatmos/steps/combine_masks.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "ddatmos/exceptions.hpp"

namespace ddatmos {

namespace {

// 4-connected neighbor offsets
constexpr int dr[] = {-1, 1, 0, 0};
constexpr int dc[] = {0, 0, -1, 1};

}  // namespace

Mask removeSmallClusters(const Mask& mask, int min_cluster_size) {
  Mask out = mask;
  if (min_cluster_size <= 0) return out;

  const int rows = static_cast<int>(mask.rows());
  const int cols = static_cast<int>(mask.cols());

  Mask visited = Mask::Constant(rows, cols, false);

  // Reusable buffers: DFS stack and the bins of the current cluster
  std::vector<std::pair<int, int>> stack;
  std::vector<std::pair<int, int>> cluster;

  for (int r = 0; r < rows; ++r) {
    for (int c = 0; c < cols; ++c) {
      if (!mask(r, c) || visited(r, c)) continue;

      stack.clear();
      cluster.clear();
      stack.emplace_back(r, c);
      visited(r, c) = true;

      while (!stack.empty()) {
        auto [cr, cc] = stack.back();
        stack.pop_back();
        cluster.emplace_back(cr, cc);

        for (int k = 0; k < 4; ++k) {
          const int nr = cr + dr[k];
          const int nc = cc + dc[k];
          if (nr < 0 || nr >= rows || nc < 0 || nc >= cols) continue;
          if (!mask(nr, nc) || visited(nr, nc)) continue;
          visited(nr, nc) = true;
          stack.emplace_back(nr, nc);
        }
      }

      if (static_cast<int>(cluster.size()) >= min_cluster_size) continue;
      for (const auto& [pr, pc] : cluster) {
        out(pr, pc) = false;
      }
    }
  }

  return out;
}

Mask combineMasks(const std::vector<Mask>& masks, int min_cluster_size,
                  bool verbose, std::shared_ptr<spdlog::logger> logger) {
  if (!logger) logger = spdlog::default_logger();

  if (masks.empty()) {
    throw std::invalid_argument("[MaskCombiner] no masks to combine");
  }

  const auto& first = masks.front();
  for (size_t i = 1; i < masks.size(); ++i) {
    if (masks[i].rows() != first.rows() || masks[i].cols() != first.cols()) {
      throw ShapeMismatchError(
          "MaskCombiner", "mask " + std::to_string(i) + " " +
                              shapeString(masks[i]) + " does not match mask 0 " +
                              shapeString(first));
    }
  }

  Mask combined = first;
  for (size_t i = 1; i < masks.size(); ++i) {
    combined = (combined.array() || masks[i].array()).matrix();
  }

  if (verbose) {
    logger->info("[MaskCombiner] combined {} masks {}, {} cloudy bins",
                 masks.size(), shapeString(combined), combined.count());
  }

  if (min_cluster_size > 0) {
    combined = removeSmallClusters(combined, min_cluster_size);
    if (verbose) {
      logger->info(
          "[MaskCombiner] {} cloudy bins left after removing clusters < {}",
          combined.count(), min_cluster_size);
    }
  }

  return combined;
}

Mask combineMasks(const std::vector<Mask>& masks,
                  const config::MaskCombination& config,
                  std::shared_ptr<spdlog::logger> logger) {
  return combineMasks(masks, config.min_cluster_size, config.verbose,
                      std::move(logger));
}

}  // namespace ddatmos
