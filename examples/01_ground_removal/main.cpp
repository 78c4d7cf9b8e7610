// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * 01_ground_removal - Mask processing on synthetic profiles
 *
 * Demonstrates:
 * - Loading step parameters from YAML
 * - Backfilling first-pass clouds with noise
 * - Combining two pass masks and dropping small clusters
 * - Splitting the ground band out of the combined mask
 */

#include <ddatmos/ddatmos.hpp>

#include <spdlog/spdlog.h>

#include <cmath>
#include <limits>
#include <random>

using namespace ddatmos;

namespace {

constexpr int kProfiles = 200;
constexpr int kBins = 120;
constexpr float kBinSize = 30.0f;  // [m]

}  // namespace

int main() {
  spdlog::info("=== 01_ground_removal ===");

  // 1. Config
  auto cfg = loadConfig(EXAMPLE_CONFIG_DIR "/default.yaml");
  cfg.ground_removal.verbose = true;
  cfg.mask_combination.verbose = true;
  cfg.mask_combination.min_cluster_size = 20;

  // 2. Synthetic descending heights (top bin first, as in ATL09 profiles)
  Eigen::VectorXf heights(kBins);
  for (int j = 0; j < kBins; ++j) {
    heights(j) = (kBins - 1 - j) * kBinSize;
  }

  // Terrain sits 5-15 bins above the bottom; a third of profiles lose it
  GroundBins ground_bin(kProfiles);
  std::mt19937 gen(7);
  std::uniform_int_distribution<int> terrain(kBins - 15, kBins - 5);
  for (int i = 0; i < kProfiles; ++i) {
    if (i % 3 != 0) ground_bin[i] = terrain(gen);
  }

  // 3. Pass masks with cloud decks and the ground return
  Mask pass1 = Mask::Constant(kProfiles, kBins, false);
  Mask pass2 = Mask::Constant(kProfiles, kBins, false);
  pass1.block(40, 20, 60, 10).setConstant(true);
  pass2.block(90, 25, 40, 8).setConstant(true);
  pass2(150, 60) = true;
  for (int i = 0; i < kProfiles; ++i) {
    if (ground_bin[i]) pass1.row(i).segment(*ground_bin[i], 3).setConstant(true);
  }

  // 4. Noise backfill of pass-1 clouds
  Eigen::MatrixXf data = Eigen::MatrixXf::Constant(kProfiles, kBins, 1.0f);
  data(0, 0) = std::numeric_limits<float>::quiet_NaN();
  const Eigen::VectorXf mean = Eigen::VectorXf::Constant(kProfiles, 1.0f);
  const Eigen::VectorXf sd = Eigen::VectorXf::Constant(kProfiles, 0.2f);
  auto filled = replaceMaskWithNoise(data, pass1, mean, sd, cfg.noise_fill);
  spdlog::info("Noise-filled field mean: {:.3f}",
               filled.bottomRows(kProfiles - 1).mean());

  // 5. Combine passes
  auto cloud_mask = combineMasks({pass1, pass2}, cfg.mask_combination);

  // 6. Remove ground
  auto result = removeGroundFromMask(cloud_mask, ground_bin, cloud_mask,
                                     heights, cfg.ground_removal);

  spdlog::info("Cloudy bins: {} combined, {} after ground removal, {} ground",
               cloud_mask.count(), result.cloud_mask_no_ground.count(),
               result.ground_mask.count());

  return 0;
}
