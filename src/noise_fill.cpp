// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "ddatmos/steps/noise_fill.hpp"

#include <spdlog/spdlog.h>

#include <random>
#include <stdexcept>
#include <string>
#include <utility>

#include "ddatmos/exceptions.hpp"

namespace ddatmos {

Eigen::MatrixXf replaceMaskWithNoise(const Eigen::MatrixXf& data,
                                     const Mask& mask,
                                     const Eigen::VectorXf& mean,
                                     const Eigen::VectorXf& sd, float vmin,
                                     std::optional<std::uint64_t> seed,
                                     bool verbose,
                                     std::shared_ptr<spdlog::logger> logger) {
  if (!logger) logger = spdlog::default_logger();

  if (mask.rows() != data.rows() || mask.cols() != data.cols()) {
    throw ShapeMismatchError("NoiseFill", "mask " + shapeString(mask) +
                                              " does not match data " +
                                              shapeString(data));
  }
  if (mean.size() != data.rows() || sd.size() != data.rows()) {
    throw ShapeMismatchError(
        "NoiseFill", "mean/sd have " + std::to_string(mean.size()) + "/" +
                         std::to_string(sd.size()) + " entries, expected " +
                         std::to_string(data.rows()));
  }
  // Negated comparison also rejects NaN
  if (!(sd.array() >= 0.0f).all()) {
    throw std::invalid_argument(
        "[NoiseFill] sd must be non-negative in every profile");
  }

  std::mt19937_64 gen(seed ? *seed : std::random_device{}());

  if (verbose) {
    logger->info("[NoiseFill] replacing {} of {} bins, vmin {}, seed {}",
                 mask.count(), mask.size(), vmin,
                 seed ? std::to_string(*seed) : std::string("random"));
  }

  Eigen::MatrixXf noisy = data;
  for (Eigen::Index c = 0; c < data.cols(); ++c) {
    for (Eigen::Index r = 0; r < data.rows(); ++r) {
      if (!mask(r, c)) continue;

      float value = mean(r);
      if (sd(r) > 0.0f) {
        std::normal_distribution<float> dist(mean(r), sd(r));
        value = dist(gen);
      }
      noisy(r, c) = value < vmin ? vmin : value;
    }
  }

  return noisy;
}

Eigen::MatrixXf replaceMaskWithNoise(const Eigen::MatrixXf& data,
                                     const Mask& mask,
                                     const Eigen::VectorXf& mean,
                                     const Eigen::VectorXf& sd,
                                     const config::NoiseFill& config,
                                     std::shared_ptr<spdlog::logger> logger) {
  return replaceMaskWithNoise(data, mask, mean, sd, config.vmin, config.seed,
                              config.verbose, std::move(logger));
}

}  // namespace ddatmos
