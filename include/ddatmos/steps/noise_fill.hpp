// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * noise_fill.hpp
 *
 * Replaces masked bins of a data field with per-profile Gaussian noise,
 * so that a second density pass does not see the first pass's layers.
 *
 *  Created on: Oct 2026
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DDATMOS_STEPS_NOISE_FILL_HPP
#define DDATMOS_STEPS_NOISE_FILL_HPP

#include <Eigen/Core>
#include <cstdint>
#include <memory>
#include <optional>

#include "ddatmos/config/steps.hpp"
#include "ddatmos/mask_types.hpp"

namespace spdlog {
class logger;
}

namespace ddatmos {

/**
 * @brief Fills masked bins with draws from N(mean[i], sd[i]).
 *
 * Draws below vmin are raised to vmin. Unmasked bins keep their values,
 * NaN included. Draws are taken in column-major order from a single
 * generator, so a fixed seed reproduces the output.
 *
 * @param data Data field (n, m), not modified
 * @param mask Bins to replace (n, m)
 * @param mean Noise mean per profile (n)
 * @param sd Noise standard deviation per profile (n), >= 0
 * @param vmin Lower clamp for drawn values
 * @param seed Generator seed (unset: non-deterministic)
 *
 * @throws ShapeMismatchError if the input shapes disagree
 * @throws std::invalid_argument if sd has a negative or NaN entry
 */
Eigen::MatrixXf replaceMaskWithNoise(
    const Eigen::MatrixXf& data, const Mask& mask, const Eigen::VectorXf& mean,
    const Eigen::VectorXf& sd, float vmin = 0.0f,
    std::optional<std::uint64_t> seed = std::nullopt, bool verbose = false,
    std::shared_ptr<spdlog::logger> logger = nullptr);

Eigen::MatrixXf replaceMaskWithNoise(
    const Eigen::MatrixXf& data, const Mask& mask, const Eigen::VectorXf& mean,
    const Eigen::VectorXf& sd, const config::NoiseFill& config,
    std::shared_ptr<spdlog::logger> logger = nullptr);

}  // namespace ddatmos

#endif  // DDATMOS_STEPS_NOISE_FILL_HPP
