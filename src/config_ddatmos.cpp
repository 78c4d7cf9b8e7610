// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * config_ddatmos.cpp
 *
 * YAML configuration loading.
 *
 *  Created on: Oct 2026
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <stdexcept>

#include "ddatmos/config/ddatmos.hpp"

namespace ddatmos {
namespace detail {

template <typename T>
void load(const YAML::Node& node, const std::string& key, T& value) {
  if (node[key]) {
    value = node[key].as<T>();
  }
}

Config parse(const YAML::Node& root) {
  Config cfg;

  if (auto n = root["ground_removal"]) {
    load(n, "ground_width", cfg.ground_removal.ground_width);
    load(n, "verbose", cfg.ground_removal.verbose);
  }

  if (auto n = root["mask_combination"]) {
    load(n, "min_cluster_size", cfg.mask_combination.min_cluster_size);
    load(n, "verbose", cfg.mask_combination.verbose);
  }

  if (auto n = root["noise_fill"]) {
    load(n, "vmin", cfg.noise_fill.vmin);
    load(n, "verbose", cfg.noise_fill.verbose);
    // A null seed (`seed: ~`) keeps the non-deterministic default
    if (n["seed"] && !n["seed"].IsNull()) {
      cfg.noise_fill.seed = n["seed"].as<std::uint64_t>();
    }
  }

  return cfg;
}

void validate(Config& cfg) {
  // --- Fatal: values no step can work with ---
  if (!std::isfinite(cfg.noise_fill.vmin)) {
    throw std::invalid_argument("noise_fill.vmin must be finite, got " +
                                std::to_string(cfg.noise_fill.vmin));
  }

  // --- Non-fatal: warn and clamp ---
  auto warn_clamp_min = [](const std::string& name, int& val, int lo) {
    if (val < lo) {
      spdlog::warn("[Config] {} ({}) must be >= {}, clamping", name, val, lo);
      val = lo;
    }
  };

  warn_clamp_min("ground_removal.ground_width",
                 cfg.ground_removal.ground_width, 0);
  warn_clamp_min("mask_combination.min_cluster_size",
                 cfg.mask_combination.min_cluster_size, 0);
}

}  // namespace detail

Config parseConfig(const YAML::Node& root) {
  auto cfg = detail::parse(root);
  detail::validate(cfg);
  return cfg;
}

Config loadConfig(const std::string& path) {
  try {
    return parseConfig(YAML::LoadFile(path));
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load config: " + path + " - " +
                             e.what());
  }
}

}  // namespace ddatmos
