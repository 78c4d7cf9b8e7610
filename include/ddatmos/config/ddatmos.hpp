// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef DDATMOS_CONFIG_DDATMOS_HPP
#define DDATMOS_CONFIG_DDATMOS_HPP

#include <string>

namespace YAML {
class Node;
}

#include "ddatmos/config/steps.hpp"

namespace ddatmos {

/// Configuration for the mask processing steps.
struct Config {
  config::GroundRemoval ground_removal;
  config::MaskCombination mask_combination;
  config::NoiseFill noise_fill;
};

Config parseConfig(const YAML::Node& root);
Config loadConfig(const std::string& path);

}  // namespace ddatmos

#endif  // DDATMOS_CONFIG_DDATMOS_HPP
