// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * ddatmos.hpp
 *
 * DDA-Atmos mask processing: pass combination, noise backfill and
 * ground return removal on profile x bin masks.
 *
 *  Created on: Oct 2026
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DDATMOS_DDATMOS_HPP
#define DDATMOS_DDATMOS_HPP

// Configs
#include "ddatmos/config/ddatmos.hpp"

// Data types
#include "ddatmos/exceptions.hpp"
#include "ddatmos/mask_types.hpp"

// Steps
#include "ddatmos/height_order.hpp"
#include "ddatmos/steps/combine_masks.hpp"
#include "ddatmos/steps/noise_fill.hpp"
#include "ddatmos/steps/remove_ground.hpp"

#endif  // DDATMOS_DDATMOS_HPP
