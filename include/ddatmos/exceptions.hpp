// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * exceptions.hpp
 *
 * Exception hierarchy for mask processing steps.
 *
 *   StepError (base)
 *   ├── OrderingError      - height coordinate is not strictly monotonic
 *   └── ShapeMismatchError - input arrays disagree in their dimensions
 *
 * Invalid scalar arguments (negative widths, empty inputs) are reported with
 * std::invalid_argument instead.
 *
 *  Created on: Oct 2026
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DDATMOS_EXCEPTIONS_HPP
#define DDATMOS_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

namespace ddatmos {

/**
 * @brief Base exception for step input errors.
 *
 * what() is formatted as "[step] message".
 */
class StepError : public std::runtime_error {
 public:
  StepError(const std::string& step_name, const std::string& message)
      : std::runtime_error("[" + step_name + "] " + message),
        step_name_(step_name),
        message_(message) {}

  const std::string& getStep() const { return step_name_; }
  const std::string& getMessage() const { return message_; }

 private:
  std::string step_name_;
  std::string message_;
};

/// Heights are neither strictly ascending nor strictly descending.
class OrderingError : public StepError {
 public:
  OrderingError(const std::string& step_name, const std::string& message)
      : StepError(step_name, message) {}
};

/// Masks, vectors or fields passed to a step have inconsistent shapes.
class ShapeMismatchError : public StepError {
 public:
  ShapeMismatchError(const std::string& step_name, const std::string& message)
      : StepError(step_name, message) {}
};

}  // namespace ddatmos

#endif  // DDATMOS_EXCEPTIONS_HPP
