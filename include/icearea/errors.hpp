// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * errors.hpp
 *
 * Error hierarchy for detection and area correction.
 *
 *   Error (base, carries ErrorKind)
 *   ├── InvalidWindowConfig - outer/guard window sizes unusable
 *   ├── InvalidConfig       - other unusable parameters (e.g. Pfa)
 *   ├── NoValidData         - channel has no valid pixel
 *   └── ModelMismatch       - feature schema differs from the model's
 *
 * ErrorKind::Internal tags any other exception escaping a channel's
 * processing (bad_alloc, logic errors).
 *
 * runPipeline() converts these into ChannelError entries so that one
 * channel's failure never hides another channel's result.
 */

#ifndef ICEAREA_ERRORS_HPP
#define ICEAREA_ERRORS_HPP

#include <stdexcept>
#include <string>

#include "icearea/raster.hpp"

namespace icearea {

enum class ErrorKind {
  InvalidWindowConfig,
  InvalidConfig,
  NoValidData,
  NumericalInstability,  ///< Diagnostic only, recovered per pixel
  ModelMismatch,
  Internal  ///< Unexpected failure inside one channel's processing
};

inline const char* toString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidWindowConfig:
      return "InvalidWindowConfig";
    case ErrorKind::InvalidConfig:
      return "InvalidConfig";
    case ErrorKind::NoValidData:
      return "NoValidData";
    case ErrorKind::NumericalInstability:
      return "NumericalInstability";
    case ErrorKind::ModelMismatch:
      return "ModelMismatch";
    case ErrorKind::Internal:
      return "Internal";
  }
  return "Unknown";
}

/**
 * @brief Base exception for detection/correction errors
 */
class Error : public std::runtime_error {
 public:
  Error(ErrorKind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

 private:
  ErrorKind kind_;
};

class InvalidWindowConfig : public Error {
 public:
  explicit InvalidWindowConfig(const std::string& message)
      : Error(ErrorKind::InvalidWindowConfig, message) {}
};

class InvalidConfig : public Error {
 public:
  explicit InvalidConfig(const std::string& message)
      : Error(ErrorKind::InvalidConfig, message) {}
};

class NoValidData : public Error {
 public:
  explicit NoValidData(const std::string& message)
      : Error(ErrorKind::NoValidData, message) {}
};

class ModelMismatch : public Error {
 public:
  explicit ModelMismatch(const std::string& message)
      : Error(ErrorKind::ModelMismatch, message) {}
};

/// Structured, user-visible failure of one channel (or one stage of it).
struct ChannelError {
  Channel channel;
  ErrorKind kind;
  std::string message;
};

}  // namespace icearea

#endif  // ICEAREA_ERRORS_HPP
