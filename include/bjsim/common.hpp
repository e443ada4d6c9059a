#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file common.hpp
 * @brief Logging macro and error types shared by every bjsim header
 *
 * Debug logging is compiled out unless BJSIM_DEBUG is defined. Messages use
 * printf-style formatting and are prefixed by the caller with
 * "[module::function]".
 *
 * Error hierarchy:
 * - ConfigError: bad names, numbers or configuration files (fatal at startup)
 * - RoundError: failure scoped to a single round
 *   - ShoeExhausted: a draw was attempted on an empty shoe
 *   - ProtocolError: an agent kept returning illegal actions
 */

#include <cstdio>
#include <stdexcept>
#include <string>

#ifdef BJSIM_DEBUG
#define BJSIM_LOG_DEBUG(...)            \
  do {                                  \
    std::fprintf(stderr, __VA_ARGS__);  \
    std::fprintf(stderr, "\n");         \
  } while (0)
#else
#define BJSIM_LOG_DEBUG(...) ((void)0)
#endif

namespace bjsim {

/// Invalid configuration: unknown registry name, malformed number or file
class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

/// Failure that aborts the current round only
class RoundError : public std::runtime_error {
public:
  explicit RoundError(const std::string& what) : std::runtime_error(what) {}
};

/// Draw attempted on an empty shoe
class ShoeExhausted : public RoundError {
public:
  explicit ShoeExhausted(const std::string& what) : RoundError(what) {}
};

/// Agent exceeded the allowed number of consecutive illegal actions
class ProtocolError : public RoundError {
public:
  explicit ProtocolError(const std::string& what) : RoundError(what) {}
};

}  // namespace bjsim
