// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Types.hpp
 * @brief Common type aliases and constants for the qnoise library
 *
 * Provides foundational types used throughout qnoise including qubit
 * indices, gate identifiers, noise parameters and physical constants.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>

namespace qnoise {

/// @brief Type alias for qubit indices
using QubitIndex = std::size_t;

/// @brief Type alias for unique gate identifiers
using GateId = std::size_t;

/// @brief Type alias for rotation angles (in radians)
using Angle = double;

/// @brief Type alias for probabilities carried by noise channels
using Probability = double;

/// @brief Type alias for the random seed a noise channel samples with
using Seed = std::uint64_t;

/// @brief Sentinel value for invalid/unassigned gate IDs
inline constexpr GateId INVALID_GATE_ID = std::numeric_limits<GateId>::max();

namespace constants {

/// @brief Maximum number of qubits supported (practical limit for simulation)
inline constexpr std::size_t MAX_QUBITS = 30;

/// @brief Slack allowed when checking that channel probabilities sum to at most 1
inline constexpr double TOLERANCE = 1e-10;

/// @brief Pi constant for rotation gates
inline constexpr double PI = 3.14159265358979323846;

}  // namespace constants

}  // namespace qnoise
