// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Qubit.hpp
 * @brief Qubit index checks and formatting
 *
 * Qubits are zero-based indices into a circuit's fixed register.
 *
 * @see Types.hpp for QubitIndex definition
 * @see Circuit.hpp for qubit register management
 */

#pragma once

#include "Types.hpp"

#include <string>
#include <vector>

namespace qnoise::ir {

/**
 * @brief Validates that a qubit index is within bounds.
 * @param qubit The qubit index to validate
 * @param num_qubits Total number of qubits in the circuit
 * @return true if the qubit index is valid
 */
[[nodiscard]] constexpr bool isValidQubit(QubitIndex qubit,
                                           std::size_t num_qubits) noexcept {
    return qubit < num_qubits;
}

/**
 * @brief Formats a list of qubits as "q[0], q[1], ...".
 * @param qubits Qubit indices in display order
 * @return Comma-separated qubit references
 */
[[nodiscard]] inline std::string formatQubits(const std::vector<QubitIndex>& qubits) {
    std::string result;
    for (std::size_t i = 0; i < qubits.size(); ++i) {
        if (i > 0) result += ", ";
        result += "q[" + std::to_string(qubits[i]) + "]";
    }
    return result;
}

}  // namespace qnoise::ir
