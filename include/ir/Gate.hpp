// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Gate.hpp
 * @brief Quantum gate and noise channel representation
 *
 * Provides the Gate class representing unitary gates and the single-qubit
 * noise channels a noise model injects, along with factory methods and
 * utility functions for gate properties.
 *
 * @see Circuit.hpp for circuit-level operations
 * @see noise/QuantumError.hpp for the errors that produce channel gates
 */

#pragma once

#include "Qubit.hpp"
#include "Types.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace qnoise::ir {

/**
 * @brief Enumeration of supported gate types.
 *
 * Single-qubit gates: H, X, Y, Z, S, Sdg, T, Tdg, Rx, Ry, Rz
 * Two-qubit gates: CNOT, CZ, SWAP
 * Noise channels: PauliNoise, ThermalRelaxation, Reset
 */
enum class GateType {
    // Single-qubit Clifford gates
    H,      ///< Hadamard gate
    X,      ///< Pauli-X (NOT) gate
    Y,      ///< Pauli-Y gate
    Z,      ///< Pauli-Z gate
    S,      ///< S gate (sqrt(Z))
    Sdg,    ///< S-dagger gate
    T,      ///< T gate (sqrt(S))
    Tdg,    ///< T-dagger gate

    // Single-qubit rotation gates (parameterized)
    Rx,     ///< Rotation around X-axis
    Ry,     ///< Rotation around Y-axis
    Rz,     ///< Rotation around Z-axis

    // Two-qubit gates
    CNOT,   ///< Controlled-NOT (CX) gate
    CZ,     ///< Controlled-Z gate
    SWAP,   ///< SWAP gate

    // Single-qubit noise channels
    PauliNoise,         ///< Random X/Y/Z flips with probabilities (px, py, pz)
    ThermalRelaxation,  ///< T1/T2 relaxation over a gate time
    Reset               ///< Reset to |0> with p0, to |1> with p1
};

/// @brief Every gate type, in declaration order.
inline constexpr GateType ALL_GATE_TYPES[] = {
    GateType::H,  GateType::X,    GateType::Y,   GateType::Z,
    GateType::S,  GateType::Sdg,  GateType::T,   GateType::Tdg,
    GateType::Rx, GateType::Ry,   GateType::Rz,
    GateType::CNOT, GateType::CZ, GateType::SWAP,
    GateType::PauliNoise, GateType::ThermalRelaxation, GateType::Reset};

/**
 * @brief Returns the name of a gate type as a string.
 * @param type The gate type
 * @return String representation of the gate type
 */
[[nodiscard]] constexpr std::string_view gateTypeName(GateType type) noexcept {
    switch (type) {
        case GateType::H:    return "H";
        case GateType::X:    return "X";
        case GateType::Y:    return "Y";
        case GateType::Z:    return "Z";
        case GateType::S:    return "S";
        case GateType::Sdg:  return "Sdg";
        case GateType::T:    return "T";
        case GateType::Tdg:  return "Tdg";
        case GateType::Rx:   return "Rx";
        case GateType::Ry:   return "Ry";
        case GateType::Rz:   return "Rz";
        case GateType::CNOT: return "CNOT";
        case GateType::CZ:   return "CZ";
        case GateType::SWAP: return "SWAP";
        case GateType::PauliNoise:        return "PauliNoise";
        case GateType::ThermalRelaxation: return "ThermalRelaxation";
        case GateType::Reset:             return "Reset";
    }
    return "Unknown";
}

/**
 * @brief Looks up a gate type by name.
 *
 * Matching is case-insensitive. "CX" is accepted as an alias for CNOT.
 *
 * @param name Gate name, e.g. "h", "CNOT", "rz"
 * @return The gate type, or std::nullopt if no gate has that name
 */
[[nodiscard]] inline std::optional<GateType> gateTypeFromName(std::string_view name) {
    auto equalsIgnoreCase = [](std::string_view a, std::string_view b) {
        return a.size() == b.size() &&
               std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
                   return std::tolower(static_cast<unsigned char>(x)) ==
                          std::tolower(static_cast<unsigned char>(y));
               });
    };

    if (equalsIgnoreCase(name, "CX")) {
        return GateType::CNOT;
    }
    for (GateType type : ALL_GATE_TYPES) {
        if (equalsIgnoreCase(name, gateTypeName(type))) {
            return type;
        }
    }
    return std::nullopt;
}

/**
 * @brief Returns the number of qubits a gate type acts on.
 * @param type The gate type
 * @return Number of qubits (1 or 2)
 */
[[nodiscard]] constexpr std::size_t numQubitsFor(GateType type) noexcept {
    switch (type) {
        case GateType::CNOT:
        case GateType::CZ:
        case GateType::SWAP:
            return 2;
        default:
            return 1;
    }
}

/**
 * @brief Returns whether a gate type is parameterized.
 * @param type The gate type
 * @return true if the gate requires a rotation angle parameter
 */
[[nodiscard]] constexpr bool isParameterized(GateType type) noexcept {
    switch (type) {
        case GateType::Rx:
        case GateType::Ry:
        case GateType::Rz:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Returns whether a gate type is a noise channel.
 * @param type The gate type
 * @return true for PauliNoise, ThermalRelaxation and Reset
 */
[[nodiscard]] constexpr bool isChannel(GateType type) noexcept {
    switch (type) {
        case GateType::PauliNoise:
        case GateType::ThermalRelaxation:
        case GateType::Reset:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Returns how many numeric parameters a channel type carries.
 *
 * PauliNoise: (px, py, pz). ThermalRelaxation: (t1, t2, time,
 * excited_population). Reset: (p0, p1). Zero for unitary gates.
 */
[[nodiscard]] constexpr std::size_t numChannelParameters(GateType type) noexcept {
    switch (type) {
        case GateType::PauliNoise:        return 3;
        case GateType::ThermalRelaxation: return 4;
        case GateType::Reset:             return 2;
        default:                          return 0;
    }
}

/**
 * @brief Represents a quantum gate or noise channel operation.
 *
 * A Gate consists of a type, target qubit(s), an optional rotation
 * parameter, channel parameters (noise channels only), an optional seed,
 * a trainable flag and a unique identifier. Gates are value types and can
 * be copied/moved.
 *
 * Example:
 * @code
 * auto h = Gate::h(0);                          // Hadamard on qubit 0
 * auto cx = Gate::cnot(0, 1);                   // CNOT with control=0, target=1
 * auto rz = Gate::rz(0, PI/4);                  // Rz(π/4) on qubit 0
 * auto pn = Gate::pauliNoise(1, 0.1, 0.0, 0.0); // bit-flip channel on qubit 1
 * @endcode
 */
class Gate {
public:
    /**
     * @brief Constructs a unitary gate with the given properties.
     * @param type The gate type
     * @param qubits Target qubit indices
     * @param parameter Optional rotation angle (for Rx, Ry, Rz)
     * @param id Unique gate identifier (default: INVALID_GATE_ID)
     * @throws std::invalid_argument if qubit count doesn't match gate type
     *         or if type is a noise channel
     */
    Gate(GateType type,
         std::vector<QubitIndex> qubits,
         std::optional<Angle> parameter = std::nullopt,
         GateId id = INVALID_GATE_ID)
        : type_(type)
        , qubits_(std::move(qubits))
        , parameter_(parameter)
        , id_(id)
    {
        validate();
    }

    /**
     * @brief Constructs a noise channel acting on one qubit.
     * @param type The channel type
     * @param qubit Qubit the channel acts on
     * @param channel_parameters Parameters in the order numChannelParameters() documents
     * @param seed Optional seed for the channel's random sampling
     * @throws std::invalid_argument if type is not a channel or the
     *         parameter count is wrong
     */
    Gate(GateType type,
         QubitIndex qubit,
         std::vector<double> channel_parameters,
         std::optional<Seed> seed = std::nullopt)
        : type_(type)
        , qubits_{qubit}
        , channel_parameters_(std::move(channel_parameters))
        , seed_(seed)
        , id_(INVALID_GATE_ID)
    {
        validate();
    }

    // Default special members
    ~Gate() noexcept = default;
    Gate(const Gate&) = default;
    Gate& operator=(const Gate&) = default;
    Gate(Gate&&) noexcept = default;
    Gate& operator=(Gate&&) noexcept = default;

    // -------------------------------------------------------------------------
    // Factory Methods
    // -------------------------------------------------------------------------

    /// @brief Creates a Hadamard gate on the specified qubit.
    [[nodiscard]] static Gate h(QubitIndex qubit) {
        return Gate(GateType::H, {qubit});
    }

    /// @brief Creates a Pauli-X gate on the specified qubit.
    [[nodiscard]] static Gate x(QubitIndex qubit) {
        return Gate(GateType::X, {qubit});
    }

    /// @brief Creates a Pauli-Y gate on the specified qubit.
    [[nodiscard]] static Gate y(QubitIndex qubit) {
        return Gate(GateType::Y, {qubit});
    }

    /// @brief Creates a Pauli-Z gate on the specified qubit.
    [[nodiscard]] static Gate z(QubitIndex qubit) {
        return Gate(GateType::Z, {qubit});
    }

    /// @brief Creates an S gate on the specified qubit.
    [[nodiscard]] static Gate s(QubitIndex qubit) {
        return Gate(GateType::S, {qubit});
    }

    /// @brief Creates an S-dagger gate on the specified qubit.
    [[nodiscard]] static Gate sdg(QubitIndex qubit) {
        return Gate(GateType::Sdg, {qubit});
    }

    /// @brief Creates a T gate on the specified qubit.
    [[nodiscard]] static Gate t(QubitIndex qubit) {
        return Gate(GateType::T, {qubit});
    }

    /// @brief Creates a T-dagger gate on the specified qubit.
    [[nodiscard]] static Gate tdg(QubitIndex qubit) {
        return Gate(GateType::Tdg, {qubit});
    }

    /// @brief Creates an Rx rotation gate.
    [[nodiscard]] static Gate rx(QubitIndex qubit, Angle angle) {
        return Gate(GateType::Rx, {qubit}, angle);
    }

    /// @brief Creates an Ry rotation gate.
    [[nodiscard]] static Gate ry(QubitIndex qubit, Angle angle) {
        return Gate(GateType::Ry, {qubit}, angle);
    }

    /// @brief Creates an Rz rotation gate.
    [[nodiscard]] static Gate rz(QubitIndex qubit, Angle angle) {
        return Gate(GateType::Rz, {qubit}, angle);
    }

    /// @brief Creates a CNOT gate with specified control and target qubits.
    /// @throws std::invalid_argument if control == target
    [[nodiscard]] static Gate cnot(QubitIndex control, QubitIndex target) {
        if (control == target) {
            throw std::invalid_argument(
                "CNOT control and target must be different qubits");
        }
        return Gate(GateType::CNOT, {control, target});
    }

    /// @brief Creates a CZ gate with specified control and target qubits.
    /// @throws std::invalid_argument if control == target
    [[nodiscard]] static Gate cz(QubitIndex control, QubitIndex target) {
        if (control == target) {
            throw std::invalid_argument(
                "CZ control and target must be different qubits");
        }
        return Gate(GateType::CZ, {control, target});
    }

    /// @brief Creates a SWAP gate between two qubits.
    /// @throws std::invalid_argument if qubit1 == qubit2
    [[nodiscard]] static Gate swap(QubitIndex qubit1, QubitIndex qubit2) {
        if (qubit1 == qubit2) {
            throw std::invalid_argument(
                "SWAP requires two different qubits");
        }
        return Gate(GateType::SWAP, {qubit1, qubit2});
    }

    /// @brief Creates a Pauli noise channel on the specified qubit.
    [[nodiscard]] static Gate pauliNoise(QubitIndex qubit,
                                         Probability px,
                                         Probability py,
                                         Probability pz,
                                         std::optional<Seed> seed = std::nullopt) {
        return Gate(GateType::PauliNoise, qubit, {px, py, pz}, seed);
    }

    /// @brief Creates a thermal relaxation channel on the specified qubit.
    [[nodiscard]] static Gate thermalRelaxation(QubitIndex qubit,
                                                double t1,
                                                double t2,
                                                double time,
                                                Probability excited_population = 0.0,
                                                std::optional<Seed> seed = std::nullopt) {
        return Gate(GateType::ThermalRelaxation, qubit,
                    {t1, t2, time, excited_population}, seed);
    }

    /// @brief Creates a reset channel on the specified qubit.
    [[nodiscard]] static Gate reset(QubitIndex qubit,
                                    Probability p0,
                                    Probability p1,
                                    std::optional<Seed> seed = std::nullopt) {
        return Gate(GateType::Reset, qubit, {p0, p1}, seed);
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    /// @brief Returns the gate type.
    [[nodiscard]] GateType type() const noexcept { return type_; }

    /// @brief Returns the target qubit indices.
    [[nodiscard]] const std::vector<QubitIndex>& qubits() const noexcept {
        return qubits_;
    }

    /// @brief Returns the rotation parameter if present.
    [[nodiscard]] std::optional<Angle> parameter() const noexcept {
        return parameter_;
    }

    /// @brief Returns the channel parameters (empty for unitary gates).
    [[nodiscard]] const std::vector<double>& channelParameters() const noexcept {
        return channel_parameters_;
    }

    /// @brief Returns the channel's seed if one was given.
    [[nodiscard]] std::optional<Seed> seed() const noexcept { return seed_; }

    /// @brief Returns the unique gate identifier.
    [[nodiscard]] GateId id() const noexcept { return id_; }

    /// @brief Sets the gate identifier.
    void setId(GateId id) noexcept { id_ = id; }

    /// @brief Returns whether the rotation parameter may be updated by training.
    [[nodiscard]] bool trainable() const noexcept { return trainable_; }

    /// @brief Marks the rotation parameter as trainable or frozen.
    void setTrainable(bool trainable) noexcept { trainable_ = trainable; }

    /// @brief Returns the number of qubits this gate acts on.
    [[nodiscard]] std::size_t numQubits() const noexcept {
        return qubits_.size();
    }

    /// @brief Returns whether this gate is parameterized.
    [[nodiscard]] bool isParameterized() const noexcept {
        return parameter_.has_value();
    }

    /// @brief Returns whether this gate is a noise channel.
    [[nodiscard]] bool isChannel() const noexcept {
        return ir::isChannel(type_);
    }

    // -------------------------------------------------------------------------
    // Operators
    // -------------------------------------------------------------------------

    /// @brief Equality comparison (ignores id and trainable flag).
    [[nodiscard]] bool operator==(const Gate& other) const noexcept {
        return type_ == other.type_ &&
               qubits_ == other.qubits_ &&
               parameter_ == other.parameter_ &&
               channel_parameters_ == other.channel_parameters_ &&
               seed_ == other.seed_;
    }

    /// @brief Inequality comparison.
    [[nodiscard]] bool operator!=(const Gate& other) const noexcept {
        return !(*this == other);
    }

    /**
     * @brief Returns a string representation of the gate.
     *
     * Unitary gates: "CNOT q[0], q[1]", "Rz(0.785398) q[0]".
     * Channels: "PauliNoise(0.5, 0, 0) q[0]", with "; seed=N" appended
     * inside the parentheses when a seed is set.
     */
    [[nodiscard]] std::string toString() const {
        std::string result{gateTypeName(type_)};
        if (parameter_.has_value()) {
            result += "(" + std::to_string(parameter_.value()) + ")";
        }
        if (isChannel()) {
            std::ostringstream params;
            for (std::size_t i = 0; i < channel_parameters_.size(); ++i) {
                if (i > 0) params << ", ";
                params << channel_parameters_[i];
            }
            if (seed_.has_value()) {
                params << "; seed=" << seed_.value();
            }
            result += "(" + params.str() + ")";
        }
        result += " " + formatQubits(qubits_);
        return result;
    }

private:
    GateType type_;
    std::vector<QubitIndex> qubits_;
    std::optional<Angle> parameter_;
    std::vector<double> channel_parameters_;
    std::optional<Seed> seed_;
    GateId id_;
    bool trainable_ = true;

    /// @brief Validates gate construction parameters.
    void validate() const {
        const std::size_t expected = numQubitsFor(type_);
        if (qubits_.size() != expected) {
            throw std::invalid_argument(
                "Gate " + std::string(gateTypeName(type_)) +
                " requires " + std::to_string(expected) +
                " qubit(s), got " + std::to_string(qubits_.size()));
        }

        if (ir::isParameterized(type_) && !parameter_.has_value()) {
            throw std::invalid_argument(
                "Gate " + std::string(gateTypeName(type_)) +
                " requires a rotation parameter");
        }

        const std::size_t expected_params = numChannelParameters(type_);
        if (channel_parameters_.size() != expected_params) {
            throw std::invalid_argument(
                "Gate " + std::string(gateTypeName(type_)) +
                " requires " + std::to_string(expected_params) +
                " channel parameter(s), got " +
                std::to_string(channel_parameters_.size()));
        }
    }
};

}  // namespace qnoise::ir
