// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Circuit.hpp
 * @brief Quantum circuit container and operations
 *
 * Provides the Circuit class for building quantum circuits and reading them
 * back. Circuits consist of a qubit register, a sequence of gates and the
 * bookkeeping that travels with them: which gates carry parameters, which of
 * those are trainable, and which qubits are measured into which registers.
 *
 * @see Gate.hpp for gate representation
 * @see noise/NoiseModel.hpp for producing noisy copies of a circuit
 */

#pragma once

#include "Gate.hpp"
#include "Qubit.hpp"
#include "Types.hpp"

#include <algorithm>
#include <map>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace qnoise::ir {

/**
 * @brief A quantum circuit consisting of qubits and gates.
 *
 * Circuits are containers for quantum gates applied to a fixed-size qubit
 * register. Gates are stored in application order and can be iterated.
 * Measurements are kept apart from the gate sequence, as a set of named
 * registers plus the ordered list of measured qubits (the collective
 * measurement gate).
 *
 * Example:
 * @code
 * Circuit circuit(2);  // 2-qubit circuit
 * circuit.addGate(Gate::h(0));
 * circuit.addGate(Gate::cnot(0, 1));
 * circuit.addMeasurement("m", {0, 1});
 *
 * for (const auto& gate : circuit) {
 *     std::cout << gate.toString() << "\n";
 * }
 * @endcode
 */
class Circuit {
public:
    // Gates are read-only once added.
    using iterator = std::vector<Gate>::const_iterator;
    using const_iterator = std::vector<Gate>::const_iterator;

    /// @brief Register name -> measured qubits, in measurement order.
    using MeasurementTuples = std::map<std::string, std::vector<QubitIndex>>;

    /**
     * @brief Constructs an empty circuit with the specified number of qubits.
     * @param num_qubits Number of qubits in the circuit register
     * @throws std::invalid_argument if num_qubits is 0 or exceeds MAX_QUBITS
     */
    explicit Circuit(std::size_t num_qubits)
        : num_qubits_(num_qubits)
        , next_gate_id_(0)
    {
        if (num_qubits == 0) {
            throw std::invalid_argument("Circuit must have at least 1 qubit");
        }
        if (num_qubits > constants::MAX_QUBITS) {
            throw std::invalid_argument(
                "Circuit exceeds maximum qubit count of " +
                std::to_string(constants::MAX_QUBITS));
        }
    }

    // Move semantics (circuits can be large)
    Circuit(Circuit&&) noexcept = default;
    Circuit& operator=(Circuit&&) noexcept = default;

    // Delete copy (use clone() if needed)
    Circuit(const Circuit&) = delete;
    Circuit& operator=(const Circuit&) = delete;

    ~Circuit() noexcept = default;

    // -------------------------------------------------------------------------
    // Gate Management
    // -------------------------------------------------------------------------

    /**
     * @brief Adds a gate to the circuit.
     *
     * Parameterized gates are recorded in parametrizedGates(), and also in
     * trainableGates() when the gate's trainable flag is set.
     *
     * @param gate The gate to add
     * @throws std::out_of_range if gate references qubit beyond circuit size
     */
    void addGate(Gate gate) {
        validateGateQubits(gate);
        gate.setId(next_gate_id_++);
        if (gate.isParameterized()) {
            parametrized_gates_.push_back(gate.id());
            if (gate.trainable()) {
                trainable_gates_.push_back(gate.id());
            }
        }
        gates_.push_back(std::move(gate));
    }

    /**
     * @brief Returns the gate at the specified index.
     * @param index Gate index
     * @return Reference to the gate
     * @throws std::out_of_range if index >= numGates()
     */
    [[nodiscard]] const Gate& gate(std::size_t index) const {
        if (index >= gates_.size()) {
            throw std::out_of_range(
                "Gate index " + std::to_string(index) +
                " out of range [0, " + std::to_string(gates_.size()) + ")");
        }
        return gates_[index];
    }

    /**
     * @brief Returns all gates in the circuit.
     * @return Const reference to the gate vector
     */
    [[nodiscard]] const std::vector<Gate>& gates() const noexcept {
        return gates_;
    }

    /// @brief IDs of parameterized gates, in the order they were added.
    [[nodiscard]] const std::vector<GateId>& parametrizedGates() const noexcept {
        return parametrized_gates_;
    }

    /// @brief IDs of parameterized gates whose parameter is trainable.
    [[nodiscard]] const std::vector<GateId>& trainableGates() const noexcept {
        return trainable_gates_;
    }

    // -------------------------------------------------------------------------
    // Measurements
    // -------------------------------------------------------------------------

    /**
     * @brief Measures qubits into a named register.
     * @param register_name Name of the classical register
     * @param qubits Qubits to measure, in bit order
     * @throws std::invalid_argument if the register already exists, qubits is
     *         empty, or a qubit is already measured
     * @throws std::out_of_range if a qubit is beyond the circuit size
     */
    void addMeasurement(const std::string& register_name,
                        std::vector<QubitIndex> qubits) {
        if (measurement_tuples_.count(register_name) > 0) {
            throw std::invalid_argument(
                "Measurement register '" + register_name + "' already exists");
        }
        if (qubits.empty()) {
            throw std::invalid_argument(
                "Measurement register '" + register_name +
                "' must measure at least one qubit");
        }
        for (auto q : qubits) {
            if (!isValidQubit(q, num_qubits_)) {
                throw std::out_of_range(
                    "Measurement references qubit " + std::to_string(q) +
                    " but circuit only has " + std::to_string(num_qubits_) +
                    " qubits");
            }
            if (std::find(measured_qubits_.begin(), measured_qubits_.end(), q) !=
                measured_qubits_.end()) {
                throw std::invalid_argument(
                    "Qubit " + std::to_string(q) + " is already measured");
            }
        }

        measured_qubits_.insert(measured_qubits_.end(), qubits.begin(), qubits.end());
        measurement_tuples_.emplace(register_name, std::move(qubits));
    }

    /// @brief Returns the measurement registers.
    [[nodiscard]] const MeasurementTuples& measurementTuples() const noexcept {
        return measurement_tuples_;
    }

    /// @brief Returns the qubits acted on by the collective measurement gate.
    [[nodiscard]] const std::vector<QubitIndex>& measuredQubits() const noexcept {
        return measured_qubits_;
    }

    /// @brief Returns true if any qubit is measured.
    [[nodiscard]] bool hasMeasurements() const noexcept {
        return !measured_qubits_.empty();
    }

    /**
     * @brief Copies measurement registers and the measurement gate from another
     * circuit, replacing this circuit's own.
     * @param other Circuit to copy from
     * @throws std::invalid_argument if the register sizes differ
     */
    void copyMeasurements(const Circuit& other) {
        if (other.num_qubits_ != num_qubits_) {
            throw std::invalid_argument(
                "Cannot copy measurements from a " +
                std::to_string(other.num_qubits_) + "-qubit circuit into a " +
                std::to_string(num_qubits_) + "-qubit circuit");
        }
        measurement_tuples_ = other.measurement_tuples_;
        measured_qubits_ = other.measured_qubits_;
    }

    // -------------------------------------------------------------------------
    // Circuit Properties
    // -------------------------------------------------------------------------

    /// @brief Returns the number of qubits in the circuit.
    [[nodiscard]] std::size_t numQubits() const noexcept { return num_qubits_; }

    /// @brief Returns the number of gates in the circuit.
    [[nodiscard]] std::size_t numGates() const noexcept { return gates_.size(); }

    /// @brief Returns true if the circuit has no gates.
    [[nodiscard]] bool empty() const noexcept { return gates_.empty(); }

    /**
     * @brief Calculates the circuit depth.
     *
     * Depth is the maximum number of gates on any single qubit path,
     * representing the critical path length. Noise channels count as gates.
     *
     * @return Circuit depth (0 for empty circuits)
     */
    [[nodiscard]] std::size_t depth() const noexcept {
        if (gates_.empty()) {
            return 0;
        }

        std::vector<std::size_t> qubit_depths(num_qubits_, 0);

        for (const auto& g : gates_) {
            std::size_t max_depth = 0;
            for (auto q : g.qubits()) {
                max_depth = std::max(max_depth, qubit_depths[q]);
            }
            for (auto q : g.qubits()) {
                qubit_depths[q] = max_depth + 1;
            }
        }

        return *std::max_element(qubit_depths.begin(), qubit_depths.end());
    }

    /**
     * @brief Counts gates of a specific type.
     * @param type The gate type to count
     * @return Number of gates of the specified type
     */
    [[nodiscard]] std::size_t countGates(GateType type) const noexcept {
        return static_cast<std::size_t>(
            std::count_if(gates_.begin(), gates_.end(),
                          [type](const Gate& g) { return g.type() == type; }));
    }

    /**
     * @brief Counts noise channels in the circuit.
     * @return Number of PauliNoise, ThermalRelaxation and Reset gates
     */
    [[nodiscard]] std::size_t countChannels() const noexcept {
        return static_cast<std::size_t>(
            std::count_if(gates_.begin(), gates_.end(),
                          [](const Gate& g) { return g.isChannel(); }));
    }

    // -------------------------------------------------------------------------
    // Iteration
    // -------------------------------------------------------------------------

    [[nodiscard]] const_iterator begin() const noexcept { return gates_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return gates_.end(); }
    [[nodiscard]] const_iterator cbegin() const noexcept { return gates_.cbegin(); }
    [[nodiscard]] const_iterator cend() const noexcept { return gates_.cend(); }

    // -------------------------------------------------------------------------
    // Utilities
    // -------------------------------------------------------------------------

    /**
     * @brief Creates an empty circuit with the same register as this one.
     * @return New circuit with no gates and no measurements
     */
    [[nodiscard]] Circuit emptyLike() const {
        return Circuit(num_qubits_);
    }

    /**
     * @brief Creates a deep copy of the circuit.
     * @return New circuit with copied gates and measurements
     */
    [[nodiscard]] Circuit clone() const {
        Circuit copy(num_qubits_);
        copy.gates_ = gates_;
        copy.parametrized_gates_ = parametrized_gates_;
        copy.trainable_gates_ = trainable_gates_;
        copy.measurement_tuples_ = measurement_tuples_;
        copy.measured_qubits_ = measured_qubits_;
        copy.next_gate_id_ = next_gate_id_;
        return copy;
    }

    /**
     * @brief Returns a string representation of the circuit.
     * @return Multi-line string showing circuit structure
     */
    [[nodiscard]] std::string toString() const {
        std::string result = "Circuit(" + std::to_string(num_qubits_) +
                             " qubits, " + std::to_string(gates_.size()) +
                             " gates, depth " + std::to_string(depth()) + "):\n";
        for (const auto& g : gates_) {
            result += "  " + g.toString() + "\n";
        }
        for (const auto& [name, qubits] : measurement_tuples_) {
            result += "  measure " + formatQubits(qubits) + " -> " + name + "\n";
        }
        return result;
    }

private:
    std::size_t num_qubits_;
    std::vector<Gate> gates_;
    std::vector<GateId> parametrized_gates_;
    std::vector<GateId> trainable_gates_;
    MeasurementTuples measurement_tuples_;
    std::vector<QubitIndex> measured_qubits_;
    GateId next_gate_id_;

    /**
     * @brief Validates that a gate's qubits are within circuit bounds.
     * @param g The gate to validate
     * @throws std::out_of_range if any qubit index is invalid
     */
    void validateGateQubits(const Gate& g) const {
        for (auto q : g.qubits()) {
            if (!isValidQubit(q, num_qubits_)) {
                throw std::out_of_range(
                    "Gate " + std::string(gateTypeName(g.type())) +
                    " references qubit " + std::to_string(q) +
                    " but circuit only has " + std::to_string(num_qubits_) +
                    " qubits");
            }
        }
    }
};

/**
 * @brief Stream output operator for Circuit.
 * @param os Output stream
 * @param circuit The circuit to output
 * @return Reference to the output stream
 */
inline std::ostream& operator<<(std::ostream& os, const Circuit& circuit) {
    os << circuit.toString();
    return os;
}

}  // namespace qnoise::ir
