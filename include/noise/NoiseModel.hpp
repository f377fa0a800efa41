// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file NoiseModel.hpp
 * @brief Noise model: per-gate-type quantum errors and their injection
 *
 * A NoiseModel maps gate types to quantum errors, optionally restricted by
 * source and target qubit filters. apply() produces a noisy copy of a
 * circuit in which every gate with a registered error is followed by that
 * error's channel on the selected qubits.
 *
 * @see QuantumError.hpp for the error kinds
 * @see NoiseConfig.hpp for loading a model from YAML
 */

#pragma once

#include "QuantumError.hpp"
#include "../ir/Circuit.hpp"
#include "../ir/Gate.hpp"

#include <algorithm>
#include <initializer_list>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace qnoise::noise {

/**
 * @brief A deduplicated, ascending set of qubits.
 *
 * Implicitly constructible from a single qubit, so both forms below
 * register the same filter:
 * @code
 * model.add(error, ir::GateType::H, 1);
 * model.add(error, ir::GateType::H, QubitFilter{1});
 * @endcode
 */
class QubitFilter {
public:
    using const_iterator = std::set<QubitIndex>::const_iterator;

    /// Not explicit: a single qubit is accepted wherever a filter is.
    QubitFilter(QubitIndex qubit) : qubits_{qubit} {}

    QubitFilter(std::initializer_list<QubitIndex> qubits) : qubits_(qubits) {}

    QubitFilter(const std::vector<QubitIndex>& qubits)
        : qubits_(qubits.begin(), qubits.end()) {}

    [[nodiscard]] bool contains(QubitIndex qubit) const {
        return qubits_.count(qubit) > 0;
    }

    [[nodiscard]] std::size_t size() const noexcept { return qubits_.size(); }
    [[nodiscard]] bool empty() const noexcept { return qubits_.empty(); }

    [[nodiscard]] const_iterator begin() const noexcept { return qubits_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return qubits_.end(); }

    /// @brief Returns the filter's qubits in ascending order.
    [[nodiscard]] std::vector<QubitIndex> toVector() const {
        return {qubits_.begin(), qubits_.end()};
    }

    /**
     * @brief Returns the qubits present both here and in @p qubits.
     * @return Ascending, deduplicated intersection
     */
    [[nodiscard]] std::vector<QubitIndex> intersect(const std::vector<QubitIndex>& qubits) const {
        std::vector<QubitIndex> result;
        for (QubitIndex q : qubits_) {
            if (std::find(qubits.begin(), qubits.end(), q) != qubits.end()) {
                result.push_back(q);
            }
        }
        return result;
    }

    [[nodiscard]] bool operator==(const QubitFilter& other) const {
        return qubits_ == other.qubits_;
    }

    [[nodiscard]] bool operator!=(const QubitFilter& other) const {
        return !(*this == other);
    }

    /// @brief Returns e.g. "{0, 2}".
    [[nodiscard]] std::string toString() const {
        std::string result = "{";
        bool first = true;
        for (QubitIndex q : qubits_) {
            if (!first) result += ", ";
            result += std::to_string(q);
            first = false;
        }
        return result + "}";
    }

private:
    std::set<QubitIndex> qubits_;
};

/**
 * @brief A quantum error registered for one gate type.
 */
struct NoiseEntry {
    /// Error whose channel is injected after each matching gate.
    QuantumError error;

    /// Only gates touching one of these qubits trigger injection.
    std::optional<QubitFilter> source_qubits;

    /// Qubits the channels act on, instead of the gate's own qubits.
    std::optional<QubitFilter> target_qubits;
};

/**
 * @brief Maps gate types to quantum errors and injects them into circuits.
 *
 * At most one error is registered per gate type; registering again replaces
 * the previous entry. A model is not synchronized: calls to add() must not
 * overlap with apply(), but apply() may run concurrently on several circuits.
 *
 * Example:
 * @code
 * NoiseModel noise;
 * noise.add(QuantumError::pauli(0.5), ir::GateType::H, 1);
 * noise.add(QuantumError::pauli(0.0, 0.5), ir::GateType::CNOT);
 *
 * ir::Circuit c(2);
 * c.addGate(ir::Gate::h(0));
 * c.addGate(ir::Gate::h(1));
 * c.addGate(ir::Gate::cnot(0, 1));
 *
 * ir::Circuit noisy = noise.apply(c);
 * // H q[0]; H q[1]; PauliNoise q[1]; CNOT q[0], q[1]; PauliNoise q[0]; PauliNoise q[1]
 * @endcode
 */
class NoiseModel {
public:
    NoiseModel() = default;

    // -------------------------------------------------------------------------
    // Registration
    // -------------------------------------------------------------------------

    /**
     * @brief Registers a quantum error for a gate type.
     *
     * Any gate type is accepted, including channel types. An existing entry
     * for @p gate is replaced.
     *
     * @param error Error to inject after each matching gate
     * @param gate Gate type the error follows
     * @param source_qubits If set, only gates touching these qubits trigger
     * @param target_qubits If set, channels act on these qubits
     */
    void add(QuantumError error,
             ir::GateType gate,
             std::optional<QubitFilter> source_qubits = std::nullopt,
             std::optional<QubitFilter> target_qubits = std::nullopt) {
        errors_.insert_or_assign(
            gate,
            NoiseEntry{std::move(error), std::move(source_qubits), std::move(target_qubits)});
    }

    /**
     * @brief Returns the entry registered for a gate type.
     * @return Pointer to the entry, or nullptr if none is registered
     */
    [[nodiscard]] const NoiseEntry* lookup(ir::GateType gate) const {
        auto it = errors_.find(gate);
        return it == errors_.end() ? nullptr : &it->second;
    }

    [[nodiscard]] bool contains(ir::GateType gate) const {
        return errors_.count(gate) > 0;
    }

    /**
     * @brief Removes the entry for a gate type.
     * @return true if an entry was removed
     */
    bool remove(ir::GateType gate) {
        return errors_.erase(gate) > 0;
    }

    void clear() noexcept { errors_.clear(); }

    [[nodiscard]] std::size_t size() const noexcept { return errors_.size(); }
    [[nodiscard]] bool empty() const noexcept { return errors_.empty(); }

    /// @brief Returns the registered gate types in declaration order.
    [[nodiscard]] std::vector<ir::GateType> gateTypes() const {
        std::vector<ir::GateType> result;
        for (ir::GateType type : ir::ALL_GATE_TYPES) {
            if (contains(type)) {
                result.push_back(type);
            }
        }
        return result;
    }

    // -------------------------------------------------------------------------
    // Application
    // -------------------------------------------------------------------------

    /**
     * @brief Selects the qubits an entry's channels act on after a gate.
     *
     * - no filters: the gate's qubits, in the gate's order
     * - target filter only: the target filter
     * - source filter only: gate qubits that are in the source filter
     * - both filters: the target filter, whether or not the gate touches a
     *   source qubit
     *
     * Filter-derived results are ascending.
     */
    [[nodiscard]] static std::vector<QubitIndex> selectQubits(const NoiseEntry& entry,
                                                              const ir::Gate& gate) {
        const auto& source = entry.source_qubits;
        const auto& target = entry.target_qubits;

        if (!source.has_value() && !target.has_value()) {
            return gate.qubits();
        }
        if (!source.has_value()) {
            return target->toVector();
        }
        if (!target.has_value()) {
            return source->intersect(gate.qubits());
        }
        return target->toVector();
    }

    /**
     * @brief Produces a noisy copy of a circuit.
     *
     * Every gate is copied in order. After a gate whose type has an entry,
     * one channel of the entry's error is appended per selected qubit.
     * Measurements are copied unchanged. The input circuit is not modified.
     *
     * @param circuit The noiseless circuit
     * @return New circuit with channels interleaved
     * @throws std::out_of_range if a target filter names a qubit outside the
     *         circuit register
     */
    [[nodiscard]] ir::Circuit apply(const ir::Circuit& circuit) const {
        ir::Circuit noisy = circuit.emptyLike();

        for (const ir::Gate& gate : circuit) {
            noisy.addGate(gate);

            const NoiseEntry* entry = lookup(gate.type());
            if (entry == nullptr) continue;

            for (QubitIndex q : selectQubits(*entry, gate)) {
                noisy.addGate(entry->error.channel(q));
            }
        }

        noisy.copyMeasurements(circuit);
        return noisy;
    }

    /**
     * @brief Returns a string representation, one line per entry.
     */
    [[nodiscard]] std::string toString() const {
        std::string result = "NoiseModel(" + std::to_string(errors_.size()) + " entries):\n";
        for (ir::GateType type : gateTypes()) {
            const NoiseEntry& entry = errors_.at(type);
            result += "  " + std::string(ir::gateTypeName(type)) + " -> " +
                      entry.error.toString();
            if (entry.source_qubits.has_value()) {
                result += " source=" + entry.source_qubits->toString();
            }
            if (entry.target_qubits.has_value()) {
                result += " target=" + entry.target_qubits->toString();
            }
            result += "\n";
        }
        return result;
    }

private:
    std::unordered_map<ir::GateType, NoiseEntry> errors_;
};

inline std::ostream& operator<<(std::ostream& os, const NoiseModel& model) {
    os << model.toString();
    return os;
}

}  // namespace qnoise::noise
