// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file noise_demo.cpp
 * @brief Demonstrates building noise models and applying them
 *
 * Shows each quantum error kind, how source and target qubit filters pick
 * the qubits a channel acts on, and loading a model from YAML.
 */

#include "ir/Circuit.hpp"
#include "ir/Gate.hpp"
#include "noise/NoiseConfig.hpp"
#include "noise/NoiseModel.hpp"
#include "noise/QuantumError.hpp"

#include <iostream>
#include <string>

using namespace qnoise;

void printCircuit(const ir::Circuit& circuit, const std::string& label) {
    std::cout << label << " (" << circuit.numGates() << " gates, "
              << circuit.countChannels() << " channels):\n";
    for (const auto& gate : circuit) {
        std::cout << "  " << gate.toString() << "\n";
    }
    std::cout << "\n";
}

ir::Circuit bellPair() {
    ir::Circuit circuit(3);
    circuit.addGate(ir::Gate::h(0));
    circuit.addGate(ir::Gate::h(1));
    circuit.addGate(ir::Gate::cnot(0, 1));
    return circuit;
}

int main() {
    std::cout << "=== Noise Model Demo ===\n\n";

    // =========================================================================
    // 1. Quantum errors
    // =========================================================================
    std::cout << "1. Quantum errors and their channels\n";
    std::cout << std::string(50, '-') << "\n";

    {
        auto pauli = noise::QuantumError::pauli(0.1, 0.0, 0.05);
        auto relax = noise::QuantumError::thermalRelaxation(2.0, 1.5, 0.1, 0.0, 7);
        auto reset = noise::QuantumError::reset(0.2, 0.1);

        for (const auto& error : {pauli, relax, reset}) {
            std::cout << "  " << error << " -> " << error.channel(0).toString() << "\n";
        }
        std::cout << "\n";

        try {
            (void)noise::QuantumError::thermalRelaxation(1.0, 3.0, 0.1);
        } catch (const noise::InvalidParameterError& e) {
            std::cout << "  Rejected: " << e.what() << "\n\n";
        }
    }

    // =========================================================================
    // 2. Qubit filters
    // =========================================================================
    std::cout << "2. Choosing the qubits a channel acts on\n";
    std::cout << std::string(50, '-') << "\n";

    {
        ir::Circuit circuit = bellPair();
        printCircuit(circuit, "Noiseless");

        noise::NoiseModel every_qubit;
        every_qubit.add(noise::QuantumError::pauli(0.5), ir::GateType::H);
        every_qubit.add(noise::QuantumError::pauli(0.0, 0.5), ir::GateType::CNOT);
        printCircuit(every_qubit.apply(circuit), "No filters");

        noise::NoiseModel source_only;
        source_only.add(noise::QuantumError::pauli(0.5), ir::GateType::H, 1);
        printCircuit(source_only.apply(circuit), "Source filter {1} on H");

        noise::NoiseModel target_only;
        target_only.add(noise::QuantumError::reset(0.1, 0.0), ir::GateType::CNOT,
                        std::nullopt, noise::QubitFilter{2});
        printCircuit(target_only.apply(circuit), "Target filter {2} on CNOT");

        noise::NoiseModel both;
        both.add(noise::QuantumError::pauli(0.0, 0.0, 0.2), ir::GateType::H,
                 noise::QubitFilter{1}, noise::QubitFilter{2});
        printCircuit(both.apply(circuit), "Source {1} and target {2} on H");
    }

    // =========================================================================
    // 3. Loading from YAML
    // =========================================================================
    std::cout << "3. Loading a noise model from YAML\n";
    std::cout << std::string(50, '-') << "\n";

    {
        const char* yaml = R"(
noise_model:
  - gate: H
    error: pauli
    px: 0.5
  - gate: cx
    error: thermal_relaxation
    t1: 2.0
    t2: 1.0
    time: 0.1
    seed: 42
    target_qubits: [0, 2]
)";
        noise::NoiseModel model = noise::loadNoiseModel(yaml);
        std::cout << model << "\n";
        printCircuit(model.apply(bellPair()), "Noisy");

        const char* broken = R"(
noise_model:
  - gate: Toffoli
    error: pauli
  - gate: H
    error: reset
    p0: 0.5
    source_qubits: [one]
)";
        try {
            (void)noise::loadNoiseModel(broken);
        } catch (const noise::NoiseConfigException& e) {
            std::cout << "Rejected document with " << e.numErrors() << " errors:\n";
            for (const auto& err : e.errors()) {
                std::cout << "  " << err << "\n";
            }
        }
    }

    std::cout << "\nDone.\n";
    return 0;
}
