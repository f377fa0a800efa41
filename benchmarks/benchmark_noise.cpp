// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file benchmark_noise.cpp
 * @brief Benchmark suite for noise model application
 *
 * Times NoiseModel::apply on standard circuit patterns:
 * - QFT (Quantum Fourier Transform)
 * - Random circuits
 * - QAOA-style circuits
 *
 * with three models: every gate type noisy, source-filtered, and
 * target-filtered.
 */

#include "ir/Circuit.hpp"
#include "ir/Gate.hpp"
#include "noise/NoiseModel.hpp"
#include "noise/QuantumError.hpp"

#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace qnoise;

// ============================================================================
// Circuit Generators
// ============================================================================

/**
 * @brief Generates a Quantum Fourier Transform circuit.
 *
 * Controlled rotations are decomposed as CNOT + Rz + CNOT + Rz.
 */
ir::Circuit generateQFT(std::size_t n) {
    ir::Circuit circuit(n);

    for (std::size_t i = 0; i < n; ++i) {
        circuit.addGate(ir::Gate::h(i));

        for (std::size_t j = i + 1; j < n; ++j) {
            double angle = constants::PI / std::pow(2.0, static_cast<double>(j - i));
            circuit.addGate(ir::Gate::cnot(j, i));
            circuit.addGate(ir::Gate::rz(i, -angle / 2));
            circuit.addGate(ir::Gate::cnot(j, i));
            circuit.addGate(ir::Gate::rz(i, angle / 2));
        }
    }

    return circuit;
}

/**
 * @brief Generates a random circuit with mixed gate types.
 */
ir::Circuit generateRandom(std::size_t n_qubits, std::size_t n_gates, unsigned seed = 42) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<std::size_t> qubit_dist(0, n_qubits - 1);
    std::uniform_int_distribution<int> gate_dist(0, 4);
    std::uniform_real_distribution<double> angle_dist(0.0, 2 * constants::PI);

    ir::Circuit circuit(n_qubits);

    for (std::size_t i = 0; i < n_gates; ++i) {
        std::size_t q0 = qubit_dist(rng);
        switch (gate_dist(rng)) {
            case 0: circuit.addGate(ir::Gate::h(q0)); break;
            case 1: circuit.addGate(ir::Gate::x(q0)); break;
            case 2: circuit.addGate(ir::Gate::rz(q0, angle_dist(rng))); break;
            case 3: circuit.addGate(ir::Gate::t(q0)); break;
            default: {
                std::size_t q1 = qubit_dist(rng);
                while (q1 == q0) q1 = qubit_dist(rng);
                circuit.addGate(ir::Gate::cnot(q0, q1));
                break;
            }
        }
    }

    return circuit;
}

/**
 * @brief Generates a QAOA-style circuit on a ring graph.
 */
ir::Circuit generateQAOA(std::size_t n_qubits, std::size_t p_layers) {
    ir::Circuit circuit(n_qubits);

    for (std::size_t i = 0; i < n_qubits; ++i) {
        circuit.addGate(ir::Gate::h(i));
    }

    for (std::size_t layer = 0; layer < p_layers; ++layer) {
        double gamma = constants::PI / (4.0 * static_cast<double>(layer + 1));
        double beta = constants::PI / (2.0 * static_cast<double>(layer + 1));

        for (std::size_t i = 0; i < n_qubits; ++i) {
            std::size_t j = (i + 1) % n_qubits;
            circuit.addGate(ir::Gate::cnot(i, j));
            circuit.addGate(ir::Gate::rz(j, gamma));
            circuit.addGate(ir::Gate::cnot(i, j));
        }

        for (std::size_t i = 0; i < n_qubits; ++i) {
            circuit.addGate(ir::Gate::rx(i, beta));
        }
    }

    return circuit;
}

// ============================================================================
// Noise Models
// ============================================================================

noise::NoiseModel everyGateModel() {
    noise::NoiseModel model;
    auto single = noise::QuantumError::pauli(0.001, 0.001, 0.001);
    for (auto type : {ir::GateType::H, ir::GateType::X, ir::GateType::T,
                      ir::GateType::Rx, ir::GateType::Rz}) {
        model.add(single, type);
    }
    model.add(noise::QuantumError::thermalRelaxation(100.0, 80.0, 0.3), ir::GateType::CNOT);
    return model;
}

noise::NoiseModel sourceFilteredModel() {
    noise::NoiseModel model;
    model.add(noise::QuantumError::pauli(0.01), ir::GateType::CNOT,
              noise::QubitFilter{0, 2, 4, 6});
    model.add(noise::QuantumError::reset(0.01, 0.0), ir::GateType::H, 1);
    return model;
}

noise::NoiseModel targetFilteredModel() {
    noise::NoiseModel model;
    model.add(noise::QuantumError::pauli(0.0, 0.0, 0.01), ir::GateType::Rz,
              std::nullopt, noise::QubitFilter{0, 1});
    return model;
}

// ============================================================================
// Benchmarking Infrastructure
// ============================================================================

struct BenchmarkResult {
    std::string name;
    std::string model;
    std::size_t n_qubits;
    std::size_t original_gates;
    std::size_t noisy_gates;
    double apply_time_ms;
};

BenchmarkResult runBenchmark(const std::string& name,
                             const ir::Circuit& circuit,
                             const std::string& model_name,
                             const noise::NoiseModel& model) {
    BenchmarkResult result;
    result.name = name;
    result.model = model_name;
    result.n_qubits = circuit.numQubits();
    result.original_gates = circuit.numGates();

    auto start = std::chrono::high_resolution_clock::now();
    ir::Circuit noisy = model.apply(circuit);
    auto end = std::chrono::high_resolution_clock::now();

    result.apply_time_ms = std::chrono::duration<double, std::milli>(end - start).count();
    result.noisy_gates = noisy.numGates();
    return result;
}

void printResults(const std::vector<BenchmarkResult>& results) {
    std::cout << std::left << std::setw(16) << "Circuit"
              << std::setw(12) << "Model"
              << std::right << std::setw(8) << "Qubits"
              << std::setw(10) << "Original"
              << std::setw(10) << "Noisy"
              << std::setw(12) << "Time (ms)"
              << "\n";
    std::cout << std::string(68, '-') << "\n";

    for (const auto& r : results) {
        std::cout << std::left << std::setw(16) << r.name
                  << std::setw(12) << r.model
                  << std::right << std::setw(8) << r.n_qubits
                  << std::setw(10) << r.original_gates
                  << std::setw(10) << r.noisy_gates
                  << std::setw(12) << std::fixed << std::setprecision(3) << r.apply_time_ms
                  << "\n";
    }
}

int main() {
    std::cout << "=== Noise Model Benchmarks ===\n\n";

    struct NamedCircuit {
        std::string name;
        ir::Circuit circuit;
    };

    std::vector<NamedCircuit> circuits;
    circuits.push_back({"QFT-10", generateQFT(10)});
    circuits.push_back({"QFT-20", generateQFT(20)});
    circuits.push_back({"Random-10x1k", generateRandom(10, 1000)});
    circuits.push_back({"Random-20x10k", generateRandom(20, 10000)});
    circuits.push_back({"QAOA-16x8", generateQAOA(16, 8)});

    const noise::NoiseModel every = everyGateModel();
    const noise::NoiseModel source = sourceFilteredModel();
    const noise::NoiseModel target = targetFilteredModel();

    std::vector<BenchmarkResult> results;
    for (const auto& c : circuits) {
        results.push_back(runBenchmark(c.name, c.circuit, "every-gate", every));
        results.push_back(runBenchmark(c.name, c.circuit, "source", source));
        results.push_back(runBenchmark(c.name, c.circuit, "target", target));
    }

    printResults(results);
    return 0;
}
