// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file main.cpp
 * @brief qnoise command-line tool
 *
 * Applies a noise model to a few reference circuits and prints the noisy
 * circuits.
 *
 * Usage: qnoise [noise-model.yaml]
 *
 * Without an argument, uses a model with a Pauli error after every H on
 * qubit 1 and a Pauli error after every CNOT.
 */

#include "ir/Circuit.hpp"
#include "noise/NoiseConfig.hpp"
#include "noise/NoiseModel.hpp"
#include "noise/QuantumError.hpp"

#include <iostream>
#include <string>

using namespace qnoise;

namespace {

noise::NoiseModel defaultModel() {
    noise::NoiseModel model;
    model.add(noise::QuantumError::pauli(0.5), ir::GateType::H, 1);
    model.add(noise::QuantumError::pauli(0.0, 0.5), ir::GateType::CNOT);
    return model;
}

void report(const std::string& title, const ir::Circuit& circuit,
            const noise::NoiseModel& model) {
    std::cout << "Building " << title << " circuit...\n";
    std::cout << circuit << "\n";

    ir::Circuit noisy = model.apply(circuit);
    std::cout << "Noisy " << title << " circuit:\n";
    std::cout << noisy;
    std::cout << "  Channels injected: " << noisy.countChannels() << "\n\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc > 2) {
        std::cerr << "Usage: " << argv[0] << " [noise-model.yaml]\n";
        return 2;
    }

    noise::NoiseModel model;
    try {
        model = argc == 2 ? noise::loadNoiseModelFile(argv[1]) : defaultModel();
    } catch (const noise::NoiseConfigException& e) {
        std::cerr << argv[1] << ": " << e.what() << "\n";
        return 1;
    } catch (const std::runtime_error& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    std::cout << "=== qnoise ===\n\n";
    std::cout << model << "\n";

    try {
        ir::Circuit bell(2);
        bell.addGate(ir::Gate::h(0));
        bell.addGate(ir::Gate::cnot(0, 1));
        bell.addMeasurement("m", {0, 1});
        report("Bell state", bell, model);

        ir::Circuit ghz(3);
        ghz.addGate(ir::Gate::h(0));
        ghz.addGate(ir::Gate::cnot(0, 1));
        ghz.addGate(ir::Gate::cnot(1, 2));
        ghz.addMeasurement("m", {0, 1, 2});
        report("GHZ", ghz, model);

        ir::Circuit rotations(2);
        rotations.addGate(ir::Gate::h(0));
        rotations.addGate(ir::Gate::rz(0, constants::PI / 4));
        rotations.addGate(ir::Gate::rx(1, constants::PI / 2));
        rotations.addGate(ir::Gate::cnot(0, 1));
        rotations.addGate(ir::Gate::ry(1, constants::PI));
        report("rotation", rotations, model);
    } catch (const std::out_of_range& e) {
        // A target filter named a qubit the circuit does not have.
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "Done.\n";
    return 0;
}
