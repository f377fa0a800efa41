// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file test_circuit.cpp
 * @brief Unit tests for the Circuit class
 */

#include "ir/Circuit.hpp"

#include <gtest/gtest.h>

#include <type_traits>
#include <utility>

namespace qnoise::ir {
namespace {

// =============================================================================
// Construction Tests
// =============================================================================

TEST(CircuitConstructionTest, ConstructsWithValidQubitCount) {
    Circuit c(5);
    EXPECT_EQ(c.numQubits(), 5);
    EXPECT_EQ(c.numGates(), 0);
    EXPECT_TRUE(c.empty());
    EXPECT_FALSE(c.hasMeasurements());
}

TEST(CircuitConstructionTest, ThrowsOnZeroQubits) {
    EXPECT_THROW(Circuit(0), std::invalid_argument);
}

TEST(CircuitConstructionTest, ThrowsOnExcessiveQubits) {
    EXPECT_THROW(Circuit(constants::MAX_QUBITS + 1), std::invalid_argument);
}

// =============================================================================
// Gate Management Tests
// =============================================================================

TEST(CircuitGateTest, AddGateAssignsSequentialIds) {
    Circuit c(2);
    c.addGate(Gate::h(0));
    c.addGate(Gate::pauliNoise(0, 0.1, 0.0, 0.0));
    c.addGate(Gate::cnot(0, 1));

    EXPECT_EQ(c.gate(0).id(), 0);
    EXPECT_EQ(c.gate(1).id(), 1);
    EXPECT_EQ(c.gate(2).id(), 2);
}

TEST(CircuitGateTest, GateAccessorThrowsOnOutOfRange) {
    Circuit c(2);
    c.addGate(Gate::h(0));

    EXPECT_THROW((void)c.gate(1), std::out_of_range);
}

TEST(CircuitGateTest, AddGateThrowsOnInvalidQubit) {
    Circuit c(2);

    EXPECT_THROW(c.addGate(Gate::h(2)), std::out_of_range);
    EXPECT_THROW(c.addGate(Gate::cnot(0, 5)), std::out_of_range);
    EXPECT_THROW(c.addGate(Gate::reset(3, 0.1, 0.0)), std::out_of_range);
    EXPECT_TRUE(c.empty());
}

// =============================================================================
// Parametrized Gate Bookkeeping Tests
// =============================================================================

TEST(CircuitParametrizedTest, RecordsParameterizedGates) {
    Circuit c(2);
    c.addGate(Gate::h(0));                     // id 0
    c.addGate(Gate::rx(0, 0.1));               // id 1
    c.addGate(Gate::pauliNoise(1, 0.1, 0, 0)); // id 2
    c.addGate(Gate::rz(1, 0.2));               // id 3

    EXPECT_EQ(c.parametrizedGates(), (std::vector<GateId>{1, 3}));
    EXPECT_EQ(c.trainableGates(), (std::vector<GateId>{1, 3}));
}

TEST(CircuitParametrizedTest, FrozenGatesAreNotTrainable) {
    Circuit c(1);
    auto frozen = Gate::ry(0, 0.4);
    frozen.setTrainable(false);
    c.addGate(frozen);          // id 0
    c.addGate(Gate::ry(0, 0.5)); // id 1

    EXPECT_EQ(c.parametrizedGates(), (std::vector<GateId>{0, 1}));
    EXPECT_EQ(c.trainableGates(), (std::vector<GateId>{1}));
}

TEST(CircuitParametrizedTest, GatesAreReadOnlyThroughIteration) {
    using Element = decltype(*std::declval<Circuit&>().begin());
    static_assert(std::is_const_v<std::remove_reference_t<Element>>,
                  "trainable flags must not change after addGate");

    Circuit c(1);
    c.addGate(Gate::rx(0, 0.2));
    for (const auto& g : c) {
        EXPECT_TRUE(g.trainable());
    }
    EXPECT_EQ(c.trainableGates(), (std::vector<GateId>{0}));
}

// =============================================================================
// Measurement Tests
// =============================================================================

TEST(CircuitMeasurementTest, AddMeasurementRecordsRegisterAndGate) {
    Circuit c(3);
    c.addMeasurement("a", {2, 0});
    c.addMeasurement("b", {1});

    ASSERT_EQ(c.measurementTuples().size(), 2);
    EXPECT_EQ(c.measurementTuples().at("a"), (std::vector<QubitIndex>{2, 0}));
    EXPECT_EQ(c.measurementTuples().at("b"), (std::vector<QubitIndex>{1}));
    EXPECT_EQ(c.measuredQubits(), (std::vector<QubitIndex>{2, 0, 1}));
    EXPECT_TRUE(c.hasMeasurements());
}

TEST(CircuitMeasurementTest, RejectsDuplicateRegister) {
    Circuit c(2);
    c.addMeasurement("m", {0});
    EXPECT_THROW(c.addMeasurement("m", {1}), std::invalid_argument);
}

TEST(CircuitMeasurementTest, RejectsQubitMeasuredTwice) {
    Circuit c(2);
    c.addMeasurement("a", {0});
    EXPECT_THROW(c.addMeasurement("b", {1, 0}), std::invalid_argument);
    EXPECT_EQ(c.measurementTuples().size(), 1);
}

TEST(CircuitMeasurementTest, RejectsEmptyAndOutOfRange) {
    Circuit c(2);
    EXPECT_THROW(c.addMeasurement("m", {}), std::invalid_argument);
    EXPECT_THROW(c.addMeasurement("m", {2}), std::out_of_range);
    EXPECT_FALSE(c.hasMeasurements());
}

TEST(CircuitMeasurementTest, CopyMeasurementsReplacesRegisters) {
    Circuit source(2);
    source.addMeasurement("m", {1, 0});

    Circuit target(2);
    target.addMeasurement("old", {0});
    target.copyMeasurements(source);

    EXPECT_EQ(target.measurementTuples(), source.measurementTuples());
    EXPECT_EQ(target.measuredQubits(), source.measuredQubits());
}

TEST(CircuitMeasurementTest, CopyMeasurementsRequiresSameRegisterSize) {
    Circuit source(3);
    Circuit target(2);
    EXPECT_THROW(target.copyMeasurements(source), std::invalid_argument);
}

// =============================================================================
// Depth and Counting Tests
// =============================================================================

TEST(CircuitDepthTest, EmptyCircuitHasDepthZero) {
    Circuit c(2);
    EXPECT_EQ(c.depth(), 0);
}

TEST(CircuitDepthTest, GHZCircuitDepth) {
    Circuit c(3);
    c.addGate(Gate::h(0));        // depth 1
    c.addGate(Gate::cnot(0, 1));  // depth 2
    c.addGate(Gate::cnot(1, 2));  // depth 3
    EXPECT_EQ(c.depth(), 3);
}

TEST(CircuitDepthTest, ChannelsAddDepth) {
    Circuit c(2);
    c.addGate(Gate::h(0));
    c.addGate(Gate::pauliNoise(0, 0.1, 0.0, 0.0));
    c.addGate(Gate::cnot(0, 1));
    EXPECT_EQ(c.depth(), 3);
}

TEST(CircuitCountTest, CountGatesOfType) {
    Circuit c(2);
    c.addGate(Gate::h(0));
    c.addGate(Gate::h(1));
    c.addGate(Gate::cnot(0, 1));
    c.addGate(Gate::reset(0, 0.1, 0.0));

    EXPECT_EQ(c.countGates(GateType::H), 2);
    EXPECT_EQ(c.countGates(GateType::CNOT), 1);
    EXPECT_EQ(c.countGates(GateType::Reset), 1);
    EXPECT_EQ(c.countGates(GateType::Z), 0);
}

TEST(CircuitCountTest, CountChannels) {
    Circuit c(2);
    c.addGate(Gate::h(0));
    c.addGate(Gate::pauliNoise(0, 0.1, 0.0, 0.0));
    c.addGate(Gate::thermalRelaxation(1, 2.0, 1.0, 0.1));
    c.addGate(Gate::reset(1, 0.1, 0.0));

    EXPECT_EQ(c.countChannels(), 3);
}

// =============================================================================
// Iteration Tests
// =============================================================================

TEST(CircuitIterationTest, IteratorOrderMatchesAddOrder) {
    Circuit c(3);
    c.addGate(Gate::h(0));
    c.addGate(Gate::x(1));
    c.addGate(Gate::z(2));

    auto it = c.begin();
    EXPECT_EQ(it->type(), GateType::H);
    ++it;
    EXPECT_EQ(it->type(), GateType::X);
    ++it;
    EXPECT_EQ(it->type(), GateType::Z);
    ++it;
    EXPECT_EQ(it, c.end());
}

// =============================================================================
// Copy Tests
// =============================================================================

TEST(CircuitCloneTest, CloneCreatesIndependentCopy) {
    Circuit c(2);
    c.addGate(Gate::rx(0, 0.3));
    c.addGate(Gate::cnot(0, 1));
    c.addMeasurement("m", {0, 1});

    Circuit copy = c.clone();

    EXPECT_EQ(copy.numQubits(), c.numQubits());
    EXPECT_EQ(copy.gates(), c.gates());
    EXPECT_EQ(copy.parametrizedGates(), c.parametrizedGates());
    EXPECT_EQ(copy.measurementTuples(), c.measurementTuples());

    c.addGate(Gate::x(0));
    EXPECT_EQ(c.numGates(), 3);
    EXPECT_EQ(copy.numGates(), 2);
}

TEST(CircuitCloneTest, EmptyLikeKeepsRegisterOnly) {
    Circuit c(4);
    c.addGate(Gate::h(3));
    c.addMeasurement("m", {3});

    Circuit empty = c.emptyLike();
    EXPECT_EQ(empty.numQubits(), 4);
    EXPECT_TRUE(empty.empty());
    EXPECT_FALSE(empty.hasMeasurements());
}

// =============================================================================
// ToString Tests
// =============================================================================

TEST(CircuitToStringTest, ListsGatesAndMeasurements) {
    Circuit c(2);
    c.addGate(Gate::h(0));
    c.addGate(Gate::pauliNoise(0, 0.5, 0.0, 0.0));
    c.addMeasurement("m", {0, 1});

    std::string str = c.toString();
    EXPECT_NE(str.find("Circuit(2 qubits, 2 gates"), std::string::npos);
    EXPECT_NE(str.find("  H q[0]\n"), std::string::npos);
    EXPECT_NE(str.find("  PauliNoise(0.5, 0, 0) q[0]\n"), std::string::npos);
    EXPECT_NE(str.find("  measure q[0], q[1] -> m\n"), std::string::npos);
}

}  // namespace
}  // namespace qnoise::ir
