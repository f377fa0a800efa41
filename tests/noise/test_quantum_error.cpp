// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file test_quantum_error.cpp
 * @brief Unit tests for QuantumError
 */

#include "noise/QuantumError.hpp"

#include <gtest/gtest.h>

#include <limits>

namespace qnoise::noise {
namespace {

// =============================================================================
// Pauli Error Tests
// =============================================================================

TEST(PauliErrorTest, StoresProbabilitiesInOrder) {
    auto error = QuantumError::pauli(0.1, 0.2, 0.3);
    EXPECT_EQ(error.kind(), ErrorKind::Pauli);
    EXPECT_EQ(error.parameters(), (std::vector<double>{0.1, 0.2, 0.3}));
    EXPECT_FALSE(error.seed().has_value());
    EXPECT_EQ(error.channelType(), ir::GateType::PauliNoise);
}

TEST(PauliErrorTest, MissingProbabilitiesDefaultToZero) {
    auto error = QuantumError::pauli(0.5);
    EXPECT_EQ(error.parameters(), (std::vector<double>{0.5, 0.0, 0.0}));
}

TEST(PauliErrorTest, AcceptsBoundaryValues) {
    EXPECT_NO_THROW(QuantumError::pauli(0.0, 0.0, 0.0));
    EXPECT_NO_THROW(QuantumError::pauli(1.0, 0.0, 0.0));
    EXPECT_NO_THROW(QuantumError::pauli(0.5, 0.25, 0.25));
}

TEST(PauliErrorTest, RejectsProbabilityOutsideUnitInterval) {
    EXPECT_THROW(QuantumError::pauli(1.5), InvalidParameterError);
    EXPECT_THROW(QuantumError::pauli(0.0, -0.1), InvalidParameterError);
    EXPECT_THROW(QuantumError::pauli(0.0, 0.0, 2.0), InvalidParameterError);
}

TEST(PauliErrorTest, RejectsSumAboveOne) {
    EXPECT_THROW(QuantumError::pauli(0.5, 0.5, 0.1), InvalidParameterError);
}

TEST(PauliErrorTest, RejectsNonFiniteValues) {
    EXPECT_THROW(QuantumError::pauli(std::numeric_limits<double>::quiet_NaN()),
                 InvalidParameterError);
    EXPECT_THROW(QuantumError::pauli(0.0, std::numeric_limits<double>::infinity()),
                 InvalidParameterError);
}

TEST(PauliErrorTest, ErrorMessageNamesParameter) {
    try {
        (void)QuantumError::pauli(1.5);
        FAIL() << "Expected InvalidParameterError";
    } catch (const InvalidParameterError& e) {
        EXPECT_EQ(std::string(e.what()), "pauli error: px must be in [0, 1], got 1.5");
    }
}

TEST(PauliErrorTest, IsAnInvalidArgument) {
    EXPECT_THROW(QuantumError::pauli(-1.0), std::invalid_argument);
}

// =============================================================================
// Thermal Relaxation Error Tests
// =============================================================================

TEST(ThermalRelaxationErrorTest, StoresParameters) {
    auto error = QuantumError::thermalRelaxation(2.0, 1.0, 0.1, 0.05, 11);
    EXPECT_EQ(error.kind(), ErrorKind::ThermalRelaxation);
    EXPECT_EQ(error.parameters(), (std::vector<double>{2.0, 1.0, 0.1, 0.05}));
    ASSERT_TRUE(error.seed().has_value());
    EXPECT_EQ(error.seed().value(), 11u);
}

TEST(ThermalRelaxationErrorTest, RequiresPositiveTimes) {
    EXPECT_THROW(QuantumError::thermalRelaxation(0.0, 1.0, 0.1), InvalidParameterError);
    EXPECT_THROW(QuantumError::thermalRelaxation(1.0, -1.0, 0.1), InvalidParameterError);
    EXPECT_THROW(QuantumError::thermalRelaxation(1.0, 1.0, -0.1), InvalidParameterError);
    EXPECT_NO_THROW(QuantumError::thermalRelaxation(1.0, 1.0, 0.0));
}

TEST(ThermalRelaxationErrorTest, RejectsT2AboveTwiceT1) {
    EXPECT_NO_THROW(QuantumError::thermalRelaxation(1.0, 2.0, 0.1));
    EXPECT_THROW(QuantumError::thermalRelaxation(1.0, 2.5, 0.1), InvalidParameterError);
}

TEST(ThermalRelaxationErrorTest, RejectsExcitedPopulationOutsideUnitInterval) {
    EXPECT_THROW(QuantumError::thermalRelaxation(1.0, 1.0, 0.1, 1.2), InvalidParameterError);
}

// =============================================================================
// Reset Error Tests
// =============================================================================

TEST(ResetErrorTest, StoresProbabilities) {
    auto error = QuantumError::reset(0.3, 0.2);
    EXPECT_EQ(error.kind(), ErrorKind::Reset);
    EXPECT_EQ(error.parameters(), (std::vector<double>{0.3, 0.2}));
    EXPECT_EQ(error.channelType(), ir::GateType::Reset);
}

TEST(ResetErrorTest, RejectsInvalidProbabilities) {
    EXPECT_THROW(QuantumError::reset(-0.1, 0.0), InvalidParameterError);
    EXPECT_THROW(QuantumError::reset(0.0, 1.1), InvalidParameterError);
    EXPECT_THROW(QuantumError::reset(0.6, 0.6), InvalidParameterError);
}

// =============================================================================
// Channel Realization Tests
// =============================================================================

TEST(QuantumErrorChannelTest, ChannelCarriesParametersAndSeed) {
    auto error = QuantumError::pauli(0.0, 0.5, 0.0, 3);
    ir::Gate g = error.channel(4);

    EXPECT_EQ(g.type(), ir::GateType::PauliNoise);
    ASSERT_EQ(g.qubits().size(), 1);
    EXPECT_EQ(g.qubits()[0], 4);
    EXPECT_EQ(g.channelParameters(), error.parameters());
    EXPECT_EQ(g.seed(), error.seed());
}

TEST(QuantumErrorChannelTest, EachKindMapsToItsChannelType) {
    EXPECT_EQ(QuantumError::pauli(0.1).channel(0).type(), ir::GateType::PauliNoise);
    EXPECT_EQ(QuantumError::thermalRelaxation(1.0, 1.0, 0.1).channel(0).type(),
              ir::GateType::ThermalRelaxation);
    EXPECT_EQ(QuantumError::reset(0.1, 0.1).channel(0).type(), ir::GateType::Reset);
}

TEST(QuantumErrorChannelTest, ChannelsFromSameErrorAreIndependent) {
    auto error = QuantumError::reset(0.1, 0.2);
    ir::Gate a = error.channel(0);
    ir::Gate b = error.channel(1);
    EXPECT_EQ(a.channelParameters(), b.channelParameters());
    EXPECT_NE(a, b);
}

// =============================================================================
// Naming and Formatting Tests
// =============================================================================

TEST(QuantumErrorNameTest, KindNamesRoundTrip) {
    for (ErrorKind kind : {ErrorKind::Pauli, ErrorKind::ThermalRelaxation, ErrorKind::Reset}) {
        EXPECT_EQ(errorKindFromName(errorKindName(kind)), kind);
    }
    EXPECT_FALSE(errorKindFromName("depolarizing").has_value());
    EXPECT_FALSE(errorKindFromName("Pauli").has_value());
}

TEST(QuantumErrorNameTest, ParameterNamesMatchParameterCount) {
    EXPECT_EQ(parameterNames(ErrorKind::Pauli).size(), 3);
    EXPECT_EQ(parameterNames(ErrorKind::ThermalRelaxation).size(), 4);
    EXPECT_EQ(parameterNames(ErrorKind::Reset).size(), 2);
    EXPECT_EQ(parameterNames(ErrorKind::ThermalRelaxation)[3], "excited_population");
}

TEST(QuantumErrorFormatTest, ToStringListsNamedParameters) {
    EXPECT_EQ(QuantumError::pauli(0.5).toString(), "pauli(px=0.5, py=0, pz=0)");
    EXPECT_EQ(QuantumError::reset(0.25, 0.0, 9).toString(), "reset(p0=0.25, p1=0, seed=9)");
}

TEST(QuantumErrorEqualityTest, ComparesKindParametersAndSeed) {
    EXPECT_EQ(QuantumError::pauli(0.1), QuantumError::pauli(0.1));
    EXPECT_NE(QuantumError::pauli(0.1), QuantumError::pauli(0.2));
    EXPECT_NE(QuantumError::pauli(0.1), QuantumError::pauli(0.1, 0.0, 0.0, 1));
    EXPECT_NE(QuantumError::pauli(0.0), QuantumError::reset(0.0, 0.0));
}

}  // namespace
}  // namespace qnoise::noise
