#include "gtest/gtest.h"
#include "inputErrors.hpp"
#include "isentropic/stagnationInput.hpp"

using gasdyn::isentropic::StagnationInput;
using gasdyn::isentropic::StagnationQuantity;

struct StagnationInputMissingTestParameters {
    StagnationInput input;
    StagnationQuantity expectedMissing;
};

class StagnationInputMissingTestFixture : public ::testing::TestWithParam<StagnationInputMissingTestParameters> {};

TEST_P(StagnationInputMissingTestFixture, ShouldDetermineMissingQuantity) {
    // arrange
    const auto& params = GetParam();

    // act
    auto missing = params.input.Missing();

    // assert
    ASSERT_EQ(missing, params.expectedMissing);
}

INSTANTIATE_TEST_SUITE_P(StagnationInputTests, StagnationInputMissingTestFixture,
                         testing::Values((StagnationInputMissingTestParameters){.input = StagnationInput().Static(10).Mach(1), .expectedMissing = StagnationQuantity::Stagnation},
                                         (StagnationInputMissingTestParameters){.input = StagnationInput().Stagnation(20).Mach(1), .expectedMissing = StagnationQuantity::Static},
                                         (StagnationInputMissingTestParameters){.input = StagnationInput().Stagnation(20).Static(10), .expectedMissing = StagnationQuantity::Mach},
                                         (StagnationInputMissingTestParameters){.input = StagnationInput().Mach(0).Static(10), .expectedMissing = StagnationQuantity::Stagnation}),
                         [](const testing::TestParamInfo<StagnationInputMissingTestParameters>& info) { return std::to_string(info.index); });

TEST(StagnationInputTests, ShouldThrowWhenAllThreeSupplied) {
    // arrange
    auto input = StagnationInput().Stagnation(20).Static(10).Mach(1);

    // act
    // assert
    ASSERT_THROW((void)input.Missing(), gasdyn::AmbiguousInputError);
}

TEST(StagnationInputTests, ShouldThrowWhenFewerThanTwoSupplied) {
    // arrange
    // act
    // assert
    ASSERT_THROW((void)StagnationInput().Missing(), gasdyn::InsufficientInputError);
    ASSERT_THROW((void)StagnationInput().Mach(2).Missing(), gasdyn::InsufficientInputError);
    ASSERT_THROW((void)StagnationInput().Stagnation(2).Missing(), gasdyn::InsufficientInputError);
}

TEST(StagnationInputTests, ShouldKeepLastValue) {
    // arrange
    // act
    auto input = StagnationInput().Static(10).Static(12);

    // assert
    ASSERT_DOUBLE_EQ(input.GetStatic().value(), 12);
    ASSERT_FALSE(input.GetStagnation().has_value());
    ASSERT_FALSE(input.GetMach().has_value());
}

TEST(StagnationInputTests, ShouldNameQuantities) {
    // arrange
    std::stringstream stream;

    // act
    stream << StagnationQuantity::Stagnation << " " << StagnationQuantity::Static << " " << StagnationQuantity::Mach;

    // assert
    ASSERT_EQ(stream.str(), "stagnation static mach");
}
