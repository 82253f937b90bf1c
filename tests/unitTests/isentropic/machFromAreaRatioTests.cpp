#include "gtest/gtest.h"
#include "inputErrors.hpp"
#include "isentropic/isentropicFlow.hpp"

using gasdyn::eos::Gas;
using gasdyn::eos::PerfectGas;
using gasdyn::isentropic::IsentropicFlow;

class MachFromAreaRatioRoundTripTestFixture : public ::testing::TestWithParam<std::tuple<Gas, PetscReal>> {};

TEST_P(MachFromAreaRatioRoundTripTestFixture, ShouldRecoverMachOnMatchingBranch) {
    // arrange
    const auto [gas, mach] = GetParam();
    IsentropicFlow flow(PerfectGas{gas});
    const auto areaRatio = flow.MachAreaRatioChoked(mach);

    // act
    auto solutions = flow.MachFromAreaRatio(areaRatio);

    // assert
    if (mach < 1.0) {
        ASSERT_NEAR(solutions.subsonic, mach, 1E-9);
        ASSERT_GT(solutions.supersonic, 1.0);
    } else {
        ASSERT_NEAR(solutions.supersonic, mach, 1E-9);
        ASSERT_LT(solutions.subsonic, 1.0);
    }
    ASSERT_NEAR(flow.MachAreaRatioChoked(solutions.subsonic), areaRatio, 1E-9 * areaRatio);
    ASSERT_NEAR(flow.MachAreaRatioChoked(solutions.supersonic), areaRatio, 1E-9 * areaRatio);
}

INSTANTIATE_TEST_SUITE_P(MachFromAreaRatioTests, MachFromAreaRatioRoundTripTestFixture,
                         testing::Combine(testing::Values(Gas::Air, Gas::Argon, Gas::CarbonDioxide, Gas::Hydrogen),
                                          testing::Values(0.01, 0.1, 0.3, 0.7, 0.95, 1.05, 1.5, 2.0, 3.0, 5.0, 10.0)));

TEST(MachFromAreaRatioTests, ShouldSolveKnownAreaRatio) {
    // arrange
    IsentropicFlow flow;

    // act
    auto solutions = flow.MachFromAreaRatio(1.6875);

    // assert
    ASSERT_NEAR(solutions.supersonic, 2.0, 1E-10);
    ASSERT_NEAR(solutions.subsonic, 0.37224449, 1E-6);
}

class MachFromAreaRatioLargeRatioTestFixture : public ::testing::TestWithParam<std::tuple<PetscReal, PetscReal, PetscReal>> {};

TEST_P(MachFromAreaRatioLargeRatioTestFixture, ShouldSolveBothBranches) {
    // arrange
    const auto [areaRatio, expectedSubsonic, expectedSupersonic] = GetParam();
    IsentropicFlow flow;

    // act
    auto solutions = flow.MachFromAreaRatio(areaRatio);

    // assert
    ASSERT_NEAR(solutions.subsonic, expectedSubsonic, 1E-12 * expectedSubsonic);
    ASSERT_NEAR(solutions.supersonic, expectedSupersonic, 1E-9 * expectedSupersonic);
    ASSERT_NEAR(flow.MachAreaRatioChoked(solutions.subsonic), areaRatio, 1E-9 * areaRatio);
    ASSERT_NEAR(flow.MachAreaRatioChoked(solutions.supersonic), areaRatio, 1E-9 * areaRatio);
}

INSTANTIATE_TEST_SUITE_P(MachFromAreaRatioTests, MachFromAreaRatioLargeRatioTestFixture,
                         testing::Values(std::make_tuple(1.0E6, 5.787037037038201E-7, 46.3751840663149), std::make_tuple(1.0E20, 5.787037037037037E-21, 29301.5604134515),
                                         std::make_tuple(1.0E200, 5.787037037037038E-201, 2.93015605158347E40)));

TEST(MachFromAreaRatioTests, ShouldReturnSonicForUnitAreaRatio) {
    // arrange
    IsentropicFlow flow;

    // act
    auto solutions = flow.MachFromAreaRatio(1.0);

    // assert
    ASSERT_DOUBLE_EQ(solutions.subsonic, 1.0);
    ASSERT_DOUBLE_EQ(solutions.supersonic, 1.0);
}

TEST(MachFromAreaRatioTests, ShouldRejectAreaRatioBelowOne) {
    // arrange
    IsentropicFlow flow;

    // act
    // assert
    ASSERT_THROW((void)flow.MachFromAreaRatio(0.99), gasdyn::InvalidInputError);
    ASSERT_THROW((void)flow.MachFromAreaRatio(-2.0), gasdyn::InvalidInputError);
    ASSERT_THROW((void)flow.MachFromAreaRatio(PETSC_INFINITY), gasdyn::InvalidInputError);
}
