#include "gtest/gtest.h"
#include "parameters/petscOptionParameters.hpp"
#include "petscTestFixture.hpp"
#include "utilities/petscUtilities.hpp"

namespace gasdynTesting::parameters {

class PetscOptionParametersTestFixture : public testingResources::PetscTestFixture {
   protected:
    PetscOptions options = nullptr;

    void SetUp() override {
        testingResources::PetscTestFixture::SetUp();
        PetscOptionsCreate(&options) >> errorChecker;
    }

    void TearDown() override { PetscOptionsDestroy(&options) >> errorChecker; }
};

TEST_F(PetscOptionParametersTestFixture, ShouldReadOptionValues) {
    // arrange
    gasdyn::utilities::PetscUtilities::Set(options, {{"gas", "methane"}, {"M", "2"}, {"ds", "-3.5"}});
    gasdyn::parameters::PetscOptionParameters parameters(options);

    // act
    auto gas = parameters.GetString("gas");
    auto mach = parameters.Get<double>("M");
    auto ds = parameters.GetExpect<double>("ds");

    // assert
    ASSERT_EQ(gas, "methane");
    ASSERT_DOUBLE_EQ(mach.value(), 2.0);
    ASSERT_DOUBLE_EQ(ds, -3.5);
    ASSERT_FALSE(parameters.Contains("T"));
}

TEST_F(PetscOptionParametersTestFixture, ShouldReadBareFlagAsTrue) {
    // arrange
    gasdyn::utilities::PetscUtilities::Set(options, {{"metric", ""}});
    gasdyn::parameters::PetscOptionParameters parameters(options);

    // act
    auto metric = parameters.GetExpect<bool>("metric");

    // assert
    ASSERT_TRUE(metric);
}

TEST_F(PetscOptionParametersTestFixture, ShouldReportKeys) {
    // arrange
    gasdyn::utilities::PetscUtilities::Set(options, {{"p1", "10"}, {"p2", "2"}, {"gas", "air"}, {"ds", "-1"}});
    gasdyn::parameters::PetscOptionParameters parameters(options);

    // act
    auto keys = parameters.GetKeys();

    // assert
    ASSERT_EQ(keys, (std::unordered_set<std::string>{"p1", "p2", "gas", "ds"}));
}

}  // namespace gasdynTesting::parameters
