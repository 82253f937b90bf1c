#include <vector>
#include "environment/runEnvironment.hpp"
#include "gtest/gtest.h"

TEST(RunEnvironmentTests, ShouldStoreMainArguments) {
    // arrange
    int argc = 2;
    char program[] = "gasdyn";
    char option[] = "--version";
    char* argv[] = {program, option, nullptr};
    char** args = argv;

    // act
    gasdyn::environment::RunEnvironment::Initialize(&argc, &args);

    // assert
    ASSERT_EQ(*gasdyn::environment::RunEnvironment::GetArgCount(), 2);
    ASSERT_STREQ((*gasdyn::environment::RunEnvironment::GetArgs())[1], "--version");

    // cleanup
    gasdyn::environment::RunEnvironment::Finalize();
    ASSERT_EQ(*gasdyn::environment::RunEnvironment::GetArgCount(), 0);
}

TEST(RunEnvironmentTests, ShouldCallCleanUpFunctionsInReverseOrder) {
    // arrange
    std::vector<std::string> calls;
    gasdyn::environment::RunEnvironment::RegisterCleanUpFunction("first", [&calls]() { calls.emplace_back("first"); });
    gasdyn::environment::RunEnvironment::RegisterCleanUpFunction("second", [&calls]() { calls.emplace_back("second"); });

    // act
    gasdyn::environment::RunEnvironment::Finalize();

    // assert
    ASSERT_EQ(calls, (std::vector<std::string>{"second", "first"}));
}

TEST(RunEnvironmentTests, ShouldReplaceCleanUpFunctionWithSameName) {
    // arrange
    std::vector<std::string> calls;
    gasdyn::environment::RunEnvironment::RegisterCleanUpFunction("petsc", [&calls]() { calls.emplace_back("old"); });
    gasdyn::environment::RunEnvironment::RegisterCleanUpFunction("petsc", [&calls]() { calls.emplace_back("new"); });

    // act
    gasdyn::environment::RunEnvironment::Finalize();
    gasdyn::environment::RunEnvironment::Finalize();

    // assert
    ASSERT_EQ(calls, (std::vector<std::string>{"new"}));
}
