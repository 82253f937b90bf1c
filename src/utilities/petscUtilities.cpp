#include "petscUtilities.hpp"
#include "environment/runEnvironment.hpp"

void gasdyn::utilities::PetscUtilities::Initialize(const char help[]) {
    PetscInitialize(gasdyn::environment::RunEnvironment::GetArgCount(), gasdyn::environment::RunEnvironment::GetArgs(), nullptr, help) >> utilities::PetscUtilities::checkError;

    // petsc must be the last thing torn down
    gasdyn::environment::RunEnvironment::RegisterCleanUpFunction("gasdyn::utilities::PetscUtilities::Initialize", []() { PetscFinalize() >> utilities::PetscUtilities::checkError; });
}

void gasdyn::utilities::PetscUtilities::Set(PetscOptions petscOptions, const std::map<std::string, std::string>& options) {
    for (const auto& optionPair : options) {
        std::string optionName = "-" + optionPair.first;
        PetscOptionsSetValue(petscOptions, optionName.c_str(), optionPair.second.empty() ? nullptr : optionPair.second.c_str()) >> utilities::PetscUtilities::checkError;
    }
}
