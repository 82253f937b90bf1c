#include "petscOptionParameters.hpp"
#include <cctype>
#include <sstream>
#include "utilities/petscUtilities.hpp"

gasdyn::parameters::PetscOptionParameters::PetscOptionParameters(PetscOptions petscOptionsIn) : petscOptions(petscOptionsIn) {}

std::optional<std::string> gasdyn::parameters::PetscOptionParameters::GetString(std::string paramName) const {
    PetscBool found;
    char result[PETSC_MAX_PATH_LEN] = "";

    // add prefix to the param name
    auto paramNamePetsc = "-" + paramName;

    PetscOptionsGetString(petscOptions, nullptr, paramNamePetsc.c_str(), result, PETSC_MAX_PATH_LEN, &found) >> utilities::PetscUtilities::checkError;

    if (found) {
        return std::string(result);
    } else {
        return {};
    }
}

std::unordered_set<std::string> gasdyn::parameters::PetscOptionParameters::GetKeys() const {
    std::unordered_set<std::string> keys;

    // petsc reports every option as a single "-name value -name value" string
    char* keyString;
    PetscOptionsGetAll(petscOptions, &keyString) >> utilities::PetscUtilities::checkError;

    std::istringstream stream(keyString);
    std::string token;
    while (stream >> token) {
        // values may be negative numbers, so only a dash followed by a letter starts a key
        if (token.size() > 1 && token[0] == '-' && std::isalpha(static_cast<unsigned char>(token[1]))) {
            keys.insert(token.substr(1));
        }
    }
    PetscFree(keyString) >> utilities::PetscUtilities::checkError;

    return keys;
}
