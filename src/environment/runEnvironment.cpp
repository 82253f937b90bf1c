#include "runEnvironment.hpp"
#include <algorithm>
#include "version.h"

void gasdyn::environment::RunEnvironment::Initialize(int* argc, char*** args) {
    GlobalArgc = argc;
    GlobalArgs = args;
}

void gasdyn::environment::RunEnvironment::RegisterCleanUpFunction(const std::string& name, std::function<void()> newFunction) {
    auto iterator = std::find_if(finalizeFunctions.begin(), finalizeFunctions.end(), [&name](const auto& function) { return function.name == name; });
    if (iterator == finalizeFunctions.end()) {
        finalizeFunctions.push_back({.name = name, .function = std::move(newFunction)});
    } else {
        iterator->function = std::move(newFunction);
    }
}

void gasdyn::environment::RunEnvironment::Finalize() {
    /* Iterate vector in reverse order */
    for (auto finalizeFunction = finalizeFunctions.rbegin(); finalizeFunction != finalizeFunctions.rend(); ++finalizeFunction) {
        finalizeFunction->function();
    }
    finalizeFunctions.clear();

    GlobalArgc = &DefaultGlobalArgc;
    GlobalArgs = &DefaultGlobalArgs;
}

std::string_view gasdyn::environment::RunEnvironment::GetVersion() { return GASDYN_VERSION; }
