#include <petsc.h>
#include <filesystem>
#include <iostream>
#include <memory>
#include "builder.hpp"
#include "environment/runEnvironment.hpp"
#include "monitors/logs/stdOut.hpp"
#include "parameters/petscOptionParameters.hpp"
#include "parameters/yamlParameters.hpp"
#include "utilities/petscUtilities.hpp"

using namespace gasdyn;

static const char help[] = "Isentropic compressible flow relations for a perfect gas.  Run with --help for the list of relations.\n";

static PetscBool OptionSet(const char* name) {
    PetscBool set = PETSC_FALSE;
    PetscOptionsHasName(nullptr, nullptr, name, &set) >> utilities::PetscUtilities::checkError;
    return set;
}

static int Run() {
    // check to see if we should print version
    if (OptionSet("--version")) {
        Builder::PrintVersion(std::cout);
        std::cout << std::endl;
        return 0;
    }

    if (OptionSet("--info")) {
        Builder::PrintInfo(std::cout);
        std::cout << std::endl;
        return 0;
    }

    if (OptionSet("--help")) {
        Builder::PrintHelp(std::cout);
        return 0;
    }

    // read from an input file if specified, otherwise the command line options
    std::shared_ptr<parameters::Parameters> inputParameters;
    char filename[PETSC_MAX_PATH_LEN] = "";
    PetscBool fileSpecified = PETSC_FALSE;
    PetscOptionsGetString(nullptr, nullptr, "-input", filename, PETSC_MAX_PATH_LEN, &fileSpecified) >> utilities::PetscUtilities::checkError;
    if (fileSpecified) {
        inputParameters = parameters::YamlParameters::FromFile(std::filesystem::path(filename));
    } else {
        inputParameters = std::make_shared<parameters::PetscOptionParameters>();
    }

    monitors::logs::StdOut log;
    log.Initialize(PETSC_COMM_WORLD);
    Builder::Run(*inputParameters, log);
    return 0;
}

int main(int argc, char** args) {
    // initialize petsc and mpi
    environment::RunEnvironment::Initialize(&argc, &args);
    utilities::PetscUtilities::Initialize(help);

    int status;
    try {
        status = Run();
    } catch (const std::exception& exception) {
        if (PetscFPrintf(PETSC_COMM_WORLD, PETSC_STDERR, "gasdyn: %s\n", exception.what())) {
            std::cerr << "gasdyn: " << exception.what() << std::endl;
        }
        status = 1;
    }

    environment::RunEnvironment::Finalize();
    return status;
}
