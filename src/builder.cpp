#include "builder.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <set>
#include <sstream>
#include <stdexcept>
#include "eos/perfectGas.hpp"
#include "environment/runEnvironment.hpp"
#include "inputErrors.hpp"
#include "isentropic/isentropicFlow.hpp"
#include "isentropic/relation.hpp"

namespace {
gasdyn::Builder::Result Scalar(const std::string& name, PetscReal value) { return gasdyn::Builder::Result{.name = name, .values = {value}}; }

gasdyn::isentropic::StagnationInput ReadStagnationInput(const gasdyn::parameters::Parameters& parameters, const std::string& stagnationName, const std::string& staticName) {
    gasdyn::isentropic::StagnationInput input;
    if (auto value = parameters.Get<PetscReal>(stagnationName)) {
        input.Stagnation(*value);
    }
    if (auto value = parameters.Get<PetscReal>(staticName)) {
        input.Static(*value);
    }
    if (auto value = parameters.Get<PetscReal>("M")) {
        input.Mach(*value);
    }
    return input;
}

/**
 * Rejects any key that neither the relation nor the gas reads, so a misspelled argument (-tt for -Tt) is reported instead of ignored
 */
void CheckKeys(const gasdyn::parameters::Parameters& parameters, const gasdyn::isentropic::RelationDescription& description) {
    std::set<std::string> knownKeys(gasdyn::eos::PerfectGas::parameterKeys.begin(), gasdyn::eos::PerfectGas::parameterKeys.end());
    knownKeys.insert("relation");
    for (const auto& argument : description.arguments) {
        // optional arguments are wrapped in []
        std::string key(argument);
        key.erase(std::remove_if(key.begin(), key.end(), [](char c) { return c == '[' || c == ']'; }), key.end());
        knownKeys.insert(key);
    }

    std::set<std::string> unknownKeys;
    for (const auto& key : parameters.GetKeys()) {
        if (!knownKeys.count(key)) {
            unknownKeys.insert(key);
        }
    }
    if (unknownKeys.empty()) {
        return;
    }

    std::string message = "Unknown parameter(s) for " + std::string(description.name) + ":";
    for (const auto& key : unknownKeys) {
        message += " " + key;
    }
    message += " (expected";
    for (const auto& key : knownKeys) {
        message += " " + key;
    }
    throw gasdyn::InvalidInputError(message + ")");
}

std::vector<gasdyn::Builder::Result> StateResults(const gasdyn::isentropic::StagnationState& state, const std::string& stagnationName, const std::string& staticName) {
    return {Scalar(stagnationName, state.stagnation), Scalar(staticName, state.local), Scalar("M", state.mach)};
}
}  // namespace

std::vector<gasdyn::Builder::Result> gasdyn::Builder::Evaluate(const parameters::Parameters& parameters) {
    using isentropic::Relation;
    const auto relation = parameters.GetExpect<Relation>("relation");
    CheckKeys(parameters, isentropic::Describe(relation));
    const isentropic::IsentropicFlow flow(eos::PerfectGas{parameters});

    switch (relation) {
        case Relation::SonicVelocity:
            return {Scalar("a", flow.SonicVelocity(parameters.GetExpect<PetscReal>("T")))};
        case Relation::StagnationPressure:
            return StateResults(flow.StagnationPressure(ReadStagnationInput(parameters, "pt", "p")), "pt", "p");
        case Relation::StagnationTemperature:
            return StateResults(flow.StagnationTemperature(ReadStagnationInput(parameters, "Tt", "T")), "Tt", "T");
        case Relation::StagnationPressureRatio:
            return {Result{.name = "p/pt", .values = flow.StagnationPressureRatio(parameters.GetExpect<std::vector<PetscReal>>("M"))}};
        case Relation::StagnationTemperatureRatio:
            return {Result{.name = "T/Tt", .values = flow.StagnationTemperatureRatio(parameters.GetExpect<std::vector<PetscReal>>("M"))}};
        case Relation::StagnationDensityRatio:
            return {Result{.name = "rho/rho_t", .values = flow.StagnationDensityRatio(parameters.GetExpect<std::vector<PetscReal>>("M"))}};
        case Relation::MachAreaRatioChoked:
            return {Result{.name = "A/A*", .values = flow.MachAreaRatioChoked(parameters.GetExpect<std::vector<PetscReal>>("M"))}};
        case Relation::MachAreaRatio:
            return {Scalar("A2/A1", flow.MachAreaRatio(parameters.GetExpect<PetscReal>("M1"), parameters.GetExpect<PetscReal>("M2"), parameters.Get<PetscReal>("ds", 0.0)))};
        case Relation::MachFromPressureRatio:
            return {Scalar("M2",
                           flow.MachFromPressureRatio(
                               parameters.GetExpect<PetscReal>("p1"), parameters.GetExpect<PetscReal>("p2"), parameters.GetExpect<PetscReal>("M1"), parameters.Get<PetscReal>("ds", 0.0)))};
        case Relation::MachFromTemperatureRatio:
            return {Scalar("M2", flow.MachFromTemperatureRatio(parameters.GetExpect<PetscReal>("T1"), parameters.GetExpect<PetscReal>("T2"), parameters.GetExpect<PetscReal>("M1")))};
        case Relation::PressureFromMachRatio:
            return {Scalar("p2",
                           flow.PressureFromMachRatio(
                               parameters.GetExpect<PetscReal>("M1"), parameters.GetExpect<PetscReal>("M2"), parameters.GetExpect<PetscReal>("p1"), parameters.Get<PetscReal>("ds", 0.0)))};
        case Relation::TemperatureFromMachRatio:
            return {Scalar("T2", flow.TemperatureFromMachRatio(parameters.GetExpect<PetscReal>("M1"), parameters.GetExpect<PetscReal>("M2"), parameters.GetExpect<PetscReal>("T1")))};
        case Relation::EntropyProduced:
            return {Scalar("ds", flow.EntropyProduced(parameters.GetExpect<PetscReal>("pt1"), parameters.GetExpect<PetscReal>("pt2")))};
        case Relation::ChokedMassFlux:
            return {Scalar("mdot/A*", flow.ChokedMassFlux(parameters.GetExpect<PetscReal>("pt"), parameters.GetExpect<PetscReal>("Tt")))};
        case Relation::MachFromAreaRatio: {
            auto solutions = flow.MachFromAreaRatio(parameters.GetExpect<PetscReal>("areaRatio"));
            return {Scalar("subsonic", solutions.subsonic), Scalar("supersonic", solutions.supersonic)};
        }
        case Relation::StagnationRatios: {
            // default table from M = 0 to 5
            isentropic::MachRange range(parameters.Get<PetscReal>("min", 0.0), parameters.Get<PetscReal>("max", 5.0), parameters.Get<PetscReal>("increment", 0.1));
            std::vector<Result> results = {{"M", {}}, {"p/pt", {}}, {"T/Tt", {}}, {"A/A*", {}}, {"rho/rho_t", {}}};
            for (const auto& row : flow.StagnationRatios(range)) {
                results[0].values.push_back(row.mach);
                results[1].values.push_back(row.pressureRatio);
                results[2].values.push_back(row.temperatureRatio);
                results[3].values.push_back(row.areaRatio);
                results[4].values.push_back(row.densityRatio);
            }
            return results;
        }
    }
    throw std::invalid_argument("Unknown relation " + std::string(isentropic::to_string(relation)));
}

void gasdyn::Builder::Run(const parameters::Parameters& parameters, monitors::logs::Log& log) {
    if (!log.Initialized()) {
        log.Initialize(PETSC_COMM_WORLD);
    }

    // echo the gas so that the units are clear
    eos::PerfectGas{parameters}.View(log.GetStream());
    log.GetStream().flush();

    for (const auto& result : Evaluate(parameters)) {
        if (result.values.size() == 1) {
            log.Printf("%s: %.15g\n", result.name.c_str(), (double)result.values.front());
        } else {
            log.Print(result.name.c_str(), std::vector<double>(result.values.begin(), result.values.end()), "%.15g");
            log.Print("\n");
        }
    }
}

void gasdyn::Builder::PrintVersion(std::ostream& stream) { stream << environment::RunEnvironment::GetVersion(); }

void gasdyn::Builder::PrintInfo(std::ostream& stream) {
    // force this to print as yaml, so it is human and machine-readable
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "gasdyn";
    out << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "version";
    out << YAML::Value << std::string(environment::RunEnvironment::GetVersion());

    // build and print the petsc version number
    out << YAML::Key << "petscVersion";
    std::stringstream petscVersion;
    petscVersion << PETSC_VERSION_MAJOR << "." << PETSC_VERSION_MINOR << "." << PETSC_VERSION_SUBMINOR;
    out << YAML::Value << petscVersion.str();

    // list the tabulated gases in both unit systems
    out << YAML::Key << "gases";
    out << YAML::Value << YAML::BeginMap;
    for (const auto& gas : eos::GasTable::All()) {
        const auto metric = eos::GasTable::Lookup(gas, true);
        const auto us = eos::GasTable::Lookup(gas, false);
        out << YAML::Key << std::string(eos::to_string(gas));
        out << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "gamma" << YAML::Value << metric.gamma;
        out << YAML::Key << "RgasMetric" << YAML::Value << metric.rGas;
        out << YAML::Key << "RgasUS" << YAML::Value << us.rGas;
        out << YAML::EndMap;
    }
    out << YAML::EndMap;
    out << YAML::EndMap << YAML::EndMap;

    // Pipe to the output stream
    stream << out.c_str();
}

void gasdyn::Builder::PrintHelp(std::ostream& stream) {
    stream << "usage: gasdyn -relation <name> [-gas <name> | -gamma <value> -Rgas <value>] [-metric <bool>] [arguments]" << std::endl;
    stream << "       gasdyn -input <file.yaml>" << std::endl;
    stream << "       gasdyn --version | --info | --help" << std::endl << std::endl;
    stream << "relations ([] marks optional arguments):" << std::endl;
    for (const auto& description : isentropic::ListRelations()) {
        stream << "  " << description.name;
        for (const auto& argument : description.arguments) {
            stream << " " << argument;
        }
        stream << std::endl << "      " << description.description << std::endl;
    }
}
