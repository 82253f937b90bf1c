#include "perfectGas.hpp"
#include <utility>
#include "inputErrors.hpp"

gasdyn::eos::PerfectGas::PerfectGas(Gas gas, bool metric) : name(to_string(gas)), properties(GasTable::Lookup(gas, metric)), metric(metric) {}

gasdyn::eos::PerfectGas::PerfectGas(std::string nameIn, GasProperties propertiesIn, bool metric) : name(std::move(nameIn)), properties(propertiesIn), metric(metric) {
    if (!(properties.gamma > 1.0)) {
        throw InvalidInputError("The ratio of specific heats for " + name + " must be greater than 1 (got " + std::to_string(properties.gamma) + ")");
    }
    if (!(properties.rGas > 0.0)) {
        throw InvalidInputError("The gas constant for " + name + " must be positive (got " + std::to_string(properties.rGas) + ")");
    }
}

static gasdyn::eos::PerfectGas CreateFromParameters(const gasdyn::parameters::Parameters& parameters) {
    const auto metric = parameters.Get<bool>("metric", true);
    const bool custom = parameters.Contains("gamma") || parameters.Contains("Rgas");

    if (!custom) {
        return gasdyn::eos::PerfectGas(parameters.Get<gasdyn::eos::Gas>("gas", gasdyn::eos::Gas::Air), metric);
    }
    if (parameters.Contains("gas")) {
        throw gasdyn::AmbiguousInputError("Specify either gas or gamma and Rgas, not both");
    }
    if (!parameters.Contains("gamma") || !parameters.Contains("Rgas")) {
        throw gasdyn::InsufficientInputError("A custom gas requires both gamma and Rgas");
    }
    return gasdyn::eos::PerfectGas(parameters.Get<std::string>("name", "custom"),
                                   gasdyn::eos::GasProperties{.gamma = parameters.GetExpect<PetscReal>("gamma"), .rGas = parameters.GetExpect<PetscReal>("Rgas")},
                                   metric);
}

gasdyn::eos::PerfectGas::PerfectGas(const parameters::Parameters& parameters) : PerfectGas(CreateFromParameters(parameters)) {}

void gasdyn::eos::PerfectGas::View(std::ostream& stream) const {
    stream << "EOS: perfectGas" << std::endl;
    stream << "\tgas: " << name << std::endl;
    stream << "\tgamma: " << properties.gamma << std::endl;
    stream << "\tRgas: " << properties.rGas << std::endl;
    stream << "\tunits: " << (metric ? "metric" : "US") << std::endl;
}
