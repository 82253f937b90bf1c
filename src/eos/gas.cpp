#include "gas.hpp"
#include <algorithm>
#include <array>
#include "utilities/stringUtilities.hpp"

namespace {
struct GasEntry {
    gasdyn::eos::Gas gas;
    std::string_view name;
    std::string_view formula;
    PetscReal gamma;
    PetscReal rGasMetric;  // J/(kg K)
    PetscReal rGasUs;      // ft lbf/(lbm R)
};

// Zucker & Biblarz, Fundamentals of Gas Dynamics, Table A.1
constexpr std::array<GasEntry, 10> gasRegistry = {{{gasdyn::eos::Gas::Air, "air", "", 1.40, 287.0, 53.3},
                                                   {gasdyn::eos::Gas::Argon, "argon", "Ar", 1.67, 208.0, 38.7},
                                                   {gasdyn::eos::Gas::CarbonDioxide, "carbon dioxide", "CO2", 1.29, 189.0, 35.1},
                                                   {gasdyn::eos::Gas::CarbonMonoxide, "carbon monoxide", "CO", 1.40, 297.0, 55.2},
                                                   {gasdyn::eos::Gas::Helium, "helium", "He", 1.67, 2077.0, 386.0},
                                                   {gasdyn::eos::Gas::Hydrogen, "hydrogen", "H2", 1.41, 4124.0, 766.0},
                                                   {gasdyn::eos::Gas::Methane, "methane", "CH4", 1.32, 518.0, 96.4},
                                                   {gasdyn::eos::Gas::Nitrogen, "nitrogen", "N2", 1.40, 297.0, 55.2},
                                                   {gasdyn::eos::Gas::Oxygen, "oxygen", "O2", 1.40, 260.0, 48.3},
                                                   {gasdyn::eos::Gas::WaterVapor, "water vapor", "H2O", 1.33, 461.0, 85.8}}};

const GasEntry& FindEntry(gasdyn::eos::Gas gas) {
    auto entry = std::find_if(gasRegistry.begin(), gasRegistry.end(), [gas](const auto& e) { return e.gas == gas; });
    if (entry == gasRegistry.end()) {
        throw gasdyn::eos::UnknownGasError(std::to_string(static_cast<int>(gas)));
    }
    return *entry;
}
}  // namespace

gasdyn::eos::GasProperties gasdyn::eos::GasTable::Lookup(Gas gas, bool metric) {
    const auto& entry = FindEntry(gas);
    return GasProperties{.gamma = entry.gamma, .rGas = metric ? entry.rGasMetric : entry.rGasUs};
}

gasdyn::eos::GasProperties gasdyn::eos::GasTable::Lookup(const std::string& gasName, bool metric) { return Lookup(from_string(gasName), metric); }

const std::vector<gasdyn::eos::Gas>& gasdyn::eos::GasTable::All() {
    static const std::vector<Gas> gases = [] {
        std::vector<Gas> all;
        for (const auto& entry : gasRegistry) {
            all.push_back(entry.gas);
        }
        return all;
    }();
    return gases;
}

std::string_view gasdyn::eos::to_string(const Gas& gas) { return FindEntry(gas).name; }

gasdyn::eos::Gas gasdyn::eos::from_string(const std::string_view& gasName) {
    const auto key = utilities::StringUtilities::ToKey(gasName);
    for (const auto& entry : gasRegistry) {
        if (key == utilities::StringUtilities::ToKey(entry.name) || (!entry.formula.empty() && key == utilities::StringUtilities::ToKey(entry.formula))) {
            return entry.gas;
        }
    }
    // common alternate spelling
    if (key == "watervapour" || key == "steam") {
        return Gas::WaterVapor;
    }
    throw UnknownGasError(std::string(gasName));
}
