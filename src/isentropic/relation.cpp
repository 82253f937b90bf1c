#include "relation.hpp"
#include <algorithm>
#include <stdexcept>
#include "utilities/stringUtilities.hpp"

const std::vector<gasdyn::isentropic::RelationDescription>& gasdyn::isentropic::ListRelations() {
    static const std::vector<RelationDescription> relations = {
        {Relation::SonicVelocity, "sonicVelocity", "local speed of sound", {"T"}},
        {Relation::StagnationPressure, "stagnationPressure", "solves for the missing one of the stagnation pressure, static pressure, and Mach number", {"[pt]", "[p]", "[M]"}},
        {Relation::StagnationTemperature, "stagnationTemperature", "solves for the missing one of the stagnation temperature, static temperature, and Mach number", {"[Tt]", "[T]", "[M]"}},
        {Relation::StagnationPressureRatio, "stagnationPressureRatio", "p/pt at each Mach number", {"M"}},
        {Relation::StagnationTemperatureRatio, "stagnationTemperatureRatio", "T/Tt at each Mach number", {"M"}},
        {Relation::StagnationDensityRatio, "stagnationDensityRatio", "rho/rho_t at each Mach number", {"M"}},
        {Relation::MachAreaRatioChoked, "machAreaRatioChoked", "A/A* at each Mach number", {"M"}},
        {Relation::MachAreaRatio, "machAreaRatio", "A2/A1 between two Mach numbers", {"M1", "M2", "[ds]"}},
        {Relation::MachFromPressureRatio, "machFromPressureRatio", "M2 from the static pressures at two stations", {"p1", "p2", "M1", "[ds]"}},
        {Relation::MachFromTemperatureRatio, "machFromTemperatureRatio", "M2 from the static temperatures at two stations", {"T1", "T2", "M1"}},
        {Relation::PressureFromMachRatio, "pressureFromMachRatio", "p2 from the Mach numbers at two stations", {"M1", "M2", "p1", "[ds]"}},
        {Relation::TemperatureFromMachRatio, "temperatureFromMachRatio", "T2 from the Mach numbers at two stations", {"M1", "M2", "T1"}},
        {Relation::EntropyProduced, "entropyProduced", "entropy produced between two stagnation states", {"pt1", "pt2"}},
        {Relation::ChokedMassFlux, "chokedMassFlux", "mass flow per unit choked area", {"pt", "Tt"}},
        {Relation::MachFromAreaRatio, "machFromAreaRatio", "subsonic and supersonic Mach numbers for A/A*", {"areaRatio"}},
        {Relation::StagnationRatios, "stagnationRatios", "p/pt, T/Tt, A/A*, and rho/rho_t over a Mach range", {"[min]", "[max]", "[increment]"}}};
    return relations;
}

const gasdyn::isentropic::RelationDescription& gasdyn::isentropic::Describe(Relation relation) {
    const auto& relations = ListRelations();
    auto description = std::find_if(relations.begin(), relations.end(), [relation](const auto& r) { return r.relation == relation; });
    if (description == relations.end()) {
        throw std::invalid_argument("Unknown relation " + std::to_string(static_cast<int>(relation)));
    }
    return *description;
}

std::string_view gasdyn::isentropic::to_string(const Relation& relation) { return Describe(relation).name; }

gasdyn::isentropic::Relation gasdyn::isentropic::from_string(const std::string_view& relationName) {
    const auto key = utilities::StringUtilities::ToKey(relationName);
    for (const auto& description : ListRelations()) {
        if (key == utilities::StringUtilities::ToKey(description.name)) {
            return description.relation;
        }
    }
    throw std::invalid_argument("Unknown relation '" + std::string(relationName) + "'");
}
