#ifndef GASDYNLIBRARY_RELATION_HPP
#define GASDYNLIBRARY_RELATION_HPP
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace gasdyn::isentropic {

/**
 * The relations that can be selected by name from the command line
 */
enum class Relation {
    SonicVelocity,
    StagnationPressure,
    StagnationTemperature,
    StagnationPressureRatio,
    StagnationTemperatureRatio,
    StagnationDensityRatio,
    MachAreaRatioChoked,
    MachAreaRatio,
    MachFromPressureRatio,
    MachFromTemperatureRatio,
    PressureFromMachRatio,
    TemperatureFromMachRatio,
    EntropyProduced,
    ChokedMassFlux,
    MachFromAreaRatio,
    StagnationRatios
};

/**
 * Describes the arguments accepted by a relation
 */
struct RelationDescription {
    Relation relation;
    std::string_view name;
    std::string_view description;
    //! argument names, optional arguments are wrapped in []
    std::vector<std::string_view> arguments;
};

/**
 * Every relation in declaration order
 * @return
 */
const std::vector<RelationDescription>& ListRelations();

/**
 * Describe a single relation
 * @param relation
 * @return
 */
const RelationDescription& Describe(Relation relation);

/**
 * support function to get the relation name
 * @param relation
 * @return
 */
std::string_view to_string(const Relation& relation);

/**
 * support function to parse a relation name, matched ignoring case, underscores, and hyphens
 * @param relationName
 * @throws std::invalid_argument for an unknown relation
 * @return
 */
Relation from_string(const std::string_view& relationName);

inline std::ostream& operator<<(std::ostream& out, const Relation& relation) {
    out << to_string(relation);
    return out;
}

inline std::istream& operator>>(std::istream& in, Relation& relation) {
    std::string relationName;
    in >> relationName;
    relation = from_string(relationName);
    return in;
}

}  // namespace gasdyn::isentropic
#endif  // GASDYNLIBRARY_RELATION_HPP
