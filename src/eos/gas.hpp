#ifndef GASDYNLIBRARY_GAS_HPP
#define GASDYNLIBRARY_GAS_HPP
#include <petsc.h>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>
#include "unknownGasError.hpp"

namespace gasdyn::eos {

/**
 * The gases with tabulated properties
 */
enum class Gas { Air, Argon, CarbonDioxide, CarbonMonoxide, Helium, Hydrogen, Methane, Nitrogen, Oxygen, WaterVapor };

/**
 * Ratio of specific heats and specific gas constant for a perfect gas
 */
struct GasProperties {
    //! ratio of specific heats, cp/cv
    PetscReal gamma;
    //! specific gas constant, J/(kg K) for metric or ft lbf/(lbm R) for US customary units
    PetscReal rGas;
};

/**
 * Read only registry of tabulated gas properties.  The table is constant after static initialization and may be shared between threads.
 */
class GasTable {
   public:
    /**
     * Look up the properties for a tabulated gas
     * @param gas
     * @param metric true for J/(kg K), false for ft lbf/(lbm R)
     * @return
     */
    static GasProperties Lookup(Gas gas, bool metric = true);

    /**
     * Look up the properties by name.  Names are matched case insensitively, ignoring whitespace, underscores, and hyphens.  Chemical formulas (CO2, N2, ...) are also accepted.
     * @param gasName
     * @param metric
     * @throws UnknownGasError if the name is not in the registry
     * @return
     */
    static GasProperties Lookup(const std::string& gasName, bool metric = true);

    /**
     * Every tabulated gas in registry order
     * @return
     */
    static const std::vector<Gas>& All();

    GasTable() = delete;
};

/**
 * support function to get the gas name
 * @param gas
 * @return
 */
std::string_view to_string(const Gas& gas);

/**
 * support function to parse a gas name
 * @param gasName
 * @throws UnknownGasError
 * @return
 */
Gas from_string(const std::string_view& gasName);

/**
 * Support function for printing a gas
 * @param out
 * @param gas
 * @return
 */
inline std::ostream& operator<<(std::ostream& out, const Gas& gas) {
    out << to_string(gas);
    return out;
}

/**
 * Support function for reading a gas, consumes the rest of the line so that multi word names ("carbon dioxide") can be read
 * @param in
 * @param gas
 * @return
 */
inline std::istream& operator>>(std::istream& in, Gas& gas) {
    std::string gasName;
    std::getline(in >> std::ws, gasName);
    gas = from_string(gasName);
    return in;
}

}  // namespace gasdyn::eos
#endif  // GASDYNLIBRARY_GAS_HPP
