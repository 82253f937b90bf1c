#ifndef GASDYNLIBRARY_PERFECTGAS_HPP
#define GASDYNLIBRARY_PERFECTGAS_HPP
#include <petsc.h>
#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include "gas.hpp"
#include "parameters/parameters.hpp"

namespace gasdyn::eos {

/**
 * Calorically perfect gas described by a constant ratio of specific heats and specific gas constant in either metric or US customary units.  The gas is either one of the tabulated Gas values
 * or a custom gas with caller supplied properties.
 */
class PerfectGas {
   private:
    std::string name;
    GasProperties properties;
    bool metric;

   public:
    /**
     * tabulated gas, defaults to metric air
     * @param gas
     * @param metric
     */
    explicit PerfectGas(Gas gas = Gas::Air, bool metric = true);

    /**
     * custom gas
     * @param name name used when viewing the gas
     * @param properties gamma must be greater than one and rGas must be positive
     * @param metric the unit system of rGas
     */
    PerfectGas(std::string name, GasProperties properties, bool metric = true);

    /**
     * Builds the gas from parameters:
     *  - gas: tabulated gas name (default air)
     *  - metric: unit system (default true)
     *  - gamma, Rgas: both specified for a custom gas instead of gas
     *  - name: optional name for the custom gas
     */
    explicit PerfectGas(const parameters::Parameters& parameters);

    //! every key read by the parameters constructor
    inline static const std::vector<std::string> parameterKeys = {"gas", "metric", "gamma", "Rgas", "name"};

    void View(std::ostream& stream) const;

    /**
     * Get constant specific heat ratio for a perfect gas.
     * @return
     */
    [[nodiscard]] PetscReal GetSpecificHeatRatio() const { return properties.gamma; }

    /**
     * Get constant gas constant for a perfect gas, in the unit system of the gas
     * @return
     */
    [[nodiscard]] PetscReal GetGasConstant() const { return properties.rGas; }

    [[nodiscard]] const GasProperties& GetProperties() const { return properties; }

    [[nodiscard]] bool IsMetric() const { return metric; }

    [[nodiscard]] const std::string& GetName() const { return name; }

    friend std::ostream& operator<<(std::ostream& out, const PerfectGas& gas) {
        gas.View(out);
        return out;
    }
};

}  // namespace gasdyn::eos
#endif  // GASDYNLIBRARY_PERFECTGAS_HPP
