#ifndef GASDYNLIBRARY_ISENTROPICFLOW_HPP
#define GASDYNLIBRARY_ISENTROPICFLOW_HPP
#include <petsc.h>
#include <ostream>
#include <vector>
#include "eos/perfectGas.hpp"
#include "machRange.hpp"
#include "stagnationInput.hpp"

namespace gasdyn::isentropic {

/**
 * The two Mach numbers that produce a given choked area ratio
 */
struct MachSolutions {
    //! root in (0, 1]
    PetscReal subsonic;
    //! root in [1, inf)
    PetscReal supersonic;
};

/**
 * The stagnation ratios evaluated at a single Mach number
 */
struct StagnationRatioRow {
    PetscReal mach;
    //! p/pt
    PetscReal pressureRatio;
    //! T/Tt
    PetscReal temperatureRatio;
    //! A/A*
    PetscReal areaRatio;
    //! rho/rho_t
    PetscReal densityRatio;
};

/**
 * Isentropic relations for one-dimensional steady flow of a perfect gas.  Every relation is a pure function of the gas and the supplied arguments.
 */
class IsentropicFlow {
   private:
    const eos::PerfectGas gas;

    // 1 + (gamma-1)/2 M^2
    [[nodiscard]] PetscReal TemperatureFactor(PetscReal mach) const;

    // single branch roots of A/A*(M) = areaRatio for areaRatio > 1
    [[nodiscard]] PetscReal SubsonicMachFromAreaRatio(PetscReal areaRatio) const;
    [[nodiscard]] PetscReal SupersonicMachFromAreaRatio(PetscReal areaRatio) const;

   public:
    explicit IsentropicFlow(eos::PerfectGas gas = eos::PerfectGas());

    [[nodiscard]] const eos::PerfectGas& GetGas() const { return gas; }

    /**
     * local speed of sound, a = sqrt(gamma R T).  In US units the result is in sqrt(ft lbf/lbm) and must be scaled by sqrt(gc) for ft/s.
     * @param temperature
     * @return
     */
    [[nodiscard]] PetscReal SonicVelocity(PetscReal temperature) const;

    /**
     * Relates stagnation pressure, static pressure, and Mach number.  Exactly two of the three must be supplied.
     * @param input
     * @return the completed state
     */
    [[nodiscard]] StagnationState StagnationPressure(const StagnationInput& input) const;

    /**
     * Relates stagnation temperature, static temperature, and Mach number.  Exactly two of the three must be supplied.
     * @param input
     * @return the completed state
     */
    [[nodiscard]] StagnationState StagnationTemperature(const StagnationInput& input) const;

    //! p/pt
    [[nodiscard]] PetscReal StagnationPressureRatio(PetscReal mach) const;
    [[nodiscard]] std::vector<PetscReal> StagnationPressureRatio(const std::vector<PetscReal>& mach) const;

    //! T/Tt
    [[nodiscard]] PetscReal StagnationTemperatureRatio(PetscReal mach) const;
    [[nodiscard]] std::vector<PetscReal> StagnationTemperatureRatio(const std::vector<PetscReal>& mach) const;

    //! rho/rho_t
    [[nodiscard]] PetscReal StagnationDensityRatio(PetscReal mach) const;
    [[nodiscard]] std::vector<PetscReal> StagnationDensityRatio(const std::vector<PetscReal>& mach) const;

    /**
     * The ratio of the area to the choked (sonic) area, A/A*.  Returns infinity at M = 0.
     * @param mach
     * @return
     */
    [[nodiscard]] PetscReal MachAreaRatioChoked(PetscReal mach) const;
    [[nodiscard]] std::vector<PetscReal> MachAreaRatioChoked(const std::vector<PetscReal>& mach) const;

    /**
     * The area ratio A2/A1 required to move from M1 to M2 with an entropy rise ds
     * @param mach1
     * @param mach2
     * @param ds entropy produced between the stations
     * @return
     */
    [[nodiscard]] PetscReal MachAreaRatio(PetscReal mach1, PetscReal mach2, PetscReal ds = 0.0) const;

    /**
     * The Mach number at station two given the static pressures at both stations
     * @param pressure1
     * @param pressure2
     * @param mach1
     * @param ds entropy produced between the stations
     * @return
     */
    [[nodiscard]] PetscReal MachFromPressureRatio(PetscReal pressure1, PetscReal pressure2, PetscReal mach1, PetscReal ds = 0.0) const;

    /**
     * The Mach number at station two given the static temperatures at both stations
     * @param temperature1
     * @param temperature2
     * @param mach1
     * @return
     */
    [[nodiscard]] PetscReal MachFromTemperatureRatio(PetscReal temperature1, PetscReal temperature2, PetscReal mach1) const;

    /**
     * The static pressure at station two
     * @param mach1
     * @param mach2
     * @param pressure1
     * @param ds entropy produced between the stations
     * @return
     */
    [[nodiscard]] PetscReal PressureFromMachRatio(PetscReal mach1, PetscReal mach2, PetscReal pressure1, PetscReal ds = 0.0) const;

    /**
     * The static temperature at station two
     * @param mach1
     * @param mach2
     * @param temperature1
     * @return
     */
    [[nodiscard]] PetscReal TemperatureFromMachRatio(PetscReal mach1, PetscReal mach2, PetscReal temperature1) const;

    /**
     * entropy produced between two stagnation states, ds = -R ln(pt2/pt1)
     * @param stagnationPressure1
     * @param stagnationPressure2
     * @return
     */
    [[nodiscard]] PetscReal EntropyProduced(PetscReal stagnationPressure1, PetscReal stagnationPressure2) const;

    /**
     * mass flow per unit choked area.  US units include the gravitational constant gc.
     * @param stagnationPressure
     * @param stagnationTemperature
     * @return
     */
    [[nodiscard]] PetscReal ChokedMassFlux(PetscReal stagnationPressure, PetscReal stagnationTemperature) const;

    /**
     * Inverts the choked area ratio.  Every A/A* > 1 is produced by one subsonic and one supersonic Mach number; A/A* = 1 returns M = 1 for both.
     * @param areaRatio A/A*, must be >= 1
     * @return
     */
    [[nodiscard]] MachSolutions MachFromAreaRatio(PetscReal areaRatio) const;

    /**
     * Evaluates the stagnation ratios at each Mach number in the range
     * @param range
     * @return
     */
    [[nodiscard]] std::vector<StagnationRatioRow> StagnationRatios(const MachRange& range) const;
};

}  // namespace gasdyn::isentropic
#endif  // GASDYNLIBRARY_ISENTROPICFLOW_HPP
