#include "isentropicFlow.hpp"
#include <stdexcept>
#include <string>
#include <utility>
#include "inputErrors.hpp"
#include "utilities/constants.hpp"
#include "utilities/mathUtilities.hpp"

namespace {

void CheckPositive(const char* name, PetscReal value) {
    if (!(value > 0.0) || PetscIsInfOrNanReal(value)) {
        throw gasdyn::InvalidInputError(std::string(name) + " must be positive and finite, " + std::to_string(value) + " given");
    }
}

void CheckMach(const char* name, PetscReal mach) {
    if (!(mach >= 0.0) || PetscIsInfOrNanReal(mach)) {
        throw gasdyn::InvalidInputError(std::string(name) + " must not be negative, " + std::to_string(mach) + " given");
    }
}

void CheckFinite(const char* name, PetscReal value) {
    if (PetscIsInfOrNanReal(value)) {
        throw gasdyn::InvalidInputError(std::string(name) + " must be finite");
    }
}

/**
 * Applies a scalar member to each Mach number
 */
template <class F>
std::vector<PetscReal> EvaluateEach(const std::vector<PetscReal>& mach, F&& function) {
    std::vector<PetscReal> result;
    result.reserve(mach.size());
    for (const auto& m : mach) {
        result.push_back(function(m));
    }
    return result;
}

}  // namespace

gasdyn::isentropic::IsentropicFlow::IsentropicFlow(eos::PerfectGas gas) : gas(std::move(gas)) {}

PetscReal gasdyn::isentropic::IsentropicFlow::TemperatureFactor(PetscReal mach) const {
    const PetscReal gamma = gas.GetSpecificHeatRatio();
    return 1.0 + 0.5 * (gamma - 1.0) * mach * mach;
}

PetscReal gasdyn::isentropic::IsentropicFlow::SonicVelocity(PetscReal temperature) const {
    CheckPositive("Temperature", temperature);
    return PetscSqrtReal(gas.GetSpecificHeatRatio() * gas.GetGasConstant() * temperature);
}

gasdyn::isentropic::StagnationState gasdyn::isentropic::IsentropicFlow::StagnationPressure(const StagnationInput& input) const {
    const auto missing = input.Missing();
    const PetscReal gamma = gas.GetSpecificHeatRatio();
    const PetscReal exponent = gamma / (gamma - 1.0);

    switch (missing) {
        case StagnationQuantity::Stagnation: {
            const PetscReal p = *input.GetStatic();
            const PetscReal mach = *input.GetMach();
            CheckPositive("Pressure", p);
            CheckMach("Mach number", mach);
            return StagnationState{.stagnation = p * PetscPowReal(TemperatureFactor(mach), exponent), .local = p, .mach = mach, .solved = missing};
        }
        case StagnationQuantity::Static: {
            const PetscReal pt = *input.GetStagnation();
            const PetscReal mach = *input.GetMach();
            CheckPositive("Stagnation pressure", pt);
            CheckMach("Mach number", mach);
            return StagnationState{.stagnation = pt, .local = pt / PetscPowReal(TemperatureFactor(mach), exponent), .mach = mach, .solved = missing};
        }
        case StagnationQuantity::Mach: {
            const PetscReal pt = *input.GetStagnation();
            const PetscReal p = *input.GetStatic();
            CheckPositive("Stagnation pressure", pt);
            CheckPositive("Pressure", p);
            if (pt < p) {
                throw InvalidInputError("The stagnation pressure (" + std::to_string(pt) + ") must not be less than the static pressure (" + std::to_string(p) + ")");
            }
            const PetscReal mach = PetscSqrtReal((PetscPowReal(pt / p, 1.0 / exponent) - 1.0) * 2.0 / (gamma - 1.0));
            return StagnationState{.stagnation = pt, .local = p, .mach = mach, .solved = missing};
        }
    }
    throw std::invalid_argument("Unknown stagnation quantity");
}

gasdyn::isentropic::StagnationState gasdyn::isentropic::IsentropicFlow::StagnationTemperature(const StagnationInput& input) const {
    const auto missing = input.Missing();
    const PetscReal gamma = gas.GetSpecificHeatRatio();

    switch (missing) {
        case StagnationQuantity::Stagnation: {
            const PetscReal t = *input.GetStatic();
            const PetscReal mach = *input.GetMach();
            CheckPositive("Temperature", t);
            CheckMach("Mach number", mach);
            return StagnationState{.stagnation = t * TemperatureFactor(mach), .local = t, .mach = mach, .solved = missing};
        }
        case StagnationQuantity::Static: {
            const PetscReal tt = *input.GetStagnation();
            const PetscReal mach = *input.GetMach();
            CheckPositive("Stagnation temperature", tt);
            CheckMach("Mach number", mach);
            return StagnationState{.stagnation = tt, .local = tt / TemperatureFactor(mach), .mach = mach, .solved = missing};
        }
        case StagnationQuantity::Mach: {
            const PetscReal tt = *input.GetStagnation();
            const PetscReal t = *input.GetStatic();
            CheckPositive("Stagnation temperature", tt);
            CheckPositive("Temperature", t);
            if (tt < t) {
                throw InvalidInputError("The stagnation temperature (" + std::to_string(tt) + ") must not be less than the static temperature (" + std::to_string(t) + ")");
            }
            return StagnationState{.stagnation = tt, .local = t, .mach = PetscSqrtReal((tt / t - 1.0) * 2.0 / (gamma - 1.0)), .solved = missing};
        }
    }
    throw std::invalid_argument("Unknown stagnation quantity");
}

PetscReal gasdyn::isentropic::IsentropicFlow::StagnationPressureRatio(PetscReal mach) const {
    CheckMach("Mach number", mach);
    const PetscReal gamma = gas.GetSpecificHeatRatio();
    return PetscPowReal(1.0 / TemperatureFactor(mach), gamma / (gamma - 1.0));
}

std::vector<PetscReal> gasdyn::isentropic::IsentropicFlow::StagnationPressureRatio(const std::vector<PetscReal>& mach) const {
    return EvaluateEach(mach, [this](PetscReal m) { return StagnationPressureRatio(m); });
}

PetscReal gasdyn::isentropic::IsentropicFlow::StagnationTemperatureRatio(PetscReal mach) const {
    CheckMach("Mach number", mach);
    return 1.0 / TemperatureFactor(mach);
}

std::vector<PetscReal> gasdyn::isentropic::IsentropicFlow::StagnationTemperatureRatio(const std::vector<PetscReal>& mach) const {
    return EvaluateEach(mach, [this](PetscReal m) { return StagnationTemperatureRatio(m); });
}

PetscReal gasdyn::isentropic::IsentropicFlow::StagnationDensityRatio(PetscReal mach) const {
    CheckMach("Mach number", mach);
    const PetscReal gamma = gas.GetSpecificHeatRatio();
    return PetscPowReal(1.0 / TemperatureFactor(mach), 1.0 / (gamma - 1.0));
}

std::vector<PetscReal> gasdyn::isentropic::IsentropicFlow::StagnationDensityRatio(const std::vector<PetscReal>& mach) const {
    return EvaluateEach(mach, [this](PetscReal m) { return StagnationDensityRatio(m); });
}

PetscReal gasdyn::isentropic::IsentropicFlow::MachAreaRatioChoked(PetscReal mach) const {
    CheckMach("Mach number", mach);
    if (mach == 0.0) {
        return PETSC_INFINITY;
    }
    const PetscReal gamma = gas.GetSpecificHeatRatio();
    return 1.0 / mach * PetscPowReal(TemperatureFactor(mach) / (0.5 * (gamma + 1.0)), 0.5 * (gamma + 1.0) / (gamma - 1.0));
}

std::vector<PetscReal> gasdyn::isentropic::IsentropicFlow::MachAreaRatioChoked(const std::vector<PetscReal>& mach) const {
    return EvaluateEach(mach, [this](PetscReal m) { return MachAreaRatioChoked(m); });
}

PetscReal gasdyn::isentropic::IsentropicFlow::MachAreaRatio(PetscReal mach1, PetscReal mach2, PetscReal ds) const {
    CheckPositive("Mach number 1", mach1);
    CheckPositive("Mach number 2", mach2);
    CheckFinite("Entropy produced", ds);
    const PetscReal gamma = gas.GetSpecificHeatRatio();
    return mach1 / mach2 * PetscPowReal(TemperatureFactor(mach2) / TemperatureFactor(mach1), 0.5 * (gamma + 1.0) / (gamma - 1.0)) * PetscExpReal(ds / gas.GetGasConstant());
}

PetscReal gasdyn::isentropic::IsentropicFlow::MachFromPressureRatio(PetscReal pressure1, PetscReal pressure2, PetscReal mach1, PetscReal ds) const {
    CheckPositive("Pressure 1", pressure1);
    CheckPositive("Pressure 2", pressure2);
    CheckMach("Mach number 1", mach1);
    CheckFinite("Entropy produced", ds);
    const PetscReal gamma = gas.GetSpecificHeatRatio();

    // pt2 = pt1 exp(-ds/R)
    const PetscReal radicand = (PetscPowReal(pressure1 / pressure2 * PetscExpReal(-ds / gas.GetGasConstant()), (gamma - 1.0) / gamma) * TemperatureFactor(mach1) - 1.0) * 2.0 / (gamma - 1.0);
    if (radicand < 0.0) {
        throw InvalidInputError("No real Mach number reaches a static pressure of " + std::to_string(pressure2) + " from " + std::to_string(pressure1) + " at Mach " + std::to_string(mach1));
    }
    return PetscSqrtReal(radicand);
}

PetscReal gasdyn::isentropic::IsentropicFlow::MachFromTemperatureRatio(PetscReal temperature1, PetscReal temperature2, PetscReal mach1) const {
    CheckPositive("Temperature 1", temperature1);
    CheckPositive("Temperature 2", temperature2);
    CheckMach("Mach number 1", mach1);
    const PetscReal gamma = gas.GetSpecificHeatRatio();

    const PetscReal radicand = (temperature1 / temperature2 * TemperatureFactor(mach1) - 1.0) * 2.0 / (gamma - 1.0);
    if (radicand < 0.0) {
        throw InvalidInputError("No real Mach number reaches a static temperature of " + std::to_string(temperature2) + " from " + std::to_string(temperature1) + " at Mach " +
                                std::to_string(mach1));
    }
    return PetscSqrtReal(radicand);
}

PetscReal gasdyn::isentropic::IsentropicFlow::PressureFromMachRatio(PetscReal mach1, PetscReal mach2, PetscReal pressure1, PetscReal ds) const {
    CheckMach("Mach number 1", mach1);
    CheckMach("Mach number 2", mach2);
    CheckPositive("Pressure 1", pressure1);
    CheckFinite("Entropy produced", ds);
    const PetscReal gamma = gas.GetSpecificHeatRatio();
    return pressure1 * PetscPowReal(TemperatureFactor(mach1) / TemperatureFactor(mach2), gamma / (gamma - 1.0)) * PetscExpReal(-ds / gas.GetGasConstant());
}

PetscReal gasdyn::isentropic::IsentropicFlow::TemperatureFromMachRatio(PetscReal mach1, PetscReal mach2, PetscReal temperature1) const {
    CheckMach("Mach number 1", mach1);
    CheckMach("Mach number 2", mach2);
    CheckPositive("Temperature 1", temperature1);
    return temperature1 * TemperatureFactor(mach1) / TemperatureFactor(mach2);
}

PetscReal gasdyn::isentropic::IsentropicFlow::EntropyProduced(PetscReal stagnationPressure1, PetscReal stagnationPressure2) const {
    CheckPositive("Stagnation pressure 1", stagnationPressure1);
    CheckPositive("Stagnation pressure 2", stagnationPressure2);
    return -gas.GetGasConstant() * PetscLogReal(stagnationPressure2 / stagnationPressure1);
}

PetscReal gasdyn::isentropic::IsentropicFlow::ChokedMassFlux(PetscReal stagnationPressure, PetscReal stagnationTemperature) const {
    CheckPositive("Stagnation pressure", stagnationPressure);
    CheckPositive("Stagnation temperature", stagnationTemperature);
    const PetscReal gamma = gas.GetSpecificHeatRatio();

    PetscReal coefficient = gamma / gas.GetGasConstant();
    if (!gas.IsMetric()) {
        coefficient *= utilities::Constants::gc;
    }
    return PetscSqrtReal(coefficient * PetscPowReal(2.0 / (gamma + 1.0), (gamma + 1.0) / (gamma - 1.0))) * stagnationPressure / PetscSqrtReal(stagnationTemperature);
}

gasdyn::isentropic::MachSolutions gasdyn::isentropic::IsentropicFlow::MachFromAreaRatio(PetscReal areaRatio) const {
    CheckFinite("Area ratio", areaRatio);
    if (areaRatio < 1.0 - utilities::Constants::areaRatioTolerance) {
        throw InvalidInputError("The area ratio A/A* must be at least 1, " + std::to_string(areaRatio) + " given");
    }
    if (areaRatio <= 1.0 + utilities::Constants::areaRatioTolerance) {
        return MachSolutions{.subsonic = 1.0, .supersonic = 1.0};
    }

    return MachSolutions{.subsonic = SubsonicMachFromAreaRatio(areaRatio), .supersonic = SupersonicMachFromAreaRatio(areaRatio)};
}

PetscReal gasdyn::isentropic::IsentropicFlow::SubsonicMachFromAreaRatio(PetscReal areaRatio) const {
    auto function = [this, areaRatio](PetscReal mach) { return MachAreaRatioChoked(mach) - areaRatio; };
    auto derivative = [this](PetscReal mach) { return MachAreaRatioChoked(mach) * (mach * mach - 1.0) / (mach * TemperatureFactor(mach)); };
    const PetscReal gamma = gas.GetSpecificHeatRatio();

    // A/A* >= (2/(gamma+1))^((gamma+1)/(2(gamma-1))) / M, so the bound is at or below the subsonic root
    PetscReal lower = PetscPowReal(2.0 / (gamma + 1.0), 0.5 * (gamma + 1.0) / (gamma - 1.0)) / areaRatio;

    // the relative gap between the bound and the root is about (gamma+1)/4 M^2
    if (0.25 * (gamma + 1.0) * lower * lower <= PETSC_MACHINE_EPSILON) {
        return lower;
    }
    while (function(lower) <= 0.0) {
        lower *= 0.5;
    }

    return utilities::MathUtilities::FindBracketedRoot(function, derivative, lower, 1.0, 1.0 / areaRatio);
}

PetscReal gasdyn::isentropic::IsentropicFlow::SupersonicMachFromAreaRatio(PetscReal areaRatio) const {
    auto function = [this, areaRatio](PetscReal mach) { return MachAreaRatioChoked(mach) - areaRatio; };
    auto derivative = [this](PetscReal mach) { return MachAreaRatioChoked(mach) * (mach * mach - 1.0) / (mach * TemperatureFactor(mach)); };
    const PetscReal gamma = gas.GetSpecificHeatRatio();

    // A/A* >= ((gamma-1)/(gamma+1))^((gamma+1)/(2(gamma-1))) M^(2/(gamma-1)); evaluated in log space so large area ratios do not overflow
    const PetscReal logCoefficient = 0.5 * (gamma + 1.0) / (gamma - 1.0) * PetscLogReal((gamma - 1.0) / (gamma + 1.0));
    PetscReal upper = PetscMax(2.0, PetscExpReal(0.5 * (gamma - 1.0) * (PetscLogReal(areaRatio) - logCoefficient)));
    while (function(upper) <= 0.0) {
        upper *= 2.0;
    }

    return utilities::MathUtilities::FindBracketedRoot(function, derivative, 1.0, upper, 0.5 * (1.0 + upper));
}

std::vector<gasdyn::isentropic::StagnationRatioRow> gasdyn::isentropic::IsentropicFlow::StagnationRatios(const MachRange& range) const {
    std::vector<StagnationRatioRow> rows;
    rows.reserve(range.Size());
    for (const auto mach : range) {
        rows.push_back(StagnationRatioRow{.mach = mach,
                                          .pressureRatio = StagnationPressureRatio(mach),
                                          .temperatureRatio = StagnationTemperatureRatio(mach),
                                          .areaRatio = MachAreaRatioChoked(mach),
                                          .densityRatio = StagnationDensityRatio(mach)});
    }
    return rows;
}
