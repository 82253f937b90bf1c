#include "machRange.hpp"
#include <limits>
#include <string>
#include "inputErrors.hpp"

// relative slack used when deciding if max lands on a step
static constexpr PetscReal endPointTolerance = 1.0E-9;

static std::size_t CountSteps(PetscReal min, PetscReal max, PetscReal increment) {
    if (!(increment > 0.0)) {
        throw gasdyn::InvalidInputError("The Mach range increment must be greater than zero, " + std::to_string(increment) + " given");
    }
    if (min < 0.0) {
        throw gasdyn::InvalidInputError("The Mach range minimum must not be negative, " + std::to_string(min) + " given");
    }
    if (max < min) {
        throw gasdyn::InvalidInputError("The Mach range maximum (" + std::to_string(max) + ") must not be less than the minimum (" + std::to_string(min) + ")");
    }
    const PetscReal steps = PetscFloorReal((max - min) / increment + endPointTolerance);
    if (!(steps < static_cast<PetscReal>(std::numeric_limits<std::size_t>::max()))) {
        throw gasdyn::InvalidInputError("The Mach range from " + std::to_string(min) + " to " + std::to_string(max) + " has too many steps of " + std::to_string(increment));
    }
    return static_cast<std::size_t>(steps) + 1;
}

gasdyn::isentropic::MachRange::MachRange(PetscReal min, PetscReal max, PetscReal increment) : min(min), max(max), increment(increment), count(CountSteps(min, max, increment)) {}

std::vector<PetscReal> gasdyn::isentropic::MachRange::ToVector() const { return std::vector<PetscReal>(begin(), end()); }
