#ifndef GASDYNLIBRARY_STAGNATIONINPUT_HPP
#define GASDYNLIBRARY_STAGNATIONINPUT_HPP
#include <petsc.h>
#include <optional>
#include <ostream>
#include <string_view>

namespace gasdyn::isentropic {

/**
 * The three quantities related by a stagnation relation
 */
enum class StagnationQuantity { Stagnation, Static, Mach };

/**
 * Builder for the two-of-three stagnation relations.  Exactly two of the stagnation value, static value, and Mach number must be set; the relation solves for the remaining one.  The same
 * builder serves the pressure relation (pt, p, M) and the temperature relation (Tt, T, M).
 *
 *  auto state = flow.StagnationPressure(StagnationInput().Static(10).Mach(1));
 */
class StagnationInput {
   private:
    std::optional<PetscReal> stagnation;
    std::optional<PetscReal> local;
    std::optional<PetscReal> mach;

   public:
    //! the stagnation (total) pressure or temperature
    inline StagnationInput& Stagnation(PetscReal value) {
        stagnation = value;
        return *this;
    }

    //! the static pressure or temperature
    inline StagnationInput& Static(PetscReal value) {
        local = value;
        return *this;
    }

    inline StagnationInput& Mach(PetscReal value) {
        mach = value;
        return *this;
    }

    [[nodiscard]] const std::optional<PetscReal>& GetStagnation() const { return stagnation; }
    [[nodiscard]] const std::optional<PetscReal>& GetStatic() const { return local; }
    [[nodiscard]] const std::optional<PetscReal>& GetMach() const { return mach; }

    /**
     * Determine the quantity to solve for
     * @throws AmbiguousInputError when all three are set
     * @throws InsufficientInputError when fewer than two are set
     * @return
     */
    [[nodiscard]] StagnationQuantity Missing() const;
};

/**
 * A completed stagnation relation
 */
struct StagnationState {
    PetscReal stagnation;
    PetscReal local;
    PetscReal mach;
    //! the quantity that was computed
    StagnationQuantity solved;
};

std::string_view to_string(const StagnationQuantity& quantity);

inline std::ostream& operator<<(std::ostream& out, const StagnationQuantity& quantity) {
    out << to_string(quantity);
    return out;
}

}  // namespace gasdyn::isentropic
#endif  // GASDYNLIBRARY_STAGNATIONINPUT_HPP
