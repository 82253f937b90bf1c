#ifndef GASDYNLIBRARY_CONSTANTS_HPP
#define GASDYNLIBRARY_CONSTANTS_HPP

#include <petscsystypes.h>

namespace gasdyn::utilities {
class Constants {
   public:
    //! Gravitational conversion constant (lbm ft / (lbf s^2)) for US customary units
    constexpr inline static PetscReal gc = 32.174;

    //! Tolerance used when comparing area ratios against the choked value of one
    constexpr inline static PetscReal areaRatioTolerance = 1e-12;
};
}  // namespace gasdyn::utilities

#endif  // GASDYNLIBRARY_CONSTANTS_HPP
