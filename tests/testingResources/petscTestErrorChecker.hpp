#ifndef GASDYNLIBRARY_PETSCTESTERRORCHECKER_HPP
#define GASDYNLIBRARY_PETSCTESTERRORCHECKER_HPP

#include <petscsys.h>
#include <iostream>

namespace testingResources {

/**
 * Error checker used inside test fixtures, reports the petsc message and exits
 */
class PetscTestErrorChecker {
    friend void operator>>(PetscErrorCode ierr, const PetscTestErrorChecker&) {
        if (ierr != 0) {
            const char* text;
            char* specific;

            PetscErrorMessage(ierr, &text, &specific);
            std::cerr << text << std::endl << specific << std::endl;
            exit(ierr);
        }
    }
};

}  // namespace testingResources
#endif  // GASDYNLIBRARY_PETSCTESTERRORCHECKER_HPP
