#ifndef GASDYNLIBRARY_MPIUTILITIES_HPP
#define GASDYNLIBRARY_MPIUTILITIES_HPP
#include <petsc.h>
#include <stdexcept>
#include <string>

namespace gasdyn::utilities {

class MpiUtilities {
   public:
    /**
     * helper class to check mpi errors
     */
    class ErrorChecker {
       public:
        struct MpiError : public std::runtime_error {
           private:
            static std::string GetMessage(int ierr) {
                char estring[MPI_MAX_ERROR_STRING];
                int len;
                MPI_Error_string(ierr, estring, &len);
                return "MPI Error: " + std::string(estring);
            }

           public:
            explicit MpiError(int ierr) : std::runtime_error(GetMessage(ierr)) {}
        };

        inline friend void operator>>(int ierr, const ErrorChecker&) {
            if (MPI_SUCCESS != ierr) {
                throw MpiError(ierr);
            }
        }
    };

    /**
     * static inline error checker for mpi based errors
     */
    static inline utilities::MpiUtilities::ErrorChecker checkError;

    MpiUtilities() = delete;
};

}  // namespace gasdyn::utilities
#endif  // GASDYNLIBRARY_MPIUTILITIES_HPP
