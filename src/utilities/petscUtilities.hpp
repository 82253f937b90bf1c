#ifndef GASDYNLIBRARY_PETSCUTILITIES_HPP
#define GASDYNLIBRARY_PETSCUTILITIES_HPP
#include <petsc.h>
#include <map>
#include <stdexcept>
#include <string>
namespace gasdyn::utilities {

class PetscUtilities {
   public:
    /**
     * helper class to check petsc errors
     */
    class ErrorChecker {
       public:
        struct PetscError : public std::runtime_error {
           private:
            static std::string GetMessage(PetscErrorCode ierr) {
                const char* text;
                char* specific;

                PetscErrorMessage(ierr, &text, &specific);

                return std::string(text) + ": " + std::string(specific);
            }

           public:
            explicit PetscError(PetscErrorCode ierr) : std::runtime_error(GetMessage(ierr)) {}
        };

        inline friend void operator>>(PetscErrorCode ierr, const ErrorChecker&) {
            if (ierr != 0) {
                throw PetscError(ierr);
            }
        }
    };

   public:
    /**
     * static call to setup petsc and register the finalize call with the run environment
     */
    static void Initialize(const char help[] = nullptr);

    /**
     * static inline error checker for petsc based errors
     */
    static inline utilities::PetscUtilities::ErrorChecker checkError;

    /**
     * Set each option in the map on the petsc options object (nullptr for the global database).  Names are prefixed with a dash.
     * @param petscOptions
     * @param options
     */
    static void Set(PetscOptions petscOptions, const std::map<std::string, std::string>& options);

    // keep this class static
    PetscUtilities() = delete;
};

}  // namespace gasdyn::utilities
#endif  // GASDYNLIBRARY_PETSCUTILITIES_HPP
