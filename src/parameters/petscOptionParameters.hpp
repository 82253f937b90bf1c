#ifndef GASDYNLIBRARY_PETSCOPTIONPARAMETERS_HPP
#define GASDYNLIBRARY_PETSCOPTIONPARAMETERS_HPP
#include <petsc.h>
#include "parameters.hpp"

namespace gasdyn::parameters {

/**
 * Reads parameters from a petsc options database.  The key "M" is looked up as the option "-M".
 */
class PetscOptionParameters : public Parameters {
   protected:
    PetscOptions petscOptions;

   public:
    /**
     * @param petscOptions the options database, nullptr for the global database
     */
    explicit PetscOptionParameters(PetscOptions petscOptions = nullptr);
    ~PetscOptionParameters() override = default;

    std::optional<std::string> GetString(std::string paramName) const override;
    std::unordered_set<std::string> GetKeys() const override;
};

}  // namespace gasdyn::parameters

#endif  // GASDYNLIBRARY_PETSCOPTIONPARAMETERS_HPP
