#ifndef GASDYNLIBRARY_BUILDER_HPP
#define GASDYNLIBRARY_BUILDER_HPP

#include <petsc.h>
#include <ostream>
#include <string>
#include <vector>
#include "monitors/logs/log.hpp"
#include "parameters/parameters.hpp"

namespace gasdyn {
class Builder {
   public:
    /**
     * A named result, scalar relations produce a single value
     */
    struct Result {
        std::string name;
        std::vector<PetscReal> values;
    };

    /**
     * Build the gas and evaluate the relation named by the "relation" parameter
     * @param parameters
     * @return the results in output order
     */
    static std::vector<Result> Evaluate(const parameters::Parameters& parameters);

    /**
     * default run method, evaluates the relation and prints each result to the log
     * @param parameters
     * @param log
     */
    static void Run(const parameters::Parameters& parameters, monitors::logs::Log& log);

    /**
     * print the version information for the gasdyn library
     * @param stream
     */
    static void PrintVersion(std::ostream& stream);

    /**
     * print the version and gas table as yaml
     * @param stream
     */
    static void PrintInfo(std::ostream& stream);

    /**
     * print the available relations and their arguments
     * @param stream
     */
    static void PrintHelp(std::ostream& stream);

    Builder() = delete;
};
}  // namespace gasdyn

#endif  // GASDYNLIBRARY_BUILDER_HPP
