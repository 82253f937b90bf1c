#ifndef GASDYNLIBRARY_UNKNOWNGASERROR_HPP
#define GASDYNLIBRARY_UNKNOWNGASERROR_HPP
#include <stdexcept>
#include <string>

namespace gasdyn::eos {

/**
 * Thrown when a gas name does not match any gas in the registry
 */
struct UnknownGasError : public std::invalid_argument {
   private:
    const std::string gasName;

   public:
    explicit UnknownGasError(const std::string& gasName) : std::invalid_argument("Unknown gas '" + gasName + "'"), gasName(gasName) {}

    //! the name that could not be matched
    [[nodiscard]] const std::string& GetGasName() const { return gasName; }
};

}  // namespace gasdyn::eos
#endif  // GASDYNLIBRARY_UNKNOWNGASERROR_HPP
