#ifndef GASDYNLIBRARY_INPUTERRORS_HPP
#define GASDYNLIBRARY_INPUTERRORS_HPP
#include <stdexcept>
#include <string>

namespace gasdyn {

/**
 * A physically invalid argument, such as a negative absolute temperature or a Mach number below zero
 */
struct InvalidInputError : public std::invalid_argument {
    explicit InvalidInputError(const std::string& message) : std::invalid_argument(message) {}
};

/**
 * More defining arguments were supplied than the relation can accept, so the quantity to solve for is ambiguous
 */
struct AmbiguousInputError : public std::invalid_argument {
    explicit AmbiguousInputError(const std::string& message) : std::invalid_argument(message) {}
};

/**
 * Fewer defining arguments were supplied than the relation requires
 */
struct InsufficientInputError : public std::invalid_argument {
    explicit InsufficientInputError(const std::string& message) : std::invalid_argument(message) {}
};

}  // namespace gasdyn
#endif  // GASDYNLIBRARY_INPUTERRORS_HPP
