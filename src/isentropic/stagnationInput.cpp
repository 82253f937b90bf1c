#include "stagnationInput.hpp"
#include "inputErrors.hpp"

gasdyn::isentropic::StagnationQuantity gasdyn::isentropic::StagnationInput::Missing() const {
    const int supplied = (int)stagnation.has_value() + (int)local.has_value() + (int)mach.has_value();
    if (supplied == 3) {
        throw AmbiguousInputError("Exactly two of the stagnation value, static value, and Mach number may be specified, all three were given");
    }
    if (supplied < 2) {
        throw InsufficientInputError("Exactly two of the stagnation value, static value, and Mach number must be specified, " + std::to_string(supplied) + " given");
    }

    if (!stagnation) {
        return StagnationQuantity::Stagnation;
    }
    if (!local) {
        return StagnationQuantity::Static;
    }
    return StagnationQuantity::Mach;
}

std::string_view gasdyn::isentropic::to_string(const StagnationQuantity& quantity) {
    switch (quantity) {
        case StagnationQuantity::Stagnation:
            return "stagnation";
        case StagnationQuantity::Static:
            return "static";
        case StagnationQuantity::Mach:
            return "mach";
    }
    return "";
}
