#include "parameters.hpp"
#include <set>
#include "utilities/stringUtilities.hpp"

static const std::set<std::string> knownTrueValues = {"true", "y", "yes", "on", "1"};
static const std::set<std::string> knownFalseValues = {"false", "n", "no", "off", "0"};

void gasdyn::parameters::Parameters::toValue(const std::string& inputString, bool& outputValue) {
    auto key = utilities::StringUtilities::ToLowerCopy(utilities::StringUtilities::TrimCopy(inputString));
    // a bare flag (-metric) has an empty value
    if (key.empty() || knownTrueValues.count(key)) {
        outputValue = true;
    } else if (knownFalseValues.count(key)) {
        outputValue = false;
    } else {
        throw std::invalid_argument("Unable to convert parameter value '" + inputString + "' to a bool");
    }
}
