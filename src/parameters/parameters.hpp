#ifndef GASDYNLIBRARY_PARAMETERS_HPP
#define GASDYNLIBRARY_PARAMETERS_HPP
#include <algorithm>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>
#include "parameterException.hpp"

namespace gasdyn::parameters {

/**
 * String keyed source of configuration values.  Values are stored as strings and converted on access with the type's operator>>, so any enum with a stream operator (eos::Gas,
 * isentropic::Relation) can be read directly.
 */
class Parameters {
   private:
    template <typename T>
    static void toValue(const std::string& inputString, T& outputValue) {
        std::istringstream ss(inputString);
        ss >> outputValue;
        // the whole string must be consumed
        if (ss.fail() || !(ss >> std::ws).eof()) {
            throw std::invalid_argument("Unable to convert parameter value '" + inputString + "'");
        }
    }

    /**
     * lists may be separated by whitespace or by commas (the petsc array style, -M 0.5,1,2)
     */
    template <typename T>
    static void toValue(const std::string& inputString, std::vector<T>& outputValue) {
        std::string list = inputString;
        std::replace(list.begin(), list.end(), ',', ' ');

        std::istringstream ss(list);
        std::string token;
        while (ss >> token) {
            T tempValue;
            toValue(token, tempValue);
            outputValue.push_back(tempValue);
        }
    }

    // value specific cases
    static void toValue(const std::string& inputString, bool& outputValue);
    static void toValue(const std::string& inputString, std::string& outputValue) { outputValue = inputString; }

   public:
    virtual ~Parameters() = default;

    virtual std::optional<std::string> GetString(std::string paramName) const = 0;
    virtual std::unordered_set<std::string> GetKeys() const = 0;

    /**
     * check if the key is present without converting it
     * @param paramName
     * @return
     */
    bool Contains(const std::string& paramName) const { return GetString(paramName).has_value(); }

    template <typename T>
    std::optional<T> Get(std::string paramName) const {
        auto value = GetString(paramName);
        if (value.has_value()) {
            T num;
            toValue(value.value(), num);
            return num;
        } else {
            return {};
        }
    }

    template <typename T>
    T Get(std::string paramName, T defaultValue) const {
        auto value = GetString(paramName);
        if (value.has_value()) {
            T num;
            toValue(value.value(), num);
            return num;
        } else {
            return defaultValue;
        }
    }

    template <typename T>
    T GetExpect(std::string paramName) const {
        auto value = GetString(paramName);
        if (value.has_value()) {
            T num;
            toValue(value.value(), num);
            return num;
        } else {
            throw ParameterException(paramName);
        }
    }
};
}  // namespace gasdyn::parameters

#endif  // GASDYNLIBRARY_PARAMETERS_HPP
