#include "mapParameters.hpp"
#include <utility>

gasdyn::parameters::MapParameters::MapParameters(std::map<std::string, std::string> values) : values(std::move(values)) {}

gasdyn::parameters::MapParameters::MapParameters(std::initializer_list<Parameter> list) {
    for (const auto& pair : list) {
        values[pair.key] = pair.value;
    }
}

std::optional<std::string> gasdyn::parameters::MapParameters::GetString(std::string paramName) const {
    auto value = values.find(paramName);
    if (value != values.end()) {
        return value->second;
    } else {
        return {};
    }
}

std::unordered_set<std::string> gasdyn::parameters::MapParameters::GetKeys() const {
    std::unordered_set<std::string> keys;
    for (const auto& [key, value] : values) {
        keys.insert(key);
    }
    return keys;
}

std::shared_ptr<gasdyn::parameters::MapParameters> gasdyn::parameters::MapParameters::Create(std::initializer_list<Parameter> values) {
    return std::make_shared<gasdyn::parameters::MapParameters>(values);
}

std::shared_ptr<gasdyn::parameters::MapParameters> gasdyn::parameters::MapParameters::Create(const std::map<std::string, std::string>& values) {
    return std::make_shared<gasdyn::parameters::MapParameters>(values);
}
