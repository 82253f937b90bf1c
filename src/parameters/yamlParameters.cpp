#include "yamlParameters.hpp"
#include <utility>

gasdyn::parameters::YamlParameters::YamlParameters(YAML::Node yamlConfigurationIn, std::string nodePathIn)
    : yamlConfiguration(std::move(yamlConfigurationIn)), nodePath(std::move(nodePathIn)) {
    if (!yamlConfiguration.IsMap()) {
        throw std::invalid_argument("The yaml node " + nodePath + " must be a map of parameters");
    }
}

gasdyn::parameters::YamlParameters::YamlParameters(const YAML::Node& yamlConfiguration) : YamlParameters(yamlConfiguration, "root") {}

std::shared_ptr<gasdyn::parameters::YamlParameters> gasdyn::parameters::YamlParameters::FromFile(const std::filesystem::path& filePath) {
    if (!std::filesystem::exists(filePath)) {
        throw std::invalid_argument("unable to locate input file: " + filePath.string());
    }
    return std::shared_ptr<YamlParameters>(new YamlParameters(YAML::LoadFile(filePath.string()), filePath.string()));
}

std::shared_ptr<gasdyn::parameters::YamlParameters> gasdyn::parameters::YamlParameters::FromString(const std::string& yaml) {
    return std::shared_ptr<YamlParameters>(new YamlParameters(YAML::Load(yaml), "root"));
}

std::optional<std::string> gasdyn::parameters::YamlParameters::GetString(std::string paramName) const {
    const auto parameter = yamlConfiguration[paramName];
    if (!parameter || parameter.IsNull()) {
        return {};
    }

    if (parameter.IsScalar()) {
        return parameter.Scalar();
    }

    if (parameter.IsSequence()) {
        std::string joined;
        for (const auto& item : parameter) {
            if (!item.IsScalar()) {
                throw std::invalid_argument("The parameter " + nodePath + "/" + paramName + " must be a sequence of scalars");
            }
            if (!joined.empty()) {
                joined += " ";
            }
            joined += item.Scalar();
        }
        return joined;
    }

    throw std::invalid_argument("The parameter " + nodePath + "/" + paramName + " must be a scalar or a sequence of scalars");
}

std::unordered_set<std::string> gasdyn::parameters::YamlParameters::GetKeys() const {
    std::unordered_set<std::string> keys;
    for (const auto& pair : yamlConfiguration) {
        keys.insert(pair.first.as<std::string>());
    }
    return keys;
}
