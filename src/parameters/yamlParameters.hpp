#ifndef GASDYNLIBRARY_YAMLPARAMETERS_HPP
#define GASDYNLIBRARY_YAMLPARAMETERS_HPP

#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <memory>
#include "parameters.hpp"

namespace gasdyn::parameters {

/**
 * Parameters backed by a flat yaml mapping.  Scalars are returned as is and sequences of scalars are joined with spaces so they can be read as std::vector<T>.
 */
class YamlParameters : public Parameters {
   private:
    const YAML::Node yamlConfiguration;

    //! the path of this node used for error messages
    const std::string nodePath;

    YamlParameters(YAML::Node yamlConfiguration, std::string nodePath);

   public:
    /**
     * Wrap an existing yaml node, the node must be a map
     * @param yamlConfiguration
     */
    explicit YamlParameters(const YAML::Node& yamlConfiguration);

    /**
     * Load parameters from a yaml file
     * @param filePath
     * @return
     */
    static std::shared_ptr<YamlParameters> FromFile(const std::filesystem::path& filePath);

    /**
     * Load parameters from a yaml string
     * @param yaml
     * @return
     */
    static std::shared_ptr<YamlParameters> FromString(const std::string& yaml);

    [[nodiscard]] std::optional<std::string> GetString(std::string paramName) const override;

    [[nodiscard]] std::unordered_set<std::string> GetKeys() const override;
};

}  // namespace gasdyn::parameters
#endif  // GASDYNLIBRARY_YAMLPARAMETERS_HPP
