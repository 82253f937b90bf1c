#ifndef GASDYNLIBRARY_MAPPARAMETERS_HPP
#define GASDYNLIBRARY_MAPPARAMETERS_HPP

#include <initializer_list>
#include <map>
#include <memory>
#include <sstream>
#include <string_view>
#include "parameters.hpp"

namespace gasdyn::parameters {
class MapParameters : public Parameters {
   protected:
    std::map<std::string, std::string> values;

   public:
    /**
     * Helper class to simplify MapParameters initializer_list
     */
    struct Parameter {
        template <typename T>
        Parameter(std::string_view key, T value) : key{key} {
            std::stringstream ss;
            ss.precision(17);
            ss << value;
            this->value = ss.str();
        }

        std::string key;
        std::string value;
    };

    /**
     * Takes a list of parameters
     */
    MapParameters(std::initializer_list<Parameter>);

    /*
     * Take a map directly
     */
    explicit MapParameters(std::map<std::string, std::string> values = {});

    [[nodiscard]] std::optional<std::string> GetString(std::string paramName) const override;

    [[nodiscard]] std::unordered_set<std::string> GetKeys() const override;

    /**
     * Insert or replace a value
     * @tparam T
     * @param key
     * @param value
     */
    template <class T>
    void Insert(const std::string& key, T value) {
        std::stringstream ss;
        ss.precision(17);
        ss << value;
        values[key] = ss.str();
    }

    /**
     * static helper function to create a new MapParameters shared pointer from a list of parameters
     * gasdyn::parameters::MapParameters::Create({{"gas", "argon"}, {"metric", false}, {"M", 2.5}});
     * @return
     */
    static std::shared_ptr<MapParameters> Create(std::initializer_list<Parameter>);

    /**
     * static helper function to create a new MapParameters shared pointer from a map of <string, string>
     * @return
     */
    static std::shared_ptr<MapParameters> Create(const std::map<std::string, std::string>& values);
};
}  // namespace gasdyn::parameters

#endif  // GASDYNLIBRARY_MAPPARAMETERS_HPP
