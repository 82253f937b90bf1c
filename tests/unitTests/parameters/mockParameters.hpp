#ifndef GASDYNLIBRARY_MOCKPARAMETERS_HPP
#define GASDYNLIBRARY_MOCKPARAMETERS_HPP
#include "gmock/gmock.h"
#include "parameters/parameters.hpp"

namespace gasdynTesting::parameters {

class MockParameters : public gasdyn::parameters::Parameters {
   public:
    MOCK_METHOD(std::optional<std::string>, GetString, (std::string paramName), (const, override));
    MOCK_METHOD(std::unordered_set<std::string>, GetKeys, (), (const, override));
};

}  // namespace gasdynTesting::parameters
#endif  // GASDYNLIBRARY_MOCKPARAMETERS_HPP
