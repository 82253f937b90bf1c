#ifndef GASDYNLIBRARY_PARAMETEREXCEPTION_HPP
#define GASDYNLIBRARY_PARAMETEREXCEPTION_HPP
#include <exception>
#include <string>

namespace gasdyn::parameters {

struct ParameterException : public std::exception {
   private:
    std::string message;

   public:
    explicit ParameterException(const std::string& variableName) { message = "The variable " + variableName + " cannot be found in the parameters."; }

    const char* what() const noexcept override { return message.c_str(); }
};

}  // namespace gasdyn::parameters
#endif  // GASDYNLIBRARY_PARAMETEREXCEPTION_HPP
