#ifndef GASDYNLIBRARY_RUNENVIRONMENT_HPP
#define GASDYNLIBRARY_RUNENVIRONMENT_HPP
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace gasdyn::environment {
/**
 * Holds the process wide state for the gasdyn executable: the main arguments and the ordered list of clean up calls
 */
class RunEnvironment {
   private:
    //! Store default arguments
    inline static int DefaultGlobalArgc = 0;

    //! Store default arguments
    inline static char** DefaultGlobalArgs = nullptr;

    //! Store the global main arg count
    inline static int* GlobalArgc = &DefaultGlobalArgc;

    //! Store the global main args
    inline static char*** GlobalArgs = &DefaultGlobalArgs;

    /**
     * Struct to hold the name and function to be called during finalize
     */
    struct FinalizeFunction {
        std::string name;
        std::function<void()> function;
    };

    /**
     * functions called in reverse registration order by Finalize
     */
    inline static std::vector<FinalizeFunction> finalizeFunctions;

   public:
    /**
     * store the main arguments for later petsc initialization
     */
    static void Initialize(int* argc, char*** args);

    /**
     * register a named clean up function.  Registering the same name twice replaces the earlier function.
     */
    static void RegisterCleanUpFunction(const std::string& name, std::function<void()>);

    /**
     * Last thing that any program should do is cleanup
     */
    static void Finalize();

    static inline int* GetArgCount() { return GlobalArgc; }

    static inline char*** GetArgs() { return GlobalArgs; }

    /**
     * Return the current version as a string_view to standardize access to the version
     */
    static std::string_view GetVersion();

    RunEnvironment() = delete;
};
}  // namespace gasdyn::environment

#endif  // GASDYNLIBRARY_RUNENVIRONMENT_HPP
