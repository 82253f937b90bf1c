#ifndef GASDYNLIBRARY_STDOUT_HPP
#define GASDYNLIBRARY_STDOUT_HPP
#include <iostream>
#include "log.hpp"

namespace gasdyn::monitors::logs {
/**
 * Writes to the standard out from the root rank only
 */
class StdOut : public Log {
   private:
    bool output = true;

    /**
     * Discards everything written to it; handed out on the non-root ranks
     */
    class NullBuffer : public std::streambuf {
       protected:
        int_type overflow(int_type c) override { return c; }
    };

    inline static NullBuffer nullBuffer;
    inline static std::ostream nullStream = std::ostream(&nullBuffer);

   public:
    // allow access to all print from base
    using Log::Print;
    void Printf(const char*, ...) final;

    void Initialize(MPI_Comm comm) final;

    std::ostream& GetStream() override;
};
}  // namespace gasdyn::monitors::logs

#endif  // GASDYNLIBRARY_STDOUT_HPP
