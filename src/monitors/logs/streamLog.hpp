#ifndef GASDYNLIBRARY_STREAMLOG_HPP
#define GASDYNLIBRARY_STREAMLOG_HPP

#include <iostream>
#include <vector>
#include "log.hpp"

namespace gasdyn::monitors::logs {
class StreamLog : public Log {
   private:
    std::ostream& stream;
    std::vector<char> buffer = std::vector<char>(256);

   public:
    explicit StreamLog(std::ostream& stream = std::cout);

    using Log::Print;
    void Print(const char*) override;
    void Printf(const char*, ...) override;

    void Initialize(MPI_Comm comm) override;

    std::ostream& GetStream() override { return stream; }
};
}  // namespace gasdyn::monitors::logs

#endif  // GASDYNLIBRARY_STREAMLOG_HPP
