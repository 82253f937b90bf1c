#include "streamLog.hpp"
#include <cstdarg>
#include <cstdio>

gasdyn::monitors::logs::StreamLog::StreamLog(std::ostream& stream) : stream(stream) {}

void gasdyn::monitors::logs::StreamLog::Initialize(MPI_Comm comm) { Log::Initialize(comm); }

void gasdyn::monitors::logs::StreamLog::Print(const char* value) { stream << value; }

void gasdyn::monitors::logs::StreamLog::Printf(const char* format, ...) {
    va_list args;
    va_start(args, format);
    va_list argsCopy;
    va_copy(argsCopy, args);

    // try to print to the buffer
    auto reqSize = vsnprintf(buffer.data(), buffer.size(), format, args);

    if (reqSize >= (int)buffer.size()) {
        buffer.resize(reqSize + 1);
        vsnprintf(buffer.data(), buffer.size(), format, argsCopy);
    }

    stream << buffer.data();

    va_end(args);
    va_end(argsCopy);
}
