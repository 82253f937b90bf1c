#include "log.hpp"

gasdyn::monitors::logs::Log::~Log() {
    if (ostream) {
        ostream->flush();
    }
}

void gasdyn::monitors::logs::Log::Print(const char* name, std::size_t num, const double* values, const char* formatIn) {
    Printf("%s: ", name);

    // set a default format if not specified
    const char* format = formatIn ? formatIn : "%g";

    Print("[");
    if (num > 0) {
        Printf(format, values[0]);
    }
    for (std::size_t c = 1; c < num; c++) {
        Print(", ");
        Printf(format, values[c]);
    }
    Print("]");
}

void gasdyn::monitors::logs::Log::Print(const char* name, const std::vector<double>& values, const char* format) { Print(name, values.size(), values.data(), format); }

std::ostream& gasdyn::monitors::logs::Log::GetStream() {
    if (!ostream) {
        ostreambuf = std::make_unique<DefaultOutBuffer>(*this);
        ostream = std::make_unique<std::ostream>(ostreambuf.get());
    }
    return *ostream;
}
