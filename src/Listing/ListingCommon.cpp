#include "ListingCommon.hpp"

namespace speccy {

std::optional<Plus3DosHeader> readPlus3DosHeader(const std::vector<uint8_t>& input) {
    if (input.size() < Plus3DosHeader::HEADER_LENGTH) {
        return std::nullopt;
    }

    std::vector<uint8_t> bytes(input.begin(), input.begin() + Plus3DosHeader::HEADER_LENGTH);
    Plus3DosHeader header;
    if (!header.decode(bytes)) {
        return std::nullopt;
    }
    return header;
}

void traceMessage(const TraceCallback& trace, const std::string& component, const std::string& message) {
    if (trace) {
        trace("[" + component + "] " + message);
    }
}

} // namespace speccy
