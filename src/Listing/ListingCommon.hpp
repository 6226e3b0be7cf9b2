#pragma once

#include "../FileHeader/Plus3DosHeader.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace speccy {

// Diagnostic callback: one message per event, already prefixed with the component
using TraceCallback = std::function<void(const std::string&)>;

/**
 * Look for a +3DOS header at the start of a file
 * @param input Whole file contents
 * @return The decoded header, or empty if the first 128 bytes are not a valid one
 */
std::optional<Plus3DosHeader> readPlus3DosHeader(const std::vector<uint8_t>& input);

/**
 * Emit a trace message if a callback is installed
 */
void traceMessage(const TraceCallback& trace, const std::string& component, const std::string& message);

} // namespace speccy
