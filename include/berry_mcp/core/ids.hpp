#pragma once

#include <cstddef>
#include <exception>
#include <string>

namespace berry_mcp {

// Random lowercase hex string of `length` characters (SSE event ids,
// elicitation prompt ids). Not for security purposes.
std::string RandomHex(std::size_t length);

// Demangled dynamic type name of an exception ("std::runtime_error").
std::string ExceptionTypeName(const std::exception& e);

} // namespace berry_mcp
