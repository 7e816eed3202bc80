#pragma once

#include <source_location>

namespace mc
{
/// Type alias for std::source_location
/// Captured by the assertion macros so failures report file, line, column and function
using source_location = std::source_location;
} // namespace mc
