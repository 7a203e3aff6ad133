#pragma once

#include <source_location>

namespace lw
{
/// Type alias for std::source_location
/// Used by assertions and by decode/encode errors to record where they were raised
/// Usage:
///   void fail(lw::source_location site = lw::source_location::current());
using source_location = std::source_location;
} // namespace lw
