#pragma once

#include <lean-wire/assert.hh>

#include <format>

// =========================================================================================================
// LW_ASSERTF - Runtime assertion with formatted message
//
// The formatted version of LW_ASSERT, supporting std::format-style arguments.
// Same activation rules as LW_ASSERT: on in LW_DEBUG and LW_RELWITHDEBINFO,
// off in LW_RELEASE unless LW_ENABLE_ASSERT_IN_RELEASE is defined.
//
// Same rules about WHAT to assert apply:
//   Invariants, preconditions, postconditions only.
//   Never anything that depends on decoded bytes or on whether an allocation succeeded.
//
// Usage:
//   LW_ASSERTF(amount <= _claimed, "releasing {} bytes but only {} are claimed", amount, _claimed);
//   LW_ASSERTF(idx < size(), "index {} out of bounds (size: {})", idx, size());
//
// Note:
//   Requires <format>, so low-level headers use LW_ASSERT from <lean-wire/assert.hh> instead.
//
#define LW_ASSERTF(cond, msg, ...) LW_IMPL_ASSERTF(cond, msg, ##__VA_ARGS__)

// =========================================================================================================
// LW_ASSERTF_ALWAYS - Always-active assertion with formatted message
//
#define LW_ASSERTF_ALWAYS(cond, msg, ...) LW_IMPL_ASSERTF_ALWAYS(cond, msg, ##__VA_ARGS__)


// =========================================================================================================
// Implementation details
// =========================================================================================================

#define LW_IMPL_ASSERTF_ALWAYS(cond, msg, ...)                                                            \
    do                                                                                                    \
    {                                                                                                     \
        if (!(cond)) [[unlikely]]                                                                         \
        {                                                                                                 \
            ::lw::impl::handle_assert_failure(#cond, std::format(msg __VA_OPT__(, ) __VA_ARGS__).c_str(), \
                                              ::lw::source_location::current());                          \
            ::lw::impl::perform_abort();                                                                  \
        }                                                                                                 \
    } while (false)

#if LW_ASSERT_ENABLED

#define LW_IMPL_ASSERTF(cond, msg, ...) LW_IMPL_ASSERTF_ALWAYS(cond, msg, ##__VA_ARGS__)

#else

// stripped, but the format string still has to compile
#define LW_IMPL_ASSERTF(cond, msg, ...)                         \
    do                                                          \
    {                                                           \
        LW_UNUSED(cond);                                        \
        LW_UNUSED(std::format(msg __VA_OPT__(, ) __VA_ARGS__)); \
    } while (false)

#endif
