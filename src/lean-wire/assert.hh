#pragma once

// Lean header with minimal dependencies - easy to include everywhere and low cost.
#include <lean-wire/macros.hh>
#include <lean-wire/source_location.hh>

// =========================================================================================================
// LW_ASSERT - Runtime assertion with string literal message
//
// Validates a condition at runtime, reports the failure and aborts.
//
// When assertions are active:
//   Assertions are enabled in LW_DEBUG and LW_RELWITHDEBINFO builds.
//   In LW_RELEASE builds, assertions are disabled unless LW_ENABLE_ASSERT_IN_RELEASE is defined.
//
// What assertions are for:
//   Assertions protect INVARIANTS, PRECONDITIONS, and POSTCONDITIONS.
//   They catch PROGRAMMER ERRORS early during development.
//
// What assertions are NOT for:
//   - NOT for validating bytes that came off the wire
//   - NOT for allocation failure
//   - NOT for common/expected error conditions
//
// Error handling strategy:
//   - Assertions      -> programmer errors, violated invariants/preconditions/postconditions
//   - result<T, E>    -> malformed input, exhausted budget, allocation failure
//   - Exceptions      -> only ever thrown by user types, passed through unchanged
//
// Important:
//   NEVER trigger assertions based on decoded input!
//   A forged length prefix or an invalid tag byte must surface as a decode_error.
//
// Usage:
//   LW_ASSERT(count >= 0, "count must be non-negative");
//   LW_ASSERT(_claimed >= amount, "released more budget than was claimed");
//
#define LW_ASSERT(cond, msg) LW_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// LW_ASSERT_ALWAYS - Always-active assertion
//
// Like LW_ASSERT but remains active in all build configurations, including release builds.
//
#define LW_ASSERT_ALWAYS(cond, msg) LW_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// Assertion handlers and context
//
// A failed assertion is reported to the innermost scoped_assertion_handler of the current thread,
// or printed to stderr if there is none, and then the process aborts.
// Handlers may throw to unwind to a recovery point instead (tests do this).
//
// scoped_assertion_context names what the thread is doing ("decode_from_slice", ...).
// The innermost name is passed along with every failure.
//
// Usage:
//   auto handler = lw::impl::scoped_assertion_handler([&](lw::impl::assertion_info const& info) {
//       throw my_assertion_failure{info.message};
//   });
//

namespace lw::impl
{
/// Everything the failed assertion knows about itself.
/// The strings are only valid during the handler call.
struct assertion_info
{
    char const* expression;
    char const* message;
    lw::source_location location;
    char const* context; // innermost scoped_assertion_context, nullptr if none
};

struct assertion_handler_node
{
    void (*handle)(assertion_info const& info, assertion_handler_node* self) = nullptr;
    assertion_handler_node* outer = nullptr;
};

struct assertion_context_node
{
    char const* what = nullptr;
    assertion_context_node* outer = nullptr;
};

void push_assertion_handler(assertion_handler_node* node);
void pop_assertion_handler(assertion_handler_node* node);
void push_assertion_context(assertion_context_node* node);
void pop_assertion_context(assertion_context_node* node);

/// Installs `fn` as the innermost handler of this thread for the lifetime of this object.
template <class F>
struct scoped_assertion_handler : private assertion_handler_node
{
    explicit scoped_assertion_handler(F fn) : _fn(static_cast<F&&>(fn))
    {
        handle = [](assertion_info const& info, assertion_handler_node* self)
        { static_cast<scoped_assertion_handler*>(self)->_fn(info); };
        push_assertion_handler(this);
    }
    ~scoped_assertion_handler() { pop_assertion_handler(this); }

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;

private:
    F _fn;
};

struct scoped_assertion_context : private assertion_context_node
{
    explicit scoped_assertion_context(char const* name)
    {
        what = name;
        push_assertion_context(this);
    }
    ~scoped_assertion_context() { pop_assertion_context(this); }

    scoped_assertion_context(scoped_assertion_context const&) = delete;
    scoped_assertion_context& operator=(scoped_assertion_context const&) = delete;
};

// Reports the failure to the innermost handler, or to stderr
// Note: does not abort, caller must follow with perform_abort()
LW_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, lw::source_location location);

[[noreturn]] void perform_abort() noexcept;
} // namespace lw::impl


// =========================================================================================================
// Implementation details
// =========================================================================================================

#define LW_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::lw::impl::handle_assert_failure(#cond, msg, ::lw::source_location::current()); \
            ::lw::impl::perform_abort();                                                     \
        }                                                                                    \
    } while (false)

#if LW_ASSERT_ENABLED

#define LW_IMPL_ASSERT(cond, msg) LW_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but the message still has to compile
#define LW_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        LW_UNUSED(cond);          \
        LW_UNUSED(msg);           \
    } while (false)

#endif
