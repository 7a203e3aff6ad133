#include "assert.hh"

#include <cstdlib>
#include <iostream>

namespace
{
// both stacks are per thread and linked through the scoped objects that live on that thread's stack
thread_local lw::impl::assertion_handler_node* t_handler_top = nullptr;
thread_local lw::impl::assertion_context_node* t_context_top = nullptr;

void print_assertion(lw::impl::assertion_info const& info)
{
    std::cerr << "lean-wire: assertion `" << info.expression << "` failed: " << info.message << '\n';
    std::cerr << "  at " << info.location.file_name() << ':' << info.location.line() << " - "
              << info.location.function_name() << '\n';
    for (auto ctx = t_context_top; ctx != nullptr; ctx = ctx->outer)
        std::cerr << "  in " << ctx->what << '\n';
}
} // namespace

void lw::impl::push_assertion_handler(assertion_handler_node* node)
{
    node->outer = t_handler_top;
    t_handler_top = node;
}

void lw::impl::pop_assertion_handler(assertion_handler_node* node)
{
    LW_ASSERT(t_handler_top == node, "assertion handlers must be removed in reverse order");
    t_handler_top = node->outer;
}

void lw::impl::push_assertion_context(assertion_context_node* node)
{
    node->outer = t_context_top;
    t_context_top = node;
}

void lw::impl::pop_assertion_context(assertion_context_node* node)
{
    LW_ASSERT(t_context_top == node, "assertion contexts must be removed in reverse order");
    t_context_top = node->outer;
}

LW_COLD_FUNC void lw::impl::handle_assert_failure(char const* expression, char const* message, lw::source_location location)
{
    assertion_info const info{
        .expression = expression,
        .message = message,
        .location = location,
        .context = t_context_top != nullptr ? t_context_top->what : nullptr,
    };

    // a throwing handler unwinds through its own scope, which pops it
    if (t_handler_top != nullptr)
        t_handler_top->handle(info, t_handler_top);
    else
        print_assertion(info);
}

[[noreturn]] void lw::impl::perform_abort() noexcept
{
    std::abort();
}
