#pragma once

#include <utility>

#include <boost/config.hpp>
#include <boost/preprocessor/cat.hpp>

namespace secfile::utils
{

template <typename Fn>
struct scope_guard
{
    BOOST_FORCEINLINE scope_guard(Fn &&fn)
        : mFn(std::forward<Fn>(fn))
    {
    }
    BOOST_FORCEINLINE ~scope_guard() noexcept
    {
        mFn();
    }

private:
    Fn mFn;
};

enum class on_exit_scope
{
};

template <typename Fn>
BOOST_FORCEINLINE auto operator+(on_exit_scope, Fn &&fn) -> scope_guard<Fn>
{
    return scope_guard<Fn>{std::forward<Fn>(fn)};
}

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#define SECFILE_ANONYMOUS_VAR(id) BOOST_PP_CAT(id, __LINE__)
#define SECFILE_SCOPE_EXIT                                                     \
    auto SECFILE_ANONYMOUS_VAR(_scope_exit_guard_)                             \
            = ::secfile::utils::on_exit_scope{} + [&]()

// NOLINTEND(cppcoreguidelines-macro-usage)

} // namespace secfile::utils
