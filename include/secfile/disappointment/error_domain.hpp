#pragma once

#include <string_view>
#include <type_traits>

#include <secfile/disappointment/fwd.hpp>

namespace secfile
{
class error_domain
{
public:
    error_domain(error_domain const &) = delete;
    auto operator=(error_domain const &) -> error_domain & = delete;

    virtual auto name() const noexcept -> std::string_view = 0;
    virtual auto message(error const &e, error_code const code) const noexcept
            -> std::string_view
            = 0;

    auto message(error &&e, error_code const code) const noexcept
            -> std::string_view
            = delete;

protected:
    constexpr error_domain() noexcept = default;
    ~error_domain() = default;
};
static_assert(!std::is_copy_constructible_v<error_domain>);
static_assert(!std::is_move_constructible_v<error_domain>);
static_assert(!std::is_copy_assignable_v<error_domain>);
static_assert(!std::is_move_assignable_v<error_domain>);

constexpr auto operator==(error_domain const &lhs,
                          error_domain const &rhs) noexcept -> bool
{
    return &lhs == &rhs;
}
constexpr auto operator!=(error_domain const &lhs,
                          error_domain const &rhs) noexcept -> bool
{
    return &lhs != &rhs;
}

auto generic_domain() noexcept -> error_domain const &;
auto secfile_domain() noexcept -> error_domain const &;
} // namespace secfile
