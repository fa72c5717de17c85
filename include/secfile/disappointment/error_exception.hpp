#pragma once

#include <exception>
#include <string>

#include <secfile/disappointment/error.hpp>

namespace secfile
{
class error_exception final : public std::exception
{
public:
    error_exception() = delete;
    explicit error_exception(secfile::error err) noexcept;

    auto what() const noexcept -> char const * override;

    auto error() const noexcept -> secfile::error const &;

private:
    secfile::error mErr;
    mutable std::string mErrDesc;
};

inline error_exception::error_exception(secfile::error err) noexcept
    : mErr{std::move(err)}
    , mErrDesc{}
{
}

inline auto error_exception::error() const noexcept -> secfile::error const &
{
    return mErr;
}
} // namespace secfile
