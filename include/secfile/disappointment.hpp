#pragma once

#include <cstdint>

#include <memory>
#include <new>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

#include <fmt/format.h>

#include <boost/outcome/bad_access.hpp>
#include <boost/outcome/basic_result.hpp>
#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <secfile/disappointment/errc.hpp>
#include <secfile/disappointment/error.hpp>
#include <secfile/disappointment/error_detail.hpp>
#include <secfile/disappointment/error_exception.hpp>
#include <secfile/disappointment/std_adapter.hpp>

namespace secfile::ed
{
struct file_span
{
    std::uint64_t begin;
    std::uint64_t end;
};
} // namespace secfile::ed

template <>
struct fmt::formatter<secfile::ed::file_span>
{
    constexpr auto parse(format_parse_context &ctx)
            -> format_parse_context::iterator
    {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(secfile::ed::file_span const &fspan, FormatContext &ctx) const
            -> decltype(ctx.out())
    {
        return fmt::format_to(ctx.out(), "[{},{})", fspan.begin, fspan.end);
    }
};

namespace secfile
{
namespace outcome = BOOST_OUTCOME_V2_NAMESPACE;

namespace detail
{
class result_no_value_policy : public outcome::policy::base
{
public:
    //! Performs a narrow check of state, used in the assume_value()
    //! functions.
    using base::narrow_value_check;

    //! Performs a narrow check of state, used in the assume_error()
    //! functions.
    using base::narrow_error_check;

    //! Performs a wide check of state, used in the value() functions.
    template <class Impl>
    static constexpr void wide_value_check(Impl &&self)
    {
        if (!base::_has_value(self))
        {
            if (base::_has_error(self))
            {
                base::_error(self).throw_exception();
            }
            throw outcome::bad_result_access("no value");
        }
    }

    //! Performs a wide check of state, used in the error() functions.
    template <class Impl>
    static constexpr void wide_error_check(Impl &&self)
    {
        if (!base::_has_error(self))
        {
            throw outcome::bad_result_access("no error");
        }
    }
};
} // namespace detail

using outcome::failure;
using outcome::success;

template <typename T>
using result = outcome::basic_result<T, error, detail::result_no_value_policy>;

template <typename T, typename... Args>
    requires(!std::is_array_v<T>)
auto make_unique_nothrow(Args &&...args) noexcept(
        std::is_nothrow_constructible_v<T, decltype(args)...>)
        -> std::unique_ptr<T>
{
    return std::unique_ptr<T>(new (std::nothrow)
                                      T(static_cast<Args &&>(args)...));
}

template <typename T, typename InjectFn>
auto inject(result<T> rx, InjectFn &&injectFn) -> result<T>
{
    if (rx.has_error())
    {
        std::forward<InjectFn>(injectFn)(rx.assume_error());
    }
    return rx;
}

namespace ed
{
enum class error_code_origin_tag
{
};
using error_code_api_origin
        = error_detail<error_code_origin_tag, std::string_view>;

enum class io_file_tag
{
};
using io_file = error_detail<io_file_tag, std::string>;

enum class sector_index_tag
{
};
using sector_index = error_detail<sector_index_tag, std::uint64_t>;

enum class file_position_tag
{
};
using file_position = error_detail<file_position_tag, std::uint64_t>;

//! the number of bytes found at the position of an incomplete sector
enum class stored_bytes_tag
{
};
using stored_bytes = error_detail<stored_bytes_tag, std::uint64_t>;

enum class io_area_tag
{
};
using io_area = error_detail<io_area_tag, file_span>;
} // namespace ed

auto collect_system_error() noexcept -> std::error_code;

} // namespace secfile

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#define SECFILE_TRY(...) BOOST_OUTCOME_TRY(__VA_ARGS__)

#define SECFILE_TRY_INJECT(stmt, injected)                                     \
    SECFILE_TRY(::secfile::inject((stmt), [&](auto &_secfileError) mutable {  \
        _secfileError << injected;                                             \
    }))

// NOLINTEND(cppcoreguidelines-macro-usage)
