#pragma once

#include <exception>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>

#include <boost/core/demangle.hpp>

#include <fmt/format.h>

#include <secfile/disappointment/fwd.hpp>

namespace secfile
{
namespace detail
{
class error_detail_base
{
public:
    using format_buffer
            = fmt::basic_memory_buffer<char, error_format_stack_buffer_size>;

    error_detail_base() = default;
    virtual ~error_detail_base() noexcept = default;

    error_detail_base(error_detail_base const &) = delete;
    error_detail_base(error_detail_base &&) = delete;
    auto operator=(error_detail_base const &) -> error_detail_base & = delete;
    auto operator=(error_detail_base &&) -> error_detail_base & = delete;

    virtual void stringify(format_buffer &out) const noexcept = 0;
};
} // namespace detail

/**
 * A typed diagnostic value attached to an error. The Tag type names the
 * detail in the rendered diagnostics, T must be formattable by fmt.
 */
template <typename Tag, typename T>
class error_detail final : public secfile::detail::error_detail_base
{
public:
    using value_type = T;

    error_detail() = delete;
    error_detail(error_detail &&other) noexcept(
            std::is_nothrow_move_constructible_v<T>)
        : mValue(std::move(other.mValue))
    {
    }
    error_detail(T const &v) noexcept(std::is_nothrow_copy_constructible_v<T>)
        : mValue(v)
    {
    }
    error_detail(T &&v) noexcept(std::is_nothrow_move_constructible_v<T>)
        : mValue(std::move(v))
    {
    }

    auto value() noexcept -> value_type &
    {
        return mValue;
    }
    auto value() const noexcept -> value_type const &
    {
        return mValue;
    }

    void stringify(format_buffer &out) const noexcept override;

private:
    value_type mValue;
};

template <typename Tag, typename T>
inline void error_detail<Tag, T>::stringify(format_buffer &out) const noexcept
{
    auto const start = out.size();
    try
    {
        fmt::format_to(fmt::appender(out), "[{}] = ",
                       boost::core::demangle(typeid(Tag).name()));
    }
    catch (std::exception const &)
    {
        out.resize(start);
        return;
    }

    auto const valueStart = out.size();
    try
    {
        fmt::format_to(fmt::appender(out), "{}", mValue);
    }
    catch (std::exception const &)
    {
        out.resize(valueStart);
        std::string_view const failed{"<detail value format failed>"};
        out.append(failed.data(), failed.data() + failed.size());
    }
}
} // namespace secfile
