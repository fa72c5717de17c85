#pragma once

#include <cstdint>

#include <algorithm>
#include <atomic>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <utility>
#include <vector>

#include <boost/smart_ptr/intrusive_ptr.hpp>

#include <fmt/format.h>

#include <secfile/disappointment/errc.hpp>
#include <secfile/disappointment/error_detail.hpp>
#include <secfile/disappointment/error_domain.hpp>
#include <secfile/disappointment/fwd.hpp>

namespace secfile
{
class error_info final
{
    using detail_ptr = std::unique_ptr<detail::error_detail_base>;
    using detail_list = std::vector<std::pair<std::type_index, detail_ptr>>;

public:
    using ptr = boost::intrusive_ptr<error_info>;
    using diagnostics_buffer = detail::error_detail_base::format_buffer;

    error_info() noexcept;
    error_info(error_info const &) = delete;
    auto operator=(error_info const &) -> error_info & = delete;

    template <typename ErrorDetail>
    auto detail() const noexcept -> typename ErrorDetail::value_type const *;

    template <typename ErrorDetail>
    auto try_add_detail(ErrorDetail &&detail) noexcept -> secfile::error;
    auto try_add_detail(std::type_index type, detail_ptr ptr) noexcept
            -> secfile::error;

    void diagnostic_information(diagnostics_buffer &out,
                                std::string_view separator) const;

    friend void intrusive_ptr_add_ref(error_info const *self) noexcept
    {
        self->mRefCtr.fetch_add(1, std::memory_order_relaxed);
    }
    friend void intrusive_ptr_release(error_info const *self) noexcept
    {
        if (self->mRefCtr.fetch_sub(1, std::memory_order_acq_rel) == 1)
        {
            delete self;
        }
    }

private:
    ~error_info();

    detail_list mDetails;
    mutable std::atomic_int mRefCtr{0};
    int mInsertionFailures{0};
};
static_assert(!std::is_copy_constructible_v<error_info>);
static_assert(!std::is_move_constructible_v<error_info>);
static_assert(!std::is_copy_assignable_v<error_info>);
static_assert(!std::is_move_assignable_v<error_info>);

template <typename ErrorDetail>
inline auto error_info::detail() const noexcept ->
        typename ErrorDetail::value_type const *
{
    auto const it = std::find_if(
            mDetails.begin(), mDetails.end(),
            [](auto const &entry) { return entry.first == typeid(ErrorDetail); });
    if (it == mDetails.end())
    {
        return nullptr;
    }
    return &static_cast<ErrorDetail const *>(it->second.get())->value();
}

inline void error_info::diagnostic_information(diagnostics_buffer &out,
                                               std::string_view separator) const
{
    for (auto const &entry : mDetails)
    {
        out.append(separator.data(), separator.data() + separator.size());
        entry.second->stringify(out);
    }
}

/**
 * A cheaply copyable error value consisting of a code, the domain
 * interpreting the code and an optional, shared bag of diagnostic details.
 *
 * A default constructed error represents success.
 */
class error final
{
    class success_domain final : public error_domain
    {
        auto name() const noexcept -> std::string_view override;
        auto message(error const &e, error_code const code) const noexcept
                -> std::string_view override;

        static success_domain const sInstance;

    public:
        constexpr success_domain() noexcept = default;

        static auto instance() noexcept -> error_domain const &;
    };

public:
    error() noexcept;
    error(error_code code,
          error_domain const &domain,
          error_info::ptr info = {}) noexcept;
    template <typename T,
              std::enable_if_t<is_error_compatible_v<T>, int> = 0>
    error(T code) noexcept(
            noexcept(make_error(code, adl::disappointment::type{})))
        : error{make_error(code, adl::disappointment::type{})}
    {
    }

    error(error const &other) noexcept = default;
    error(error &&other) noexcept;
    auto operator=(error const &other) noexcept -> error & = default;
    auto operator=(error &&other) noexcept -> error &;

    auto code() const noexcept -> error_code;
    auto domain() const noexcept -> error_domain const &;

    auto has_info() const noexcept -> bool;
    auto info() const noexcept -> error_info::ptr const &;
    auto ensure_allocated() const noexcept -> error;

    template <typename ErrorDetail>
    auto detail() const noexcept -> typename ErrorDetail::value_type const *;

    auto diagnostic_information(error_message_format format) const noexcept
            -> std::string;

    [[noreturn]] void throw_exception() const;

    explicit operator bool() const noexcept;

private:
    error_code mValue;
    mutable error_info::ptr mInfo;
    error_domain const *mDomain;
};

inline error::error() noexcept
    : mValue{}
    , mInfo{}
    , mDomain{nullptr}
{
}
inline error::error(error_code code,
                    error_domain const &domain,
                    error_info::ptr info) noexcept
    : mValue{code}
    , mInfo{std::move(info)}
    , mDomain{&domain}
{
}
inline error::error(error &&other) noexcept
    : mValue{std::exchange(other.mValue, 0)}
    , mInfo{std::move(other.mInfo)}
    , mDomain{std::exchange(other.mDomain, nullptr)}
{
}
inline auto error::operator=(error &&other) noexcept -> error &
{
    mValue = std::exchange(other.mValue, 0);
    mInfo = std::move(other.mInfo);
    mDomain = std::exchange(other.mDomain, nullptr);
    return *this;
}

inline auto make_error(errc code, adl::disappointment::type) noexcept -> error
{
    return error{static_cast<error_code>(code), generic_domain()};
}
inline auto make_error(secfile_errc code, adl::disappointment::type) noexcept
        -> error
{
    return error{static_cast<error_code>(code), secfile_domain()};
}

template <typename ErrorDetail>
inline auto error_info::try_add_detail(ErrorDetail &&detail) noexcept
        -> secfile::error
{
    using obj_type = std::remove_cvref_t<ErrorDetail>;
    static_assert(std::is_base_of_v<secfile::detail::error_detail_base,
                                    obj_type>,
                  "The detail type must derive from "
                  "secfile::detail::error_detail_base.");

    detail_ptr heapDetail;
    try
    {
        heapDetail.reset(new (std::nothrow)
                                 obj_type(std::forward<ErrorDetail>(detail)));
    }
    catch (std::exception const &)
    {
        ++mInsertionFailures;
        return errc::user_object_copy_failed;
    }

    if (!heapDetail)
    {
        ++mInsertionFailures;
        return errc::not_enough_memory;
    }
    return try_add_detail(typeid(obj_type), std::move(heapDetail));
}

inline auto error_info::try_add_detail(std::type_index type,
                                       detail_ptr ptr) noexcept
        -> secfile::error
{
    auto const it = std::find_if(
            mDetails.begin(), mDetails.end(),
            [type](auto const &entry) { return entry.first == type; });
    if (it != mDetails.end())
    {
        return errc::key_already_exists;
    }
    try
    {
        mDetails.emplace_back(type, std::move(ptr));
    }
    catch (std::bad_alloc const &)
    {
        ++mInsertionFailures;
        return errc::not_enough_memory;
    }
    return error{};
}

inline auto error::code() const noexcept -> error_code
{
    return mValue;
}
inline auto error::domain() const noexcept -> error_domain const &
{
    return mDomain != nullptr ? *mDomain : success_domain::instance();
}
inline auto error::has_info() const noexcept -> bool
{
    return static_cast<bool>(mInfo);
}
inline auto error::info() const noexcept -> error_info::ptr const &
{
    return mInfo;
}
inline auto error::ensure_allocated() const noexcept -> error
{
    if (!has_info())
    {
        mInfo.reset(new (std::nothrow) error_info());
        if (!mInfo)
        {
            return errc::not_enough_memory;
        }
    }
    return error{};
}

template <typename ErrorDetail>
inline auto error::detail() const noexcept ->
        typename ErrorDetail::value_type const *
{
    if (!has_info())
    {
        return nullptr;
    }
    return mInfo->detail<ErrorDetail>();
}

inline error::operator bool() const noexcept
{
    return mDomain != nullptr;
}

inline auto operator==(error const &lhs, error const &rhs) noexcept -> bool
{
    return lhs.domain() == rhs.domain() && lhs.code() == rhs.code();
}

template <typename T>
auto operator<<(error &e, T &&detail) noexcept -> error &
{
    if (!e.ensure_allocated())
    {
        (void)e.info()->try_add_detail(std::forward<T>(detail));
    }
    return e;
}
template <typename T>
auto operator<<(error &&e, T &&detail) noexcept -> error &&
{
    if (!e.ensure_allocated())
    {
        (void)e.info()->try_add_detail(std::forward<T>(detail));
    }
    return std::move(e);
}
} // namespace secfile

/**
 * "{}" and "{:v}" render the error with all attached details,
 * "{:!v}" renders only "domain => message".
 */
template <>
struct fmt::formatter<secfile::error>
{
    secfile::error_message_format error_format
            = secfile::error_message_format::with_diagnostics;

    constexpr auto parse(format_parse_context &ctx)
            -> format_parse_context::iterator
    {
        auto it = ctx.begin();
        auto const end = ctx.end();
        if (it != end && *it == '!')
        {
            ++it;
            if (it == end || *it != 'v')
            {
                throw format_error("invalid error format specifier");
            }
            ++it;
            error_format = secfile::error_message_format::simple;
        }
        else if (it != end && *it == 'v')
        {
            ++it;
        }
        if (it != end && *it != '}')
        {
            throw format_error("invalid error format specifier");
        }
        return it;
    }

    template <typename FormatContext>
    auto format(secfile::error const &e, FormatContext &ctx) const
            -> decltype(ctx.out())
    {
        auto const str = e.diagnostic_information(error_format);
        return std::copy(str.begin(), str.end(), ctx.out());
    }
};

namespace secfile
{
inline auto operator<<(std::ostream &s, error const &e) -> std::ostream &
{
    s << fmt::format("{}", e);
    return s;
}
} // namespace secfile
