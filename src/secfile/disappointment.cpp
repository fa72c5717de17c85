#include <secfile/disappointment.hpp>

#include <cerrno>

#include <future>
#include <ios>
#include <mutex>
#include <unordered_map>

#include <boost/config.hpp>

namespace secfile
{
BOOST_NOINLINE error_info::error_info() noexcept
    : mDetails{}
{
}
BOOST_NOINLINE error_info::~error_info()
{
}

auto error::success_domain::name() const noexcept -> std::string_view
{
    using namespace std::string_view_literals;
    return "success-domain"sv;
}
auto error::success_domain::message(error const &,
                                    error_code const code) const noexcept
        -> std::string_view
{
    using namespace std::string_view_literals;
    return code == 0 ? "success"sv : "invalid-success-code"sv;
}
error::success_domain const error::success_domain::sInstance;
auto error::success_domain::instance() noexcept -> error_domain const &
{
    return sInstance;
}

auto error::diagnostic_information(error_message_format format) const noexcept
        -> std::string
{
    decltype(auto) hDomain = domain();
    auto const domainName = hDomain.name();
    auto const errorDesc = hDomain.message(*this, code());

    if (format != error_message_format::simple && has_info())
    {
        error_info::diagnostics_buffer buffer;
        fmt::format_to(fmt::appender(buffer), "{} => {}", domainName,
                       errorDesc);

        info()->diagnostic_information(buffer, "\n\t");

        return fmt::to_string(buffer);
    }
    return fmt::format(FMT_STRING("{} => {}"), domainName, errorDesc);
}

void error::throw_exception() const
{
    throw error_exception{*this};
}

auto error_exception::what() const noexcept -> char const *
{
    if (mErrDesc.empty())
    {
        try
        {
            mErrDesc = mErr.diagnostic_information(
                    error_message_format::with_diagnostics);
        }
        catch (std::bad_alloc const &)
        {
            return "<error_exception|failed to allocate the diagnostic "
                   "information string>";
        }
    }
    return mErrDesc.c_str();
}
} // namespace secfile

namespace secfile
{
class generic_domain_type final : public error_domain
{
    auto name() const noexcept -> std::string_view override;
    auto message(error const &, error_code const code) const noexcept
            -> std::string_view override;

public:
    constexpr generic_domain_type() noexcept = default;
};

auto generic_domain_type::name() const noexcept -> std::string_view
{
    using namespace std::string_view_literals;

    return "generic-domain"sv;
}

auto generic_domain_type::message(error const &,
                                  error_code const value) const noexcept
        -> std::string_view
{
    using namespace std::string_view_literals;

    errc const code{value};

    switch (code)
    {
    case errc::bad:
        return "unexpected failure in third party code"sv;

    case errc::invalid_argument:
        return "a given function argument did not meet its requirements"sv;

    case errc::key_already_exists:
        return "the given key already existed in the collection"sv;

    case errc::not_enough_memory:
        return "could not allocate the required memory"sv;

    case errc::not_supported:
        return "the requested feature is not supported"sv;

    case errc::result_out_of_range:
        return "function not defined for the given arguments (result would be out of range)"sv;

    case errc::user_object_copy_failed:
        return "the function call failed due to an exception thrown by a user object copy ctor"sv;

    default:
        return "unknown generic error code"sv;
    }
}

namespace
{
constexpr generic_domain_type generic_domain_v{};
}

auto generic_domain() noexcept -> error_domain const &
{
    return generic_domain_v;
}

class secfile_domain_type final : public error_domain
{
    auto name() const noexcept -> std::string_view override;
    auto message(error const &, error_code const code) const noexcept
            -> std::string_view override;

public:
    constexpr secfile_domain_type() noexcept = default;
};

auto secfile_domain_type::name() const noexcept -> std::string_view
{
    using namespace std::string_view_literals;

    return "secfile-domain"sv;
}

auto secfile_domain_type::message(error const &,
                                  error_code const value) const noexcept
        -> std::string_view
{
    using namespace std::string_view_literals;

    secfile_errc const code{value};

    switch (code)
    {
    case secfile_errc::invalid_sector_size:
        return "the sector size must be a positive multiple of the cipher block size"sv;

    case secfile_errc::file_already_exists:
        return "a file already exists at the given path"sv;

    case secfile_errc::file_not_found:
        return "no file exists at the given path"sv;

    case secfile_errc::sector_not_found:
        return "the requested sector lies beyond the end of the file"sv;

    case secfile_errc::wrong_passphrase:
        return "the given passphrase is not valid for this file or the file header has been corrupted"sv;

    case secfile_errc::tag_mismatch:
        return "decryption failed because the message tag didn't match"sv;

    case secfile_errc::not_open:
        return "the encrypted file handle is not open"sv;

    case secfile_errc::cursor_not_set:
        return "a cursor operation was issued before the first seek"sv;

    case secfile_errc::key_derivation_failed:
        return "the key derivation function failed"sv;

    default:
        return "unknown secfile error code"sv;
    }
}

namespace
{
constexpr secfile_domain_type secfile_domain_v{};
}

auto secfile_domain() noexcept -> error_domain const &
{
    return secfile_domain_v;
}
} // namespace secfile

namespace secfile::ed
{
enum class message_cache_tag
{
};
using message_cache = error_detail<message_cache_tag, std::string>;
} // namespace secfile::ed

namespace secfile::adl::disappointment
{
namespace
{
class std_adapter_domain final : public error_domain
{
public:
    explicit constexpr std_adapter_domain(
            std::error_category const *impl) noexcept;

private:
    auto name() const noexcept -> std::string_view override;
    auto message(error const &, error_code const code) const noexcept
            -> std::string_view override;

    std::error_category const *const mImpl;
};

constexpr std_adapter_domain::std_adapter_domain(
        std::error_category const *impl) noexcept
    : mImpl{impl}
{
}

auto std_adapter_domain::name() const noexcept -> std::string_view
{
    return mImpl->name();
}

auto std_adapter_domain::message(error const &e,
                                 error_code const code) const noexcept
        -> std::string_view
{
    using namespace std::string_view_literals;
    if (e.ensure_allocated())
    {
        return "<std_adapter_domain failed to allocate the error info object>"sv;
    }
    auto msgcache = e.info()->detail<ed::message_cache>();
    if (msgcache == nullptr)
    {
        std::string msg;
        try
        {
            msg = mImpl->message(static_cast<int>(code));
        }
        catch (std::bad_alloc const &)
        {
            return "<std_adapter_domain failed to allocate the message buffer>"sv;
        }
        catch (std::exception const &)
        {
            return "<std_adapter_domain failed to retrieve the message from the error category>"sv;
        }

        if (e.info()->try_add_detail(ed::message_cache{std::move(msg)}))
        {
            return "<std_adapter_domain failed to allocate the message cache detail>"sv;
        }
        msgcache = e.info()->detail<ed::message_cache>();
    }

    return *msgcache;
}

std_adapter_domain const generic_cat_adapter{&std::generic_category()};
std_adapter_domain const system_cat_adapter{&std::system_category()};
std_adapter_domain const iostream_cat_adapter{&std::iostream_category()};
std_adapter_domain const future_cat_adapter{&std::future_category()};

std::mutex nonstandard_category_domain_map_sync{};
std::unordered_map<std::error_category const *,
                   std::unique_ptr<std_adapter_domain>>
        nonstandard_category_domain_map{8};

auto adapt_domain(std::error_category const &cat) noexcept
        -> error_domain const &
{
    if (cat == std::generic_category())
    {
        return generic_cat_adapter;
    }
    if (cat == std::system_category())
    {
        return system_cat_adapter;
    }
    if (cat == std::future_category())
    {
        return future_cat_adapter;
    }
    if (cat == std::iostream_category())
    {
        return iostream_cat_adapter;
    }

    try
    {
        std::lock_guard lock{nonstandard_category_domain_map_sync};
        if (auto it = nonstandard_category_domain_map.find(&cat);
            it != nonstandard_category_domain_map.end())
        {
            return *it->second;
        }

        return *nonstandard_category_domain_map
                        .emplace(&cat,
                                 std::make_unique<std_adapter_domain>(&cat))
                        .first->second;
    }
    catch (std::exception const &)
    {
        // the code stays meaningful, only the category name is lost
        return system_cat_adapter;
    }
}
} // namespace

auto make_error(std::error_code ec, adl::disappointment::type) noexcept
        -> error
{
    static_assert(sizeof(int) <= sizeof(error_code));
    return {static_cast<error_code>(ec.value()), adapt_domain(ec.category())};
}

auto make_error(std::errc ec, adl::disappointment::type) noexcept -> error
{
    return {static_cast<error_code>(ec), generic_cat_adapter};
}
} // namespace secfile::adl::disappointment

namespace secfile
{
auto collect_system_error() noexcept -> std::error_code
{
    return std::error_code{errno, std::system_category()};
}
} // namespace secfile
