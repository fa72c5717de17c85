#include "sysrandom.hpp"

#include <algorithm>

#include <boost/predef.h>

#if defined(BOOST_OS_LINUX_AVAILABLE)

#include <cerrno>

#include <sys/random.h>
#include <sys/types.h>

auto secfile::detail::random_bytes(rw_dynblob buffer) noexcept
        -> secfile::result<void>
{
    using namespace std::string_view_literals;

    if (buffer.empty())
    {
        return errc::invalid_argument
               << ed::error_code_api_origin{"random_bytes"sv};
    }

    constexpr std::size_t maxChunkSize{33'554'431};

    while (!buffer.empty())
    {
        auto const chunkSize = std::min(maxChunkSize, buffer.size());

        ssize_t const readResult
                = ::getrandom(static_cast<void *>(buffer.data()), chunkSize, 0);
        if (readResult == -1)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return error{collect_system_error()}
                   << ed::error_code_api_origin{"getrandom"sv};
        }
        if (readResult == 0)
        {
            return errc::bad << ed::error_code_api_origin{"getrandom"sv};
        }
        buffer = buffer.subspan(static_cast<std::size_t>(readResult));
    }
    return success();
}

#elif defined(BOOST_OS_UNIX_AVAILABLE) || defined(BOOST_OS_MACOS_AVAILABLE)

#include <unistd.h>

auto secfile::detail::random_bytes(rw_dynblob buffer) noexcept
        -> secfile::result<void>
{
    using namespace std::string_view_literals;

    if (buffer.empty())
    {
        return errc::invalid_argument
               << ed::error_code_api_origin{"random_bytes"sv};
    }

    constexpr std::size_t maxChunkSize{256};

    while (!buffer.empty())
    {
        auto const chunkSize = std::min(maxChunkSize, buffer.size());

        if (::getentropy(static_cast<void *>(buffer.data()), chunkSize) != 0)
        {
            return error{collect_system_error()}
                   << ed::error_code_api_origin{"getentropy"sv};
        }
        buffer = buffer.subspan(chunkSize);
    }
    return success();
}

#else
#error "random_bytes() is not implemented on your operating system"
#endif
