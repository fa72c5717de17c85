#pragma once

#include <secfile/disappointment.hpp>
#include <secfile/span.hpp>

namespace secfile::detail
{
auto random_bytes(rw_dynblob buffer) noexcept -> result<void>;
}
