#pragma once

#include <secfile/span.hpp>

namespace secfile::utils
{
void secure_memzero(rw_dynblob data) noexcept;
} // namespace secfile::utils
