#pragma once

#include <secfile/disappointment/fwd.hpp>

namespace secfile
{
enum class errc : error_code
{
    bad = 1,
    invalid_argument,
    key_already_exists,
    not_enough_memory,
    not_supported,
    result_out_of_range,
    user_object_copy_failed,
};

enum class secfile_errc : error_code
{
    invalid_sector_size = 1,
    file_already_exists,
    file_not_found,
    sector_not_found,
    wrong_passphrase,
    tag_mismatch,
    not_open,
    cursor_not_set,
    key_derivation_failed,
};

inline auto make_error(errc code, adl::disappointment::type) noexcept
        -> error;
inline auto make_error(secfile_errc code, adl::disappointment::type) noexcept
        -> error;
} // namespace secfile
