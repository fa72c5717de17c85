#pragma once

#include <cstdint>

namespace secfile
{
//! scrypt work factors
struct kdf_parameters
{
    //! N, must be a power of two greater than 1
    std::uint64_t cost = 16384;
    //! r
    std::uint64_t block_size = 8;
    //! p
    std::uint64_t parallelism = 1;
};
} // namespace secfile
