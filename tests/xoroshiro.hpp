#pragma once

#include <cstdint>
#include <cstring>

#include <algorithm>
#include <limits>

#include <secfile/span.hpp>

namespace secfile_tests
{
// adapted from http://xoroshiro.di.unimi.it/xoroshiro128plus.c
class xoroshiro128plus
{
public:
    using result_type = std::uint64_t;

    xoroshiro128plus() = delete;
    constexpr xoroshiro128plus(std::uint64_t s1, std::uint64_t s2)
        : s{s1, s2}
    {
    }
    xoroshiro128plus(xoroshiro128plus const &) = default;

    inline auto operator()() -> result_type
    {
        std::uint64_t const s0 = s[0];
        std::uint64_t s1 = s[1];
        std::uint64_t const result = s0 + s1;

        s1 ^= s0;
        s[0] = rotl(s0, 55) ^ s1 ^ (s1 << 14); // a, b
        s[1] = rotl(s1, 36);                   // c

        return result;
    }

    void fill(secfile::rw_dynblob dest)
    {
        while (!dest.empty())
        {
            auto const v = this->operator()();
            auto const n = std::min(sizeof(v), dest.size());
            std::memcpy(dest.data(), &v, n);
            dest = dest.subspan(n);
        }
    }

    static constexpr auto min() -> result_type
    {
        return std::numeric_limits<result_type>::min();
    }
    static constexpr auto max() -> result_type
    {
        return std::numeric_limits<result_type>::max();
    }

private:
    static constexpr auto rotl(std::uint64_t const x, int k) -> std::uint64_t
    {
        return (x << k) | (x >> (64 - k));
    }

    std::uint64_t s[2];
};
} // namespace secfile_tests
