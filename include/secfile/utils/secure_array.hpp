#pragma once

#include <cstddef>

#include <array>
#include <span>

#include <secfile/platform/secure_memzero.hpp>
#include <secfile/span.hpp>

namespace secfile::utils
{

/**
 * A fixed size array which cleanses its storage on destruction and when its
 * contents are moved out. Used for every piece of key material.
 */
template <typename T, std::size_t arr_size>
struct secure_array : private std::array<T, arr_size>
{
private:
    using base_type = std::array<T, arr_size>;

public:
    static constexpr std::size_t static_size = arr_size;

    using span_type = std::span<T, static_size>;

    using typename base_type::const_iterator;
    using typename base_type::const_pointer;
    using typename base_type::const_reference;
    using typename base_type::iterator;
    using typename base_type::pointer;
    using typename base_type::reference;
    using typename base_type::size_type;
    using typename base_type::value_type;

    secure_array() noexcept = default;
    explicit secure_array(std::span<T const, arr_size> other) noexcept
    {
        copy(other, span_type{this->data(), static_size});
    }
    secure_array(secure_array const &) noexcept = default;
    secure_array(secure_array &&other) noexcept
        : base_type(other)
    {
        secure_memzero(as_writable_bytes(span_type{other.data(), static_size}));
    }
    ~secure_array()
    {
        secure_memzero(as_writable_bytes(span_type{this->data(), static_size}));
    }

    auto operator=(secure_array const &) noexcept -> secure_array & = default;
    auto operator=(secure_array &&other) noexcept -> secure_array &
    {
        static_cast<base_type &>(*this) = static_cast<base_type &>(other);
        secure_memzero(as_writable_bytes(span_type{other.data(), static_size}));
        return *this;
    }

    using base_type::operator[];
    using base_type::data;

    using base_type::begin;
    using base_type::cbegin;
    using base_type::cend;
    using base_type::end;

    using base_type::size;
};

template <typename T, std::size_t arr_size>
constexpr auto as_span(secure_array<T, arr_size> &arr) noexcept
{
    return std::span<T, arr_size>(arr.data(), arr_size);
}
template <typename T, std::size_t arr_size>
constexpr auto as_span(secure_array<T, arr_size> const &arr) noexcept
{
    return std::span<T const, arr_size>(arr.data(), arr_size);
}

template <std::size_t arr_size>
using secure_byte_array = secure_array<std::byte, arr_size>;

} // namespace secfile::utils
