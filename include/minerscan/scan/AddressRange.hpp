#pragma once
#include "minerscan/core/Expected.hpp"
#include "minerscan/core/Errors.hpp"
#include "minerscan/net/NetConfig.hpp"

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>

namespace minerscan::scan {

using minerscan::expected;

/**
 * @brief Inclusive IPv4 range, expanded lazily in ascending numeric order.
 *
 * Only constructible through `parse` / `fromAddresses`, so every instance
 * satisfies first() <= last(). Iteration is restartable and allocation free.
 */
class AddressRange {
public:
    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = net::address_v4;
        using difference_type = std::ptrdiff_t;
        using pointer = const net::address_v4*;
        using reference = net::address_v4;

        iterator() = default;

        net::address_v4 operator*() const { return net::address_v4(static_cast<std::uint32_t>(current)); }

        iterator& operator++() {
            ++current;
            return *this;
        }

        iterator operator++(int) {
            iterator copy = *this;
            ++current;
            return copy;
        }

        bool operator==(const iterator& other) const { return current == other.current; }
        bool operator!=(const iterator& other) const { return current != other.current; }

    private:
        friend class AddressRange;
        explicit iterator(std::uint64_t value) : current(value) {}

        // 64-bit so the past-the-end position of 255.255.255.255 is representable.
        std::uint64_t current = 0;
    };

    /// Two dotted quads. Fails with RangeError::InvalidRange.
    static expected<AddressRange> parse(std::string_view start, std::string_view end);

    /**
     * @brief Single-string form used by saved ranges and the command line.
     *
     * Accepts "a.b.c.d", "a.b.c.d-e" (last octet range) and
     * "a.b.c.d-w.x.y.z". Surrounding whitespace is ignored.
     */
    static expected<AddressRange> parse(std::string_view text);

    static expected<AddressRange> fromAddresses(const net::address_v4& first,
                                                const net::address_v4& last);

    iterator begin() const { return iterator(first_); }
    iterator end() const { return iterator(static_cast<std::uint64_t>(last_) + 1); }

    net::address_v4 first() const { return net::address_v4(first_); }
    net::address_v4 last() const { return net::address_v4(last_); }

    /// end - start + 1
    std::uint64_t size() const { return static_cast<std::uint64_t>(last_) - first_ + 1; }

    bool contains(const net::address_v4& address) const {
        const auto value = address.to_uint();
        return value >= first_ && value <= last_;
    }

    /// "a.b.c.d-e" when the first three octets agree, otherwise "a.b.c.d-w.x.y.z".
    std::string toString() const;

    bool operator==(const AddressRange& other) const {
        return first_ == other.first_ && last_ == other.last_;
    }
    bool operator!=(const AddressRange& other) const { return !(*this == other); }

private:
    AddressRange(std::uint32_t first, std::uint32_t last) : first_(first), last_(last) {}

    std::uint32_t first_;
    std::uint32_t last_;
};

/// Strict dotted-quad parser: four decimal octets, no leading '+', no trailing garbage.
expected<net::address_v4> parseAddress(std::string_view text);

} // namespace minerscan::scan
