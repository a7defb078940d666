#include "minerscan/scan/AddressRange.hpp"

#include <array>
#include <cctype>

namespace minerscan::scan {

using minerscan::unexpected;

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
    return text;
}

// Up to three digits, value <= 255.
bool parseOctet(std::string_view text, std::uint32_t& out) {
    if (text.empty() || text.size() > 3) {
        return false;
    }
    std::uint32_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + static_cast<std::uint32_t>(c - '0');
    }
    if (value > 255) {
        return false;
    }
    out = value;
    return true;
}

} // namespace

expected<net::address_v4> parseAddress(std::string_view text) {
    text = trim(text);
    std::array<std::uint32_t, 4> octets{};
    std::size_t index = 0;

    while (index < octets.size()) {
        const auto dot = text.find('.');
        const auto part = text.substr(0, dot);
        if (!parseOctet(part, octets[index])) {
            return unexpected(RangeError::InvalidRange);
        }
        ++index;
        if (dot == std::string_view::npos) {
            text = {};
            break;
        }
        if (index == octets.size()) {
            return unexpected(RangeError::InvalidRange); // trailing '.'
        }
        text.remove_prefix(dot + 1);
    }

    if (index != octets.size() || !text.empty()) {
        return unexpected(RangeError::InvalidRange);
    }

    const std::uint32_t value = (octets[0] << 24) | (octets[1] << 16) | (octets[2] << 8) | octets[3];
    return net::address_v4(value);
}

expected<AddressRange> AddressRange::fromAddresses(const net::address_v4& first,
                                                   const net::address_v4& last) {
    if (last.to_uint() < first.to_uint()) {
        return unexpected(RangeError::InvalidRange);
    }
    return AddressRange(first.to_uint(), last.to_uint());
}

expected<AddressRange> AddressRange::parse(std::string_view start, std::string_view end) {
    auto first = parseAddress(start);
    if (!first) {
        return unexpected(first.error());
    }
    auto last = parseAddress(end);
    if (!last) {
        return unexpected(last.error());
    }
    return fromAddresses(*first, *last);
}

expected<AddressRange> AddressRange::parse(std::string_view text) {
    text = trim(text);
    const auto dash = text.find('-');
    if (dash == std::string_view::npos) {
        return parse(text, text);
    }

    const auto startText = text.substr(0, dash);
    const auto endText = trim(text.substr(dash + 1));

    if (endText.find('.') != std::string_view::npos) {
        return parse(startText, endText);
    }

    // Shorthand: only the last octet is given after the dash.
    auto first = parseAddress(startText);
    std::uint32_t lastOctet = 0;
    if (!first || !parseOctet(endText, lastOctet)) {
        return unexpected(RangeError::InvalidRange);
    }
    const std::uint32_t last = (first->to_uint() & 0xFFFFFF00u) | lastOctet;
    return fromAddresses(*first, net::address_v4(last));
}

std::string AddressRange::toString() const {
    const auto start = first().to_string();
    if (first_ == last_) {
        return start;
    }
    if ((first_ & 0xFFFFFF00u) == (last_ & 0xFFFFFF00u)) {
        return start + "-" + std::to_string(last_ & 0xFFu);
    }
    return start + "-" + last().to_string();
}

} // namespace minerscan::scan
