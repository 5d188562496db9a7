#include <mcpline/pagination/pagination.hpp>

#include <charconv>
#include <cstdint>
#include <system_error>

namespace mcpline {

namespace {

constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

int SextetOf(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '-') return 62;
    if (c == '_') return 63;
    return -1;
}

std::string Base64UrlEncode(std::string_view input) {
    std::string out;
    out.reserve((input.size() * 4 + 2) / 3);

    std::uint32_t buffer = 0;
    int bits = 0;
    for (unsigned char c : input) {
        buffer = (buffer << 8) | c;
        bits += 8;
        while (bits >= 6) {
            bits -= 6;
            out.push_back(kAlphabet[(buffer >> bits) & 0x3F]);
        }
    }
    if (bits > 0) {
        out.push_back(kAlphabet[(buffer << (6 - bits)) & 0x3F]);
    }
    return out;
}

// Strict decoding: no padding, no stray characters, no non-zero leftover
// bits. Anything else is not a cursor we issued.
std::optional<std::string> Base64UrlDecode(std::string_view input) {
    if (input.size() % 4 == 1) {
        return std::nullopt;
    }

    std::string out;
    out.reserve(input.size() * 3 / 4);

    std::uint32_t buffer = 0;
    int bits = 0;
    for (char c : input) {
        int sextet = SextetOf(c);
        if (sextet < 0) {
            return std::nullopt;
        }
        buffer = (buffer << 6) | static_cast<std::uint32_t>(sextet);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<char>((buffer >> bits) & 0xFF));
        }
    }
    if ((buffer & ((1u << bits) - 1)) != 0) {
        return std::nullopt;
    }
    return out;
}

} // anonymous namespace

std::string EncodeCursor(std::size_t offset) {
    return Base64UrlEncode(std::to_string(offset));
}

std::optional<std::size_t> DecodeCursor(std::string_view cursor) {
    if (cursor.empty()) {
        return std::nullopt;
    }
    auto decoded = Base64UrlDecode(cursor);
    if (!decoded.has_value() || decoded->empty()) {
        return std::nullopt;
    }
    for (char c : *decoded) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
    }

    std::size_t offset = 0;
    const char* first = decoded->data();
    const char* last = first + decoded->size();
    auto [ptr, ec] = std::from_chars(first, last, offset);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return offset;
}

// ---------------------------------------------------------------------------
// PageState
// ---------------------------------------------------------------------------
PageState PageState::FromCursor(const std::optional<std::string>& cursor,
                                std::size_t page_size) {
    PageState state;
    state.limit = page_size == 0 ? kDefaultPageSize : page_size;
    if (cursor.has_value()) {
        state.offset = DecodeCursor(*cursor).value_or(0);
    }
    return state;
}

std::optional<std::string> PageState::NextCursor(std::size_t total,
                                                 std::size_t returned) const {
    if (offset + returned < total) {
        return EncodeCursor(offset + returned);
    }
    return std::nullopt;
}

} // namespace mcpline
