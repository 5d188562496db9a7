#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpline {

constexpr std::size_t kDefaultPageSize = 50;

// Opaque cursor: URL-safe base64 (no padding) of the decimal offset.
std::string EncodeCursor(std::size_t offset);

// Returns nullopt for anything that is not a cursor EncodeCursor could have
// produced. Never fails louder than that.
std::optional<std::size_t> DecodeCursor(std::string_view cursor);

// ---------------------------------------------------------------------------
// PageState — offset and limit for one list call.
// ---------------------------------------------------------------------------
struct PageState {
    std::size_t offset = 0;
    std::size_t limit = kDefaultPageSize;

    // An absent or undecodable cursor starts from offset zero.
    static PageState FromCursor(const std::optional<std::string>& cursor,
                                std::size_t page_size);

    // Cursor for the page following one that returned `returned` items out
    // of `total`, or nullopt when nothing is left.
    [[nodiscard]] std::optional<std::string> NextCursor(std::size_t total,
                                                        std::size_t returned) const;
};

template <typename T>
struct Page {
    std::vector<T> items;
    std::optional<std::string> next_cursor;
};

// items[offset, min(offset + limit, size)). The caller sorts `items` first.
template <typename T>
Page<T> Paginate(const std::vector<T>& items, const PageState& state) {
    Page<T> page;
    if (state.offset < items.size()) {
        auto first = items.begin() + static_cast<std::ptrdiff_t>(state.offset);
        auto count = std::min(state.limit, items.size() - state.offset);
        page.items.assign(first, first + static_cast<std::ptrdiff_t>(count));
    }
    page.next_cursor = state.NextCursor(items.size(), page.items.size());
    return page;
}

} // namespace mcpline
