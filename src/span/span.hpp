#pragma once

#include <algorithm>
#include <cstdint>
#include <limits>

namespace span {

using FileId = uint32_t;
constexpr FileId kInvalidFileId = std::numeric_limits<FileId>::max();

// Half-open character range [start, end) inside one document.
struct Span {
    FileId file = kInvalidFileId;
    uint32_t start = 0;
    uint32_t end = 0;

    constexpr bool is_valid() const { return file != kInvalidFileId; }
    constexpr uint32_t length() const { return end >= start ? end - start : 0; }
    constexpr bool is_empty() const { return length() == 0; }

    constexpr bool contains(uint32_t offset) const {
        return is_valid() && start <= offset && offset < end;
    }

    static constexpr Span invalid() { return {}; }

    static constexpr Span at(uint32_t offset, FileId file = 0) {
        return {file, offset, offset};
    }

    static constexpr Span merge(const Span &lhs, const Span &rhs) {
        if (!lhs.is_valid()) return rhs;
        if (!rhs.is_valid()) return lhs;
        if (lhs.file != rhs.file) return rhs;
        return {lhs.file, std::min(lhs.start, rhs.start), std::max(lhs.end, rhs.end)};
    }

    constexpr bool operator==(const Span &) const = default;
};

} // namespace span
