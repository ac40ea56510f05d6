#pragma once
#ifndef ASCIIMATH_SOURCE_TRACKER_HPP
#define ASCIIMATH_SOURCE_TRACKER_HPP

#include "parse_error.hpp"
#include <string>
#include <vector>
#include <cstddef>

namespace asciimath {

// Forward-only cursor over notation text. Line starts are indexed once at
// construction; locations are derived from byte offsets on demand.
// Columns count UTF-8 code points, not bytes
class SourceTracker {
private:
    const char* source_;            // not owned
    size_t length_;
    size_t offset_;
    std::vector<size_t> line_starts_;

public:
    SourceTracker(const char* source, size_t len);

    SourceTracker(const SourceTracker&) = delete;
    SourceTracker& operator=(const SourceTracker&) = delete;

    const char* data() const { return source_; }
    size_t length() const { return length_; }
    size_t offset() const { return offset_; }
    size_t lineCount() const { return line_starts_.size(); }

    // First offset at or after `from` holding a non-whitespace byte
    size_t skipSpace(size_t from) const;

    // Move the cursor forward; false when offset is behind it or past the end
    bool advanceTo(size_t offset);

    // Line and column of a byte offset, clamped to the text length
    SourceLocation locationAt(size_t offset) const;
    SourceLocation location() const { return locationAt(offset_); }

    // 1-based line without its terminator, "" when out of range
    std::string extractLine(size_t line) const;
};

} // namespace asciimath

#endif // ASCIIMATH_SOURCE_TRACKER_HPP
