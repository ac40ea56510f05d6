#include "source_tracker.hpp"
#include <algorithm>
#include <cctype>

namespace asciimath {

SourceTracker::SourceTracker(const char* source, size_t len)
    : source_(source ? source : "")
    , length_(source ? len : 0)
    , offset_(0)
{
    line_starts_.push_back(0);
    for (size_t i = 0; i < length_; ++i) {
        if (source_[i] == '\n') line_starts_.push_back(i + 1);
    }
}

size_t SourceTracker::skipSpace(size_t from) const {
    while (from < length_ && std::isspace((unsigned char)source_[from])) from++;
    return from;
}

bool SourceTracker::advanceTo(size_t offset) {
    if (offset < offset_ || offset > length_) return false;
    offset_ = offset;
    return true;
}

SourceLocation SourceTracker::locationAt(size_t offset) const {
    if (offset > length_) offset = length_;

    // last line start <= offset
    auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
    size_t line_idx = (size_t)(it - line_starts_.begin()) - 1;

    size_t column = 1;
    for (size_t i = line_starts_[line_idx]; i < offset; ++i) {
        if (((unsigned char)source_[i] & 0xC0) != 0x80) column++;
    }
    return SourceLocation(offset, line_idx + 1, column);
}

std::string SourceTracker::extractLine(size_t line) const {
    if (line < 1 || line > line_starts_.size()) return "";

    size_t start = line_starts_[line - 1];
    size_t end = line < line_starts_.size() ? line_starts_[line] : length_;
    while (end > start && (source_[end - 1] == '\n' || source_[end - 1] == '\r')) end--;
    return std::string(source_ + start, end - start);
}

} // namespace asciimath
