#include "zw/tui/editor_buffer.hpp"
#include <algorithm>
#include <cstring>
#include "zw/tui/unicode_handler.hpp"

namespace zw::tui {

// GapBuffer Implementation

GapBuffer::GapBuffer(size_t capacity)
    : buffer_(std::max(capacity, kMinCapacity)), gap_start_(0), gap_end_(buffer_.size()) {
}

GapBuffer::GapBuffer(std::u32string_view text, size_t gap_capacity)
    : buffer_(text.size() + std::max<size_t>(gap_capacity, 1)),
      gap_start_(text.size()),
      gap_end_(buffer_.size()) {
    std::copy(text.begin(), text.end(), buffer_.begin());
}

GapBuffer GapBuffer::fromString(std::string_view utf8_text, size_t gap_capacity) {
    return GapBuffer(UnicodeHandler::decodeUtf8(utf8_text), gap_capacity);
}

GapBuffer::GapBuffer(GapBuffer&& other) noexcept
    : buffer_(std::move(other.buffer_)),
      gap_start_(other.gap_start_),
      gap_end_(other.gap_end_),
      insertions_(other.insertions_),
      deletions_(other.deletions_),
      gap_moves_(other.gap_moves_),
      growths_(other.growths_) {

    // Leave other as a valid empty buffer
    other.buffer_.clear();
    other.gap_start_ = 0;
    other.gap_end_ = 0;
    other.insertions_ = 0;
    other.deletions_ = 0;
    other.gap_moves_ = 0;
    other.growths_ = 0;
}

GapBuffer& GapBuffer::operator=(GapBuffer&& other) noexcept {
    if (this != &other) {
        buffer_ = std::move(other.buffer_);
        gap_start_ = other.gap_start_;
        gap_end_ = other.gap_end_;
        insertions_ = other.insertions_;
        deletions_ = other.deletions_;
        gap_moves_ = other.gap_moves_;
        growths_ = other.growths_;

        other.buffer_.clear();
        other.gap_start_ = 0;
        other.gap_end_ = 0;
        other.insertions_ = 0;
        other.deletions_ = 0;
        other.gap_moves_ = 0;
        other.growths_ = 0;
    }
    return *this;
}

Result<void> GapBuffer::moveGapTo(size_t position) {
    if (position > size()) {
        return makeErrorResult<void>(ErrorCode::kInvalidArgument,
            "Gap position " + std::to_string(position) + " outside [0, " +
            std::to_string(size()) + "]");
    }

    relocateGap(position);
    return {};
}

void GapBuffer::relocateGap(size_t position) {
    if (position == gap_start_) {
        return;
    }

    if (position < gap_start_) {
        // Move gap left: text between position and the gap goes after it
        size_t move_size = gap_start_ - position;
        std::memmove(buffer_.data() + gap_end_ - move_size,
                     buffer_.data() + position,
                     move_size * sizeof(char32_t));
        gap_start_ -= move_size;
        gap_end_ -= move_size;
    } else {
        // Move gap right: text after the gap comes before it
        size_t move_size = position - gap_start_;
        std::memmove(buffer_.data() + gap_start_,
                     buffer_.data() + gap_end_,
                     move_size * sizeof(char32_t));
        gap_start_ += move_size;
        gap_end_ += move_size;
    }

    gap_moves_++;
}

void GapBuffer::insertChar(char32_t ch) {
    ensureGapSize(1);
    buffer_[gap_start_] = ch;
    gap_start_++;
    insertions_++;
}

void GapBuffer::insertString(std::u32string_view text) {
    if (text.empty()) {
        return;
    }

    ensureGapSize(text.size());
    std::copy(text.begin(), text.end(), buffer_.begin() + static_cast<std::ptrdiff_t>(gap_start_));
    gap_start_ += text.size();
    insertions_ += text.size();
}

std::optional<char32_t> GapBuffer::deleteCharAfter() {
    if (gap_end_ >= buffer_.size()) {
        return std::nullopt;
    }

    char32_t deleted_char = buffer_[gap_end_];
    gap_end_++;
    deletions_++;
    return deleted_char;
}

void GapBuffer::append(std::u32string_view text) {
    relocateGap(size());
    insertString(text);
}

Result<GapBuffer> GapBuffer::splitAt(size_t position, std::u32string_view prefix) {
    auto move_result = moveGapTo(position);
    if (!move_result) {
        return std::unexpected(move_result.error());
    }

    // Everything after the gap is the tail
    std::u32string_view tail(buffer_.data() + gap_end_, buffer_.size() - gap_end_);
    std::u32string seed;
    seed.reserve(prefix.size() + tail.size());
    seed.append(prefix);
    seed.append(tail);
    GapBuffer tail_buffer(seed, kSplitGapCapacity);

    deletions_ += tail.size();
    gap_end_ = buffer_.size();

    return tail_buffer;
}

Result<char32_t> GapBuffer::getCharAt(size_t position) const {
    if (position >= size()) {
        return makeErrorResult<char32_t>(ErrorCode::kInvalidArgument,
            "Position " + std::to_string(position) + " exceeds buffer size " + std::to_string(size()));
    }
    return logicalAt(position);
}

std::u32string GapBuffer::toU32String() const {
    std::u32string result;
    result.reserve(size());
    result.append(buffer_.data(), gap_start_);
    result.append(buffer_.data() + gap_end_, buffer_.size() - gap_end_);
    return result;
}

std::string GapBuffer::toString() const {
    std::string result;
    result.reserve(size());
    for (size_t i = 0; i < gap_start_; ++i) {
        UnicodeHandler::appendUtf8(result, buffer_[i]);
    }
    for (size_t i = gap_end_; i < buffer_.size(); ++i) {
        UnicodeHandler::appendUtf8(result, buffer_[i]);
    }
    return result;
}

GapBuffer::Range GapBuffer::runes(size_t from) const {
    size_t length = size();
    if (from >= length) {
        return Range(this, length, length);
    }
    return Range(this, from, length);
}

std::vector<size_t> GapBuffer::findAll(std::u32string_view pattern) const {
    std::vector<size_t> result;
    const size_t pattern_length = pattern.size();
    const size_t length = size();
    if (pattern_length == 0 || pattern_length > length) {
        return result;
    }

    std::vector<size_t> prefix = buildPrefixTable(pattern);

    size_t matched = 0;
    for (size_t i = 0; i < length; ++i) {
        char32_t ch = logicalAt(i);
        while (matched > 0 && ch != pattern[matched]) {
            matched = prefix[matched - 1];
        }
        if (ch == pattern[matched]) {
            matched++;
        }
        if (matched == pattern_length) {
            result.push_back(i + 1 - pattern_length);
            matched = prefix[matched - 1];
        }
    }

    return result;
}

std::vector<size_t> GapBuffer::findAll(std::string_view utf8_pattern) const {
    return findAll(UnicodeHandler::decodeUtf8(utf8_pattern));
}

void GapBuffer::clear() {
    if (buffer_.size() < kMinCapacity) {
        buffer_.resize(kMinCapacity);
    }
    deletions_ += size();
    gap_start_ = 0;
    gap_end_ = buffer_.size();
}

GapBuffer::Statistics GapBuffer::getStatistics() const {
    return Statistics{
        .logical_size = size(),
        .capacity = capacity(),
        .gap_size = getGapSize(),
        .gap_position = getGapPosition(),
        .insertions = insertions_,
        .deletions = deletions_,
        .gap_moves = gap_moves_,
        .growths = growths_
    };
}

void GapBuffer::ensureGapSize(size_t required) {
    if (getGapSize() >= required) {
        return;
    }

    size_t new_capacity = std::max(buffer_.size(), kMinCapacity);
    while (new_capacity - size() < required) {
        new_capacity *= 2;
    }

    std::vector<char32_t> new_buffer(new_capacity);

    // Text before the gap stays in front, text after it moves to the end
    std::copy(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(gap_start_),
              new_buffer.begin());
    size_t after_gap_size = buffer_.size() - gap_end_;
    size_t new_gap_end = new_capacity - after_gap_size;
    std::copy(buffer_.begin() + static_cast<std::ptrdiff_t>(gap_end_), buffer_.end(),
              new_buffer.begin() + static_cast<std::ptrdiff_t>(new_gap_end));

    buffer_ = std::move(new_buffer);
    gap_end_ = new_gap_end;
    growths_++;
}

std::vector<size_t> buildPrefixTable(std::u32string_view pattern) {
    std::vector<size_t> table(pattern.size(), 0);
    size_t length = 0;
    for (size_t i = 1; i < pattern.size(); ++i) {
        while (length > 0 && pattern[i] != pattern[length]) {
            length = table[length - 1];
        }
        if (pattern[i] == pattern[length]) {
            length++;
        }
        table[i] = length;
    }
    return table;
}

// EditorBuffer Implementation

EditorBuffer::EditorBuffer() {
    ensureAtLeastOneLine();
}

void EditorBuffer::setLines(const std::vector<std::string>& lines) {
    lines_.clear();
    lines_.reserve(lines.size());
    for (const auto& line : lines) {
        lines_.push_back(GapBuffer::fromString(line, kLineGapCapacity));
    }
    ensureAtLeastOneLine();
}

Result<std::string> EditorBuffer::getLine(size_t line_index) const {
    if (line_index >= lines_.size()) {
        return makeErrorResult<std::string>(ErrorCode::kInvalidArgument, "Line index out of bounds");
    }
    return lines_[line_index].toString();
}

Result<void> EditorBuffer::splitLine(size_t line_index, size_t column, std::u32string_view indent) {
    if (line_index >= lines_.size()) {
        return makeErrorResult<void>(ErrorCode::kInvalidArgument, "Line index out of bounds");
    }

    auto tail_result = lines_[line_index].splitAt(column, indent);
    if (!tail_result) {
        return std::unexpected(tail_result.error());
    }

    lines_.insert(lines_.begin() + static_cast<std::ptrdiff_t>(line_index) + 1,
                  std::move(tail_result.value()));
    ensureAtLeastOneLine();
    return {};
}

Result<void> EditorBuffer::joinWithNext(size_t line_index) {
    if (line_index + 1 >= lines_.size()) {
        return makeErrorResult<void>(ErrorCode::kInvalidArgument, "No next line to join");
    }

    lines_[line_index].append(lines_[line_index + 1].toU32String());
    lines_.erase(lines_.begin() + static_cast<std::ptrdiff_t>(line_index) + 1);
    ensureAtLeastOneLine();
    return {};
}

std::u32string EditorBuffer::leadingWhitespace(size_t line_index) const {
    std::u32string indent;
    if (line_index >= lines_.size()) {
        return indent;
    }

    for (char32_t ch : lines_[line_index]) {
        if (!UnicodeHandler::isIndentChar(ch)) {
            break;
        }
        indent.push_back(ch);
    }
    return indent;
}

std::vector<std::string> EditorBuffer::toLines() const {
    std::vector<std::string> result;
    result.reserve(lines_.size());
    for (const auto& line : lines_) {
        result.push_back(line.toString());
    }
    return result;
}

std::string EditorBuffer::toString() const {
    std::string result;
    for (size_t i = 0; i < lines_.size(); ++i) {
        if (i > 0) {
            result += '\n';
        }
        result += lines_[i].toString();
    }
    return result;
}

size_t EditorBuffer::totalCharacters() const {
    size_t total = 0;
    for (const auto& line : lines_) {
        total += line.size();
    }
    return total;
}

void EditorBuffer::ensureAtLeastOneLine() {
    if (lines_.empty()) {
        lines_.emplace_back(GapBuffer::kDefaultCapacity);
    }
}

} // namespace zw::tui
