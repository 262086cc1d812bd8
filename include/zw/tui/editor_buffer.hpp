#pragma once

#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "zw/common.hpp"

namespace zw::tui {

/**
 * @brief Gap buffer holding the content of a single line
 *
 * The buffer is one contiguous array of code points with an unused "gap"
 * [gap_start_, gap_end_) parked at the edit position. Logical content is
 * buffer_[0, gap_start_) followed by buffer_[gap_end_, capacity). Insertion
 * and deletion at the gap are O(1) (amortized for insertion, which doubles
 * the capacity when the gap runs out); moving the gap costs O(distance).
 *
 * Positions in the public interface are logical code point offsets.
 */
class GapBuffer {
public:
    static constexpr size_t kMinCapacity = 2;
    static constexpr size_t kDefaultCapacity = 64;
    static constexpr size_t kSplitGapCapacity = 32;

    /**
     * @brief Forward iterator over the logical content, skipping the gap
     */
    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = char32_t;
        using difference_type = std::ptrdiff_t;
        using pointer = const char32_t*;
        using reference = char32_t;

        const_iterator() = default;
        const_iterator(const GapBuffer* buffer, size_t position)
            : buffer_(buffer), position_(position) {}

        char32_t operator*() const { return buffer_->logicalAt(position_); }

        const_iterator& operator++() {
            ++position_;
            return *this;
        }

        const_iterator operator++(int) {
            const_iterator previous = *this;
            ++position_;
            return previous;
        }

        bool operator==(const const_iterator& other) const {
            return buffer_ == other.buffer_ && position_ == other.position_;
        }

        // Logical offset of the element this iterator points at
        size_t position() const { return position_; }

    private:
        const GapBuffer* buffer_ = nullptr;
        size_t position_ = 0;
    };

    /**
     * @brief Lazy, restartable view of the content from a starting offset
     *
     * Holds only a pointer to the buffer. It is invalidated by any mutation
     * of the buffer, like a standard container iterator.
     */
    class Range {
    public:
        Range(const GapBuffer* buffer, size_t first, size_t last)
            : buffer_(buffer), first_(first), last_(last) {}

        const_iterator begin() const { return {buffer_, first_}; }
        const_iterator end() const { return {buffer_, last_}; }
        bool empty() const { return first_ == last_; }
        size_t size() const { return last_ - first_; }

    private:
        const GapBuffer* buffer_;
        size_t first_;
        size_t last_;
    };

    /**
     * @brief Create an empty buffer
     * @param capacity Initial capacity, clamped to at least kMinCapacity.
     *                 The gap spans the whole buffer.
     */
    explicit GapBuffer(size_t capacity = kDefaultCapacity);

    /**
     * @brief Create a buffer holding text with the gap after it
     * @param text Initial content
     * @param gap_capacity Gap size, clamped to at least 1. Total capacity is
     *                     text.size() + gap_capacity.
     */
    GapBuffer(std::u32string_view text, size_t gap_capacity);

    /**
     * @brief Create a buffer from UTF-8 text
     */
    static GapBuffer fromString(std::string_view utf8_text, size_t gap_capacity);

    GapBuffer(const GapBuffer&) = delete;
    GapBuffer& operator=(const GapBuffer&) = delete;
    GapBuffer(GapBuffer&& other) noexcept;
    GapBuffer& operator=(GapBuffer&& other) noexcept;

    /**
     * @brief Move the gap so that it starts at position
     * @param position Target offset, must be within [0, size()]
     * @return kInvalidArgument if position is out of range; the buffer is
     *         left untouched in that case
     */
    Result<void> moveGapTo(size_t position);

    /**
     * @brief Insert a code point at the gap and advance past it
     */
    void insertChar(char32_t ch);

    /**
     * @brief Insert a run of code points at the gap
     */
    void insertString(std::u32string_view text);

    /**
     * @brief Delete the code point immediately after the gap
     * @return The deleted code point, or std::nullopt at end of content
     */
    std::optional<char32_t> deleteCharAfter();

    /**
     * @brief Append code points at the end of the content
     *
     * Leaves the gap at the end of the content.
     */
    void append(std::u32string_view text);

    /**
     * @brief Cut the content at position
     *
     * Everything from position to the end is removed from this buffer and
     * returned as a new buffer, preceded by prefix, with a gap of
     * kSplitGapCapacity after it.
     * @param position Split offset within [0, size()]
     * @param prefix Text placed in front of the tail in the new buffer
     * @return The new buffer or kInvalidArgument
     */
    Result<GapBuffer> splitAt(size_t position, std::u32string_view prefix = {});

    /**
     * @brief Get code point at position
     * @return Code point or kInvalidArgument if position >= size()
     */
    Result<char32_t> getCharAt(size_t position) const;

    std::u32string toU32String() const;

    /**
     * @brief Content encoded as UTF-8
     */
    std::string toString() const;

    /**
     * @brief Iterate the content from an offset to the end
     *
     * An offset past the end yields an empty range.
     */
    Range runes(size_t from = 0) const;

    const_iterator begin() const { return {this, 0}; }
    const_iterator end() const { return {this, size()}; }

    /**
     * @brief Find all (possibly overlapping) occurrences of pattern
     *
     * Knuth-Morris-Pratt over the logical content, O(size() + pattern.size()).
     * @return Ascending start offsets; empty for an empty pattern or one
     *         longer than the content
     */
    std::vector<size_t> findAll(std::u32string_view pattern) const;
    std::vector<size_t> findAll(std::string_view utf8_pattern) const;

    // Number of code points stored, excluding the gap
    size_t size() const { return gap_start_ + (buffer_.size() - gap_end_); }
    bool empty() const { return size() == 0; }

    size_t capacity() const { return buffer_.size(); }
    size_t getGapPosition() const { return gap_start_; }
    size_t getGapSize() const { return gap_end_ - gap_start_; }

    /**
     * @brief Drop all content, keeping the allocation
     */
    void clear();

    struct Statistics {
        size_t logical_size;
        size_t capacity;
        size_t gap_size;
        size_t gap_position;
        size_t insertions;
        size_t deletions;
        size_t gap_moves;
        size_t growths;
    };

    Statistics getStatistics() const;

private:
    std::vector<char32_t> buffer_;
    size_t gap_start_;
    size_t gap_end_;

    size_t insertions_ = 0;
    size_t deletions_ = 0;
    size_t gap_moves_ = 0;
    size_t growths_ = 0;

    // Double the capacity until the gap holds at least required code points
    void ensureGapSize(size_t required);

    // Gap relocation for positions already known to be valid
    void relocateGap(size_t position);

    char32_t logicalAt(size_t position) const {
        return position < gap_start_ ? buffer_[position]
                                     : buffer_[position + (gap_end_ - gap_start_)];
    }
};

/**
 * @brief KMP prefix function for pattern
 *
 * table[i] is the length of the longest proper prefix of pattern[0..i]
 * that is also a suffix of it.
 */
std::vector<size_t> buildPrefixTable(std::u32string_view pattern);

/**
 * @brief Document made of one GapBuffer per line
 *
 * Per-line buffers make intra-line edits cost O(line length) to relocate the
 * gap while line insertion and removal never touch the text of other lines.
 * The document always holds at least one line.
 */
class EditorBuffer {
public:
    // Gap given to each line loaded through setLines
    static constexpr size_t kLineGapCapacity = 4;

    EditorBuffer();

    /**
     * @brief Replace the whole document, one buffer per UTF-8 line
     *
     * An empty list yields a single empty line.
     */
    void setLines(const std::vector<std::string>& lines);

    size_t getLineCount() const { return lines_.size(); }

    /**
     * @brief Get line content as UTF-8
     * @return Line content or kInvalidArgument for a bad index
     */
    Result<std::string> getLine(size_t line_index) const;

    // Length in code points, 0 for a bad index
    size_t lineLength(size_t line_index) const {
        return line_index < lines_.size() ? lines_[line_index].size() : 0;
    }

    /**
     * @brief Buffer backing a line
     * @throws std::out_of_range for a bad index
     */
    GapBuffer& line(size_t line_index) { return lines_.at(line_index); }
    const GapBuffer& line(size_t line_index) const { return lines_.at(line_index); }

    /**
     * @brief Split a line in two at column
     *
     * The text right of column moves into a new line inserted below,
     * prefixed with indent.
     * @return kInvalidArgument for a bad line index or column
     */
    Result<void> splitLine(size_t line_index, size_t column, std::u32string_view indent = {});

    /**
     * @brief Append the following line onto line_index and remove it
     * @return kInvalidArgument when line_index has no following line
     */
    Result<void> joinWithNext(size_t line_index);

    /**
     * @brief Leading run of spaces and tabs of a line, verbatim
     */
    std::u32string leadingWhitespace(size_t line_index) const;

    std::vector<std::string> toLines() const;

    /**
     * @brief Lines joined with '\n'
     */
    std::string toString() const;

    size_t totalCharacters() const;

private:
    std::vector<GapBuffer> lines_;

    // Restores the single-empty-line document whenever a mutation leaves none
    void ensureAtLeastOneLine();
};

} // namespace zw::tui
