#ifndef DOCINTEL_TEXT_SPLITTER_HPP
#define DOCINTEL_TEXT_SPLITTER_HPP

#include "../export.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace docintel
{
namespace retrieval
{

/**
 * @brief Greedy boundary-aware splitter over code points
 *
 * Derived classes rank the positions where a chunk may end. Each chunk takes
 * as much text as fits in `max_characters`, ending at the highest-ranked break
 * inside that window (the last one when several share the rank). Without any
 * break the window is cut at the character limit.
 */
class DOCINTEL_API ChunkSplitter
{
public:
    ChunkSplitter(size_t max_characters, size_t overlap, bool trim);
    virtual ~ChunkSplitter() = default;

    // Chunk contents in source order; empty text yields no chunks
    std::vector<std::string> split(const std::string &text) const;

    size_t maxCharacters() const { return max_characters_; }
    size_t overlap() const { return overlap_; }
    bool trim() const { return trim_; }

    static bool isWhitespace(char32_t c);

protected:
    // Break ranks; index i means "a chunk may end before code point i"
    static constexpr int8_t kNoBreak = -1;
    static constexpr int8_t kWordBreak = 1;
    static constexpr int8_t kSentenceBreak = 2;
    static constexpr int8_t kLineBreak = 8;
    static constexpr int8_t kParagraphBreak = 10;

    virtual std::vector<int8_t> findBreaks(const std::vector<char32_t> &text) const = 0;

    // Word and sentence starts, shared by every mode
    static void addInlineBreaks(const std::vector<char32_t> &text, std::vector<int8_t> &breaks);

    static void mark(std::vector<int8_t> &breaks, size_t position, int8_t rank);

private:
    size_t chooseEnd(const std::vector<int8_t> &breaks, size_t start, size_t min_end, size_t limit) const;
    size_t overlapStart(const std::vector<int8_t> &breaks, size_t content_end) const;

    size_t max_characters_;
    size_t overlap_;
    bool trim_;
};

/**
 * @brief Plain text mode: prefers paragraph, then line, sentence and word breaks
 */
class DOCINTEL_API TextSplitter : public ChunkSplitter
{
public:
    using ChunkSplitter::ChunkSplitter;

protected:
    std::vector<int8_t> findBreaks(const std::vector<char32_t> &text) const override;
};

/**
 * @brief Markdown mode
 *
 * Breaks before headings (higher levels rank higher), around code fences and
 * thematic breaks, and between blocks, list items and table rows. Lines inside
 * a fenced code block only get a weak line break so fences stay together when
 * they fit.
 */
class DOCINTEL_API MarkdownSplitter : public ChunkSplitter
{
public:
    using ChunkSplitter::ChunkSplitter;

protected:
    std::vector<int8_t> findBreaks(const std::vector<char32_t> &text) const override;

private:
    static constexpr int8_t kFenceLineBreak = 3;
    static constexpr int8_t kFenceBreak = 12;
    static constexpr int8_t kHeadingBreakBase = 20;
};

} // namespace retrieval
} // namespace docintel

#endif // DOCINTEL_TEXT_SPLITTER_HPP
