#include "docintel/retrieval/text_splitter.hpp"
#include "docintel/utils.hpp"
#include <utility>

namespace docintel
{
namespace retrieval
{

namespace
{

struct DecodedText
{
    std::vector<char32_t> code_points;
    std::vector<size_t> byte_offsets; // one per code point plus the end offset
};

DecodedText decodeText(const std::string &text)
{
    DecodedText decoded;
    decoded.code_points.reserve(text.size());
    decoded.byte_offsets.reserve(text.size() + 1);

    size_t pos = 0;
    while (pos < text.size())
    {
        decoded.byte_offsets.push_back(pos);
        decoded.code_points.push_back(utf8::decode(text, pos));
    }
    decoded.byte_offsets.push_back(text.size());
    return decoded;
}

bool isSentenceTerminator(char32_t c)
{
    return c == U'.' || c == U'!' || c == U'?' || c == 0x2026;
}

bool isClosingPunctuation(char32_t c)
{
    return c == U'"' || c == U'\'' || c == U')' || c == U']' || c == 0x201D || c == 0x2019;
}

// [begin, end) of each line, excluding the '\n'
std::vector<std::pair<size_t, size_t>> splitLines(const std::vector<char32_t> &text)
{
    std::vector<std::pair<size_t, size_t>> lines;
    size_t start = 0;
    for (size_t i = 0; i < text.size(); ++i)
    {
        if (text[i] == U'\n')
        {
            lines.emplace_back(start, i);
            start = i + 1;
        }
    }
    if (start < text.size())
        lines.emplace_back(start, text.size());
    return lines;
}

bool isBlankLine(const std::vector<char32_t> &text, size_t begin, size_t end)
{
    for (size_t i = begin; i < end; ++i)
    {
        if (!ChunkSplitter::isWhitespace(text[i]))
            return false;
    }
    return true;
}

// Skips the up to three spaces of indentation Markdown allows before block markers
size_t blockStart(const std::vector<char32_t> &text, size_t begin, size_t end)
{
    size_t i = begin;
    while (i < end && i - begin < 3 && text[i] == U' ')
        ++i;
    return i;
}

size_t countRepeated(const std::vector<char32_t> &text, size_t begin, size_t end, char32_t c)
{
    size_t count = 0;
    while (begin + count < end && text[begin + count] == c)
        ++count;
    return count;
}

// ATX heading level, 0 when the line is not a heading
int headingLevel(const std::vector<char32_t> &text, size_t begin, size_t end)
{
    size_t hashes = countRepeated(text, begin, end, U'#');
    if (hashes == 0 || hashes > 6)
        return 0;
    if (begin + hashes < end && text[begin + hashes] != U' ' && text[begin + hashes] != U'\t')
        return 0;
    return static_cast<int>(hashes);
}

bool isThematicBreak(const std::vector<char32_t> &text, size_t begin, size_t end)
{
    char32_t marker = 0;
    size_t count = 0;
    for (size_t i = begin; i < end; ++i)
    {
        char32_t c = text[i];
        if (c == U' ' || c == U'\t' || c == U'\r')
            continue;
        if (c != U'-' && c != U'*' && c != U'_')
            return false;
        if (marker == 0)
            marker = c;
        else if (c != marker)
            return false;
        ++count;
    }
    return count >= 3;
}

} // namespace

ChunkSplitter::ChunkSplitter(size_t max_characters, size_t overlap, bool trim)
    : max_characters_(max_characters), overlap_(overlap), trim_(trim)
{
}

bool ChunkSplitter::isWhitespace(char32_t c)
{
    switch (c)
    {
    case 0x09:
    case 0x0A:
    case 0x0B:
    case 0x0C:
    case 0x0D:
    case 0x20:
    case 0x85:
    case 0xA0:
    case 0x1680:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x205F:
    case 0x3000:
        return true;
    default:
        return c >= 0x2000 && c <= 0x200A;
    }
}

void ChunkSplitter::mark(std::vector<int8_t> &breaks, size_t position, int8_t rank)
{
    if (position == 0 || position >= breaks.size())
        return;
    if (breaks[position] < rank)
        breaks[position] = rank;
}

void ChunkSplitter::addInlineBreaks(const std::vector<char32_t> &text, std::vector<int8_t> &breaks)
{
    for (size_t i = 1; i < text.size(); ++i)
    {
        if (!isWhitespace(text[i - 1]) || isWhitespace(text[i]))
            continue;

        mark(breaks, i, kWordBreak);

        size_t j = i - 1;
        while (j > 0 && isWhitespace(text[j]))
            --j;
        while (j > 0 && isClosingPunctuation(text[j]))
            --j;
        if (isSentenceTerminator(text[j]))
            mark(breaks, i, kSentenceBreak);
    }
}

size_t ChunkSplitter::chooseEnd(const std::vector<int8_t> &breaks, size_t start, size_t min_end, size_t limit) const
{
    size_t lower = min_end > start ? min_end : start;
    int8_t best_rank = kNoBreak;
    size_t best = limit;

    for (size_t p = lower + 1; p <= limit; ++p)
    {
        if (breaks[p] != kNoBreak && breaks[p] >= best_rank)
        {
            best_rank = breaks[p];
            best = p;
        }
    }
    return best;
}

size_t ChunkSplitter::overlapStart(const std::vector<int8_t> &breaks, size_t content_end) const
{
    // First word start inside the overlap window, else the exact character position
    size_t candidate = content_end - overlap_;
    for (size_t p = candidate; p < content_end; ++p)
    {
        if (breaks[p] >= kWordBreak)
            return p;
    }
    return candidate;
}

std::vector<std::string> ChunkSplitter::split(const std::string &text) const
{
    std::vector<std::string> segments;
    if (text.empty())
    {
        return segments;
    }

    const DecodedText decoded = decodeText(text);
    const std::vector<char32_t> &cps = decoded.code_points;
    std::vector<int8_t> breaks = findBreaks(cps);
    breaks.resize(cps.size() + 1, kNoBreak);

    size_t text_end = cps.size();
    if (trim_)
    {
        while (text_end > 0 && isWhitespace(cps[text_end - 1]))
            --text_end;
    }

    size_t pos = 0;
    size_t previous_end = 0;
    while (pos < text_end)
    {
        size_t start = pos;
        if (trim_)
        {
            while (start < text_end && isWhitespace(cps[start]))
                ++start;
        }
        if (start >= text_end)
            break;

        // Each chunk has to reach past the content of the previous one
        size_t fresh = previous_end;
        if (trim_)
        {
            while (fresh < text_end && isWhitespace(cps[fresh]))
                ++fresh;
        }

        size_t limit = start + max_characters_;
        if (fresh >= limit)
        {
            start = fresh;
            limit = start + max_characters_;
        }
        size_t end = limit >= text_end ? text_end : chooseEnd(breaks, start, fresh, limit);

        size_t content_end = end;
        if (trim_)
        {
            while (content_end > start && isWhitespace(cps[content_end - 1]))
                --content_end;
        }

        segments.push_back(text.substr(decoded.byte_offsets[start],
                                       decoded.byte_offsets[content_end] - decoded.byte_offsets[start]));

        if (end >= text_end)
            break;

        previous_end = content_end;
        if (overlap_ > 0 && content_end - start > overlap_)
            pos = overlapStart(breaks, content_end);
        else
            pos = end;
    }

    return segments;
}

std::vector<int8_t> TextSplitter::findBreaks(const std::vector<char32_t> &text) const
{
    std::vector<int8_t> breaks(text.size() + 1, kNoBreak);
    addInlineBreaks(text, breaks);

    bool seen_content = false;
    for (const auto &line : splitLines(text))
    {
        if (isBlankLine(text, line.first, line.second))
        {
            if (seen_content)
                mark(breaks, line.second + 1, kParagraphBreak);
            continue;
        }
        seen_content = true;
        mark(breaks, line.second + 1, kLineBreak);
    }
    return breaks;
}

std::vector<int8_t> MarkdownSplitter::findBreaks(const std::vector<char32_t> &text) const
{
    std::vector<int8_t> breaks(text.size() + 1, kNoBreak);
    addInlineBreaks(text, breaks);

    bool in_fence = false;
    char32_t fence_char = 0;
    size_t fence_length = 0;
    bool previous_blank = false;

    for (const auto &line : splitLines(text))
    {
        const size_t line_start = line.first;
        const size_t line_end = line.second;
        const size_t block = blockStart(text, line_start, line_end);

        size_t backticks = countRepeated(text, block, line_end, U'`');
        size_t tildes = countRepeated(text, block, line_end, U'~');
        bool is_fence_line = backticks >= 3 || tildes >= 3;

        if (in_fence)
        {
            size_t run = fence_char == U'`' ? backticks : tildes;
            if (is_fence_line && run >= fence_length && isBlankLine(text, block + run, line_end))
            {
                in_fence = false;
                mark(breaks, line_start, kFenceLineBreak);
                mark(breaks, line_end + 1, kFenceBreak);
            }
            else
            {
                mark(breaks, line_start, kFenceLineBreak);
            }
            previous_blank = false;
            continue;
        }

        if (is_fence_line)
        {
            in_fence = true;
            fence_char = backticks >= 3 ? U'`' : U'~';
            fence_length = backticks >= 3 ? backticks : tildes;
            mark(breaks, line_start, kFenceBreak);
            previous_blank = false;
            continue;
        }

        if (isBlankLine(text, line_start, line_end))
        {
            previous_blank = true;
            continue;
        }

        int level = headingLevel(text, block, line_end);
        if (level > 0)
        {
            mark(breaks, line_start, static_cast<int8_t>(kHeadingBreakBase - level));
        }
        else if (isThematicBreak(text, block, line_end))
        {
            mark(breaks, line_start, kFenceBreak);
            mark(breaks, line_end + 1, kFenceBreak);
        }

        // List items, table rows and plain lines all start at a line boundary
        mark(breaks, line_start, previous_blank ? kParagraphBreak : kLineBreak);
        previous_blank = false;
    }
    return breaks;
}

} // namespace retrieval
} // namespace docintel
