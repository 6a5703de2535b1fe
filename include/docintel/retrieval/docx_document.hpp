#ifndef DOCINTEL_DOCX_DOCUMENT_HPP
#define DOCINTEL_DOCX_DOCUMENT_HPP

#include "../export.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace docintel
{
namespace retrieval
{

enum class ListType
{
    Bullet,
    Numbered
};

enum class HeaderFooterType
{
    Default,
    First,
    Even,
    Odd
};

enum class NoteType
{
    Footnote,
    Endnote
};

/**
 * @brief A span of text sharing one formatting state
 */
struct DOCINTEL_API Run
{
    std::string text;
    bool bold = false;
    bool italic = false;
    bool underline = false;
    bool strikethrough = false;
    std::optional<std::string> hyperlink_url;

    Run() = default;
    explicit Run(std::string t) : text(std::move(t)) {}

    // Same formatting and link target, text ignored
    bool sameFormatting(const Run &other) const;
};

struct DOCINTEL_API Paragraph
{
    std::vector<Run> runs;
    std::optional<std::string> style;
    std::optional<int64_t> numbering_id;
    std::optional<int64_t> numbering_level;

    /**
     * @brief Joins non-empty runs, inserting one space where neither side
     * already carries whitespace at the junction
     */
    std::string to_text() const;

    void add_run(Run run) { runs.push_back(std::move(run)); }

    bool is_list_item() const { return numbering_id.has_value() && numbering_level.has_value(); }

    /**
     * @brief Markdown heading level derived from the style, 0 when not a heading
     *
     * "Title" maps to 1, "HeadingN" to N + 1, clamped to 6.
     */
    int heading_level() const;
};

struct TableCell
{
    std::vector<Paragraph> paragraphs;
};

struct TableRow
{
    std::vector<TableCell> cells;
};

struct DOCINTEL_API Table
{
    std::vector<TableRow> rows;

    // Plain cell grid, each cell's paragraphs joined with a space and trimmed
    std::vector<std::vector<std::string>> to_cells() const;
};

struct ListItem
{
    uint32_t level = 0;
    ListType list_type = ListType::Bullet;
    std::string text;
};

struct DOCINTEL_API HeaderFooter
{
    std::vector<Paragraph> paragraphs;
    std::vector<Table> tables;
    HeaderFooterType header_type = HeaderFooterType::Default;

    std::string extract_text() const;
};

struct Note
{
    std::string id;
    NoteType note_type = NoteType::Footnote;
    std::vector<Paragraph> paragraphs;
};

/**
 * @brief Reference into Document::paragraphs or Document::tables, in body order
 */
struct DocumentElement
{
    enum class Kind
    {
        Paragraph,
        Table
    };

    Kind kind;
    size_t index;

    static DocumentElement paragraph(size_t idx) { return DocumentElement{Kind::Paragraph, idx}; }
    static DocumentElement table(size_t idx) { return DocumentElement{Kind::Table, idx}; }

    bool operator==(const DocumentElement &other) const { return kind == other.kind && index == other.index; }
    bool operator!=(const DocumentElement &other) const { return !(*this == other); }
};

/**
 * @brief Package metadata from docProps/core.xml; absent fields stay empty
 */
struct CoreProperties
{
    std::optional<std::string> title;
    std::optional<std::string> subject;
    std::optional<std::string> creator;
    std::optional<std::string> keywords;
    std::optional<std::string> description;
    std::optional<std::string> last_modified_by;
    std::optional<std::string> revision;
    std::optional<std::string> created;
    std::optional<std::string> modified;
    std::optional<std::string> category;
    std::optional<std::string> language;

    bool empty() const;
};

using NumberingKey = std::pair<int64_t, int64_t>;
using NumberingDefinitions = std::map<NumberingKey, ListType>;

/**
 * @brief Structural model of a parsed DOCX package
 *
 * Built once per parse call and not modified afterwards. `elements` keeps the
 * interleaving of top-level paragraphs and tables; headers, footers and notes
 * are kept apart and never referenced from `elements`.
 */
struct DOCINTEL_API Document
{
    std::vector<Paragraph> paragraphs;
    std::vector<Table> tables;
    std::vector<ListItem> lists;
    std::vector<HeaderFooter> headers;
    std::vector<HeaderFooter> footers;
    std::vector<Note> footnotes;
    std::vector<Note> endnotes;
    NumberingDefinitions numbering_defs;
    std::vector<DocumentElement> elements;
    CoreProperties properties;

    // Plain text in element order: paragraphs end with '\n', cells with '\t'
    std::string extract_text() const;

    // See MarkdownRenderer
    std::string to_markdown() const;

    ListType list_type_for(int64_t num_id, int64_t level) const;
};

} // namespace retrieval
} // namespace docintel

#endif // DOCINTEL_DOCX_DOCUMENT_HPP
