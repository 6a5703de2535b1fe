#ifndef DOCINTEL_MARKDOWN_RENDERER_HPP
#define DOCINTEL_MARKDOWN_RENDERER_HPP

#include "../export.hpp"
#include "docx_document.hpp"
#include <string>
#include <vector>

namespace docintel
{
namespace retrieval
{

/**
 * @brief Renders a parsed Document as Markdown
 *
 * Output depends only on `elements`, `numbering_defs` and the notes, so the
 * same Document always renders to the same bytes. Headers and footers are
 * not rendered.
 */
class DOCINTEL_API MarkdownRenderer
{
public:
    static std::string render(const Document &document);

    // Inline Markdown of a paragraph's runs. Adjacent runs with equal formatting are merged first, and
    // pieces that meet without whitespace are joined with one space as in Paragraph::to_text
    static std::string renderRuns(const std::vector<Run> &runs);

    /**
     * @brief Formats one run
     *
     * Bold and italic become ***x***, otherwise **x** or *x*; strikethrough
     * wraps that in ~~ and a hyperlink wraps everything as [..](url).
     * Whitespace at the run edges stays outside the markers.
     */
    static std::string renderRun(const Run &run);

    // GFM table; empty when the table has no rows or no columns
    static std::string renderTable(const Table &table);

    static std::string renderCellGrid(const std::vector<std::vector<std::string>> &cells);
};

} // namespace retrieval
} // namespace docintel

#endif // DOCINTEL_MARKDOWN_RENDERER_HPP
