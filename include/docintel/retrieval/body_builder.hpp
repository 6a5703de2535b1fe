#ifndef DOCINTEL_BODY_BUILDER_HPP
#define DOCINTEL_BODY_BUILDER_HPP

#include "../export.hpp"
#include "docx_document.hpp"
#include "relationships.hpp"
#include "xml_events.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace docintel
{
namespace retrieval
{

/**
 * @brief Paragraphs and tables of one story (body, header, note) in source order
 */
struct BodyContent
{
    std::vector<Paragraph> paragraphs;
    std::vector<Table> tables;
    std::vector<DocumentElement> elements;

    // Paragraphs in element order, table cells expanded row by row
    std::vector<Paragraph> flattenedParagraphs() const;
};

/**
 * @brief Event-driven builder for WordprocessingML story content
 *
 * Keeps an explicit stack of open frames (paragraph, run, table, row, cell,
 * hyperlink). A finished run attaches to the nearest open paragraph, a
 * finished paragraph to the nearest open cell or, outside tables, to the
 * story's top level. Tables nested inside a cell are flattened into that
 * cell. Text boxes and mc:Fallback content are skipped.
 */
class DOCINTEL_API BodyBuilder : public XmlEventHandler
{
public:
    // `relationships` resolves hyperlink r:id values; may be null
    explicit BodyBuilder(const RelationshipResolver *relationships = nullptr);

    void startElement(const XmlElement &element) override;
    void text(const char *value, size_t length) override;
    void endElement(const XmlElement &element) override;

    const BodyContent &content() const { return content_; }
    BodyContent takeContent() { return std::move(content_); }

private:
    struct HyperlinkScope
    {
        std::optional<std::string> url;
    };

    using Frame = std::variant<Paragraph, Run, Table, TableRow, TableCell, HyperlinkScope>;

    template <typename T>
    T *top()
    {
        return stack_.empty() ? nullptr : std::get_if<T>(&stack_.back());
    }

    template <typename T>
    T *nearest()
    {
        for (auto it = stack_.rbegin(); it != stack_.rend(); ++it)
        {
            if (T *frame = std::get_if<T>(&*it))
            {
                return frame;
            }
        }
        return nullptr;
    }

    template <typename T>
    std::optional<T> popTop()
    {
        T *frame = top<T>();
        if (!frame)
        {
            return std::nullopt;
        }
        T value = std::move(*frame);
        stack_.pop_back();
        return value;
    }

    void startHyperlink(const XmlElement &element);
    void applyRunFormatting(const char *name, const XmlElement &element);
    void finishRun();
    void finishParagraph();
    void finishCell();
    void finishRow();
    void finishTable();
    std::optional<std::string> activeHyperlink();

    const RelationshipResolver *relationships_;
    BodyContent content_;
    std::vector<Frame> stack_;

    size_t skip_depth_ = 0;
    size_t nested_table_depth_ = 0;
    size_t text_depth_ = 0;
    bool in_run_properties_ = false;
    bool in_numbering_properties_ = false;
    std::optional<int64_t> pending_num_id_;
    std::optional<int64_t> pending_num_level_;
};

// "word/document.xml" -> "word/_rels/document.xml.rels"
DOCINTEL_API std::string relationshipsPartFor(const std::string &part_name);

} // namespace retrieval
} // namespace docintel

#endif // DOCINTEL_BODY_BUILDER_HPP
