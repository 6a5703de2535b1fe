#include "docintel/retrieval/body_builder.hpp"
#include "docintel/logger.hpp"
#include "docintel/utils.hpp"
#include <cstring>

namespace docintel
{
namespace retrieval
{

namespace
{

bool is(const char *name, const char *expected)
{
    return std::strcmp(name, expected) == 0;
}

// Toggle elements: present without w:val means on; "false", "0" and "none" mean off
bool toggleValue(const XmlElement &element)
{
    const char *val = element.attribute("w:val");
    if (!val)
    {
        return true;
    }
    std::string value = val;
    return !(value == "false" || value == "0" || value == "none");
}

bool isSkippedSubtree(const char *name)
{
    return is(name, "mc:Fallback") || is(name, "w:txbxContent");
}

} // namespace

std::vector<Paragraph> BodyContent::flattenedParagraphs() const
{
    std::vector<Paragraph> result;
    for (const auto &element : elements)
    {
        if (element.kind == DocumentElement::Kind::Paragraph)
        {
            result.push_back(paragraphs[element.index]);
            continue;
        }
        for (const auto &row : tables[element.index].rows)
        {
            for (const auto &cell : row.cells)
            {
                result.insert(result.end(), cell.paragraphs.begin(), cell.paragraphs.end());
            }
        }
    }
    return result;
}

BodyBuilder::BodyBuilder(const RelationshipResolver *relationships)
    : relationships_(relationships)
{
}

void BodyBuilder::startElement(const XmlElement &element)
{
    const char *name = element.name();

    if (skip_depth_ > 0 || isSkippedSubtree(name))
    {
        ++skip_depth_;
        return;
    }

    if (is(name, "w:p"))
    {
        stack_.emplace_back(Paragraph());
    }
    else if (is(name, "w:r"))
    {
        Run run;
        run.hyperlink_url = activeHyperlink();
        stack_.emplace_back(std::move(run));
    }
    else if (is(name, "w:t"))
    {
        ++text_depth_;
    }
    else if (is(name, "w:tab"))
    {
        // w:tab is also a tab stop inside w:pPr/w:tabs; only runs take it as text
        if (Run *run = top<Run>())
        {
            run->text += '\t';
        }
    }
    else if (is(name, "w:br") || is(name, "w:cr"))
    {
        if (Run *run = top<Run>())
        {
            run->text += '\n';
        }
    }
    else if (is(name, "w:rPr"))
    {
        in_run_properties_ = top<Run>() != nullptr;
    }
    else if (in_run_properties_)
    {
        applyRunFormatting(name, element);
    }
    else if (is(name, "w:pStyle"))
    {
        if (Paragraph *paragraph = top<Paragraph>())
        {
            std::string style = attributeValue(element, "w:val");
            if (!style.empty())
            {
                paragraph->style = style;
            }
        }
    }
    else if (is(name, "w:numPr"))
    {
        in_numbering_properties_ = top<Paragraph>() != nullptr;
        pending_num_id_.reset();
        pending_num_level_.reset();
    }
    else if (in_numbering_properties_ && is(name, "w:numId"))
    {
        pending_num_id_ = parse_integer(attributeValue(element, "w:val"));
    }
    else if (in_numbering_properties_ && is(name, "w:ilvl"))
    {
        pending_num_level_ = parse_integer(attributeValue(element, "w:val"));
    }
    else if (is(name, "w:hyperlink"))
    {
        startHyperlink(element);
    }
    else if (is(name, "w:tbl"))
    {
        if (nearest<Table>())
        {
            ++nested_table_depth_;
        }
        else
        {
            stack_.emplace_back(Table());
        }
    }
    else if (nested_table_depth_ == 0 && is(name, "w:tr"))
    {
        stack_.emplace_back(TableRow());
    }
    else if (nested_table_depth_ == 0 && is(name, "w:tc"))
    {
        stack_.emplace_back(TableCell());
    }
}

void BodyBuilder::text(const char *value, size_t length)
{
    if (skip_depth_ > 0 || text_depth_ == 0)
    {
        return;
    }
    if (Run *run = top<Run>())
    {
        run->text.append(value, length);
    }
}

void BodyBuilder::endElement(const XmlElement &element)
{
    if (skip_depth_ > 0)
    {
        --skip_depth_;
        return;
    }

    const char *name = element.name();

    if (is(name, "w:t"))
    {
        if (text_depth_ > 0)
            --text_depth_;
    }
    else if (is(name, "w:r"))
    {
        finishRun();
    }
    else if (is(name, "w:rPr"))
    {
        in_run_properties_ = false;
    }
    else if (is(name, "w:numPr"))
    {
        if (in_numbering_properties_)
        {
            Paragraph *paragraph = top<Paragraph>();
            // numId 0 removes numbering; a missing ilvl means level 0
            if (paragraph && pending_num_id_ && *pending_num_id_ != 0)
            {
                paragraph->numbering_id = *pending_num_id_;
                paragraph->numbering_level = pending_num_level_.value_or(0);
            }
        }
        in_numbering_properties_ = false;
    }
    else if (is(name, "w:p"))
    {
        finishParagraph();
    }
    else if (is(name, "w:hyperlink"))
    {
        popTop<HyperlinkScope>();
    }
    else if (is(name, "w:tc"))
    {
        if (nested_table_depth_ == 0)
            finishCell();
    }
    else if (is(name, "w:tr"))
    {
        if (nested_table_depth_ == 0)
            finishRow();
    }
    else if (is(name, "w:tbl"))
    {
        if (nested_table_depth_ > 0)
            --nested_table_depth_;
        else
            finishTable();
    }
}

void BodyBuilder::startHyperlink(const XmlElement &element)
{
    HyperlinkScope scope;
    std::string rel_id = attributeValue(element, "r:id");
    if (!rel_id.empty() && relationships_)
    {
        scope.url = relationships_->hyperlinkTarget(rel_id);
        if (!scope.url)
        {
            Logger::logDebug("Hyperlink relationship %s not found", rel_id.c_str());
        }
    }
    if (!scope.url)
    {
        std::string anchor = attributeValue(element, "w:anchor");
        if (!anchor.empty())
        {
            scope.url = "#" + anchor;
        }
    }
    stack_.emplace_back(std::move(scope));
}

void BodyBuilder::applyRunFormatting(const char *name, const XmlElement &element)
{
    Run *run = top<Run>();
    if (!run)
    {
        return;
    }

    if (is(name, "w:b"))
    {
        run->bold = toggleValue(element);
    }
    else if (is(name, "w:i"))
    {
        run->italic = toggleValue(element);
    }
    else if (is(name, "w:u"))
    {
        run->underline = toggleValue(element);
    }
    else if (is(name, "w:strike") || is(name, "w:dstrike"))
    {
        run->strikethrough = toggleValue(element);
    }
}

std::optional<std::string> BodyBuilder::activeHyperlink()
{
    for (auto it = stack_.rbegin(); it != stack_.rend(); ++it)
    {
        if (const auto *scope = std::get_if<HyperlinkScope>(&*it))
        {
            return scope->url;
        }
        if (std::holds_alternative<Paragraph>(*it))
        {
            break;
        }
    }
    return std::nullopt;
}

void BodyBuilder::finishRun()
{
    std::optional<Run> run = popTop<Run>();
    if (!run)
    {
        return;
    }
    in_run_properties_ = false;

    if (Paragraph *paragraph = nearest<Paragraph>())
    {
        paragraph->add_run(std::move(*run));
    }
}

void BodyBuilder::finishParagraph()
{
    std::optional<Paragraph> paragraph = popTop<Paragraph>();
    if (!paragraph)
    {
        return;
    }

    if (TableCell *cell = nearest<TableCell>())
    {
        cell->paragraphs.push_back(std::move(*paragraph));
        return;
    }
    if (nearest<Table>())
    {
        Logger::logDebug("Dropping paragraph outside of a table cell");
        return;
    }

    content_.elements.push_back(DocumentElement::paragraph(content_.paragraphs.size()));
    content_.paragraphs.push_back(std::move(*paragraph));
}

void BodyBuilder::finishCell()
{
    std::optional<TableCell> cell = popTop<TableCell>();
    if (!cell)
    {
        return;
    }
    if (TableRow *row = top<TableRow>())
    {
        row->cells.push_back(std::move(*cell));
    }
}

void BodyBuilder::finishRow()
{
    std::optional<TableRow> row = popTop<TableRow>();
    if (!row)
    {
        return;
    }
    if (Table *table = top<Table>())
    {
        table->rows.push_back(std::move(*row));
    }
}

void BodyBuilder::finishTable()
{
    std::optional<Table> table = popTop<Table>();
    if (!table)
    {
        return;
    }

    content_.elements.push_back(DocumentElement::table(content_.tables.size()));
    content_.tables.push_back(std::move(*table));
}

std::string relationshipsPartFor(const std::string &part_name)
{
    size_t slash = part_name.rfind('/');
    if (slash == std::string::npos)
    {
        return "_rels/" + part_name + ".rels";
    }
    return part_name.substr(0, slash + 1) + "_rels/" + part_name.substr(slash + 1) + ".rels";
}

} // namespace retrieval
} // namespace docintel
