#include "docintel/retrieval/docx_document.hpp"
#include "docintel/retrieval/markdown_renderer.hpp"
#include "docintel/utils.hpp"
#include <cctype>

namespace docintel
{
namespace retrieval
{

namespace
{

void append_paragraph_lines(const std::vector<Paragraph> &paragraphs, std::string &out)
{
    for (const auto &paragraph : paragraphs)
    {
        std::string text = paragraph.to_text();
        if (!text.empty())
        {
            out += text;
            out += '\n';
        }
    }
}

void append_table_text(const Table &table, std::string &out)
{
    for (const auto &row : table.rows)
    {
        for (const auto &cell : row.cells)
        {
            for (const auto &paragraph : cell.paragraphs)
            {
                std::string text = paragraph.to_text();
                if (!text.empty())
                {
                    out += text;
                    out += '\t';
                }
            }
        }
        out += '\n';
    }
}

// Parses the decimal suffix of "Heading3" / "heading 3"; 0 when absent
int heading_number(const std::string &style)
{
    std::string rest;
    if (starts_with(style, "Heading") || starts_with(style, "heading"))
    {
        rest = style.substr(7);
    }
    else
    {
        return 0;
    }

    size_t pos = 0;
    while (pos < rest.size() && rest[pos] == ' ')
        ++pos;
    if (pos == rest.size())
        return 0;

    int value = 0;
    for (; pos < rest.size(); ++pos)
    {
        if (!std::isdigit(static_cast<unsigned char>(rest[pos])))
            return 0;
        value = value * 10 + (rest[pos] - '0');
        if (value > 100)
            return 100;
    }
    return value;
}

} // namespace

bool Run::sameFormatting(const Run &other) const
{
    return bold == other.bold && italic == other.italic && underline == other.underline &&
           strikethrough == other.strikethrough && hyperlink_url == other.hyperlink_url;
}

std::string Paragraph::to_text() const
{
    std::string result;
    for (const auto &run : runs)
    {
        if (run.text.empty())
        {
            continue;
        }
        if (!result.empty() && !is_ascii_space(result.back()) && !is_ascii_space(run.text.front()))
        {
            result += ' ';
        }
        result += run.text;
    }
    return result;
}

int Paragraph::heading_level() const
{
    if (!style)
    {
        return 0;
    }
    if (*style == "Title")
    {
        return 1;
    }

    int n = heading_number(*style);
    if (n <= 0)
    {
        return 0;
    }
    return n + 1 > 6 ? 6 : n + 1;
}

std::vector<std::vector<std::string>> Table::to_cells() const
{
    std::vector<std::vector<std::string>> grid;
    grid.reserve(rows.size());
    for (const auto &row : rows)
    {
        std::vector<std::string> cells;
        cells.reserve(row.cells.size());
        for (const auto &cell : row.cells)
        {
            std::string text;
            for (const auto &paragraph : cell.paragraphs)
            {
                if (!text.empty())
                    text += ' ';
                text += paragraph.to_text();
            }
            cells.push_back(trim_copy(text));
        }
        grid.push_back(std::move(cells));
    }
    return grid;
}

std::string HeaderFooter::extract_text() const
{
    std::string text;
    append_paragraph_lines(paragraphs, text);
    for (const auto &table : tables)
    {
        append_table_text(table, text);
    }
    return text;
}

bool CoreProperties::empty() const
{
    return !title && !subject && !creator && !keywords && !description && !last_modified_by &&
           !revision && !created && !modified && !category && !language;
}

std::string Document::extract_text() const
{
    std::string text;
    for (const auto &element : elements)
    {
        if (element.kind == DocumentElement::Kind::Paragraph)
        {
            std::string para_text = paragraphs[element.index].to_text();
            if (!para_text.empty())
            {
                text += para_text;
                text += '\n';
            }
        }
        else
        {
            append_table_text(tables[element.index], text);
            text += '\n';
        }
    }
    return text;
}

std::string Document::to_markdown() const
{
    return MarkdownRenderer::render(*this);
}

ListType Document::list_type_for(int64_t num_id, int64_t level) const
{
    auto it = numbering_defs.find(NumberingKey(num_id, level));
    return it == numbering_defs.end() ? ListType::Bullet : it->second;
}

} // namespace retrieval
} // namespace docintel
