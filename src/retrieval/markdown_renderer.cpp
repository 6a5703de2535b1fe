#include "docintel/retrieval/markdown_renderer.hpp"
#include "docintel/utils.hpp"
#include <algorithm>
#include <map>

namespace docintel
{
namespace retrieval
{

namespace
{

// Joins run text the way Paragraph::to_text does: one space between pieces that meet without whitespace
void appendRunText(std::string &out, const std::string &piece)
{
    if (piece.empty())
        return;
    if (!out.empty() && !is_ascii_space(out.back()) && !is_ascii_space(piece.front()))
        out += ' ';
    out += piece;
}

std::string cellMarkdown(const TableCell &cell)
{
    std::string text;
    for (const auto &paragraph : cell.paragraphs)
    {
        std::string rendered = MarkdownRenderer::renderRuns(paragraph.runs);
        if (rendered.empty())
            continue;
        if (!text.empty())
            text += ' ';
        text += rendered;
    }

    // Keep each row on one line and pipes out of the column structure
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text)
    {
        if (c == '|')
            escaped += "\\|";
        else if (c == '\n' || c == '\r' || c == '\t')
            escaped += ' ';
        else
            escaped += c;
    }
    return trim_copy(escaped);
}

std::string padRight(const std::string &text, size_t width)
{
    size_t length = utf8::length(text);
    if (length >= width)
        return text;
    return text + std::string(width - length, ' ');
}

std::string noteText(const Note &note)
{
    std::string text;
    for (const auto &paragraph : note.paragraphs)
    {
        std::string rendered = trim_copy(MarkdownRenderer::renderRuns(paragraph.runs));
        if (rendered.empty())
            continue;
        if (!text.empty())
            text += ' ';
        text += rendered;
    }
    return text;
}

} // namespace

std::string MarkdownRenderer::renderRun(const Run &run)
{
    const std::string &text = run.text;
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && is_ascii_space(text[begin]))
        ++begin;
    while (end > begin && is_ascii_space(text[end - 1]))
        --end;

    if (begin == end)
    {
        return text;
    }

    std::string core = text.substr(begin, end - begin);
    if (run.bold && run.italic)
        core = "***" + core + "***";
    else if (run.bold)
        core = "**" + core + "**";
    else if (run.italic)
        core = "*" + core + "*";

    if (run.strikethrough)
        core = "~~" + core + "~~";

    if (run.hyperlink_url)
        core = "[" + core + "](" + *run.hyperlink_url + ")";

    return text.substr(0, begin) + core + text.substr(end);
}

std::string MarkdownRenderer::renderRuns(const std::vector<Run> &runs)
{
    std::string result;
    size_t i = 0;
    while (i < runs.size())
    {
        Run merged = runs[i];
        size_t j = i + 1;
        while (j < runs.size() && runs[j].sameFormatting(merged))
        {
            appendRunText(merged.text, runs[j].text);
            ++j;
        }
        appendRunText(result, renderRun(merged));
        i = j;
    }
    return result;
}

std::string MarkdownRenderer::renderCellGrid(const std::vector<std::vector<std::string>> &cells)
{
    size_t columns = 0;
    for (const auto &row : cells)
        columns = std::max(columns, row.size());

    if (cells.empty() || columns == 0)
    {
        return "";
    }

    std::vector<size_t> widths(columns, 3);
    for (const auto &row : cells)
    {
        for (size_t c = 0; c < row.size(); ++c)
            widths[c] = std::max(widths[c], utf8::length(row[c]));
    }

    auto formatRow = [&](const std::vector<std::string> &row)
    {
        std::string line = "|";
        for (size_t c = 0; c < columns; ++c)
        {
            const std::string cell = c < row.size() ? row[c] : std::string();
            line += " " + padRight(cell, widths[c]) + " |";
        }
        return line;
    };

    std::string out = formatRow(cells[0]);
    out += "\n|";
    for (size_t c = 0; c < columns; ++c)
    {
        out += " " + std::string(widths[c], '-') + " |";
    }
    for (size_t r = 1; r < cells.size(); ++r)
    {
        out += "\n" + formatRow(cells[r]);
    }
    return out;
}

std::string MarkdownRenderer::renderTable(const Table &table)
{
    std::vector<std::vector<std::string>> cells;
    cells.reserve(table.rows.size());
    for (const auto &row : table.rows)
    {
        std::vector<std::string> rendered;
        rendered.reserve(row.cells.size());
        for (const auto &cell : row.cells)
            rendered.push_back(cellMarkdown(cell));
        cells.push_back(std::move(rendered));
    }
    return renderCellGrid(cells);
}

std::string MarkdownRenderer::render(const Document &document)
{
    std::string out;
    bool has_previous = false;
    bool previous_was_list = false;
    std::map<NumberingKey, int> counters;

    auto append_block = [&](const std::string &block, bool is_list)
    {
        if (has_previous)
        {
            out += (is_list && previous_was_list) ? "\n" : "\n\n";
        }
        out += block;
        has_previous = true;
        previous_was_list = is_list;
    };

    for (const auto &element : document.elements)
    {
        if (element.kind == DocumentElement::Kind::Table)
        {
            std::string table = renderTable(document.tables[element.index]);
            if (!table.empty())
            {
                append_block(table, false);
            }
            continue;
        }

        const Paragraph &paragraph = document.paragraphs[element.index];
        std::string text = trim_copy(renderRuns(paragraph.runs));
        if (text.empty())
        {
            continue;
        }

        int heading = paragraph.heading_level();
        if (heading > 0)
        {
            append_block(std::string(static_cast<size_t>(heading), '#') + " " + text, false);
        }
        else if (paragraph.is_list_item())
        {
            int64_t num_id = *paragraph.numbering_id;
            int64_t level = *paragraph.numbering_level;
            std::string indent(static_cast<size_t>(level > 0 ? level : 0) * 2, ' ');

            if (document.list_type_for(num_id, level) == ListType::Numbered)
            {
                int number = ++counters[NumberingKey(num_id, level)];
                append_block(indent + std::to_string(number) + ". " + text, true);
            }
            else
            {
                append_block(indent + "- " + text, true);
            }
        }
        else
        {
            append_block(text, false);
        }
    }

    std::string notes;
    auto append_notes = [&](const std::vector<Note> &list)
    {
        for (const auto &note : list)
        {
            if (!notes.empty())
                notes += '\n';
            notes += "[^" + note.id + "]: " + noteText(note);
        }
    };
    append_notes(document.footnotes);
    append_notes(document.endnotes);

    if (!notes.empty())
    {
        if (has_previous)
            out += "\n\n";
        out += notes;
    }

    return out;
}

} // namespace retrieval
} // namespace docintel
