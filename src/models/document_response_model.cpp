#include "docintel/models/document_response_model.hpp"
#include "docintel/retrieval/markdown_renderer.hpp"
#include "docintel/logger.hpp"
#include "docintel/utils.hpp"
#include <stdexcept>

namespace docintel
{

namespace
{

std::string noteText(const retrieval::Note &note)
{
    std::string text;
    for (const auto &paragraph : note.paragraphs)
    {
        std::string line = trim_copy(paragraph.to_text());
        if (line.empty())
            continue;
        if (!text.empty())
            text += ' ';
        text += line;
    }
    return text;
}

void addNotes(const std::vector<retrieval::Note> &notes, const char *type, std::vector<NoteData> &out)
{
    for (const auto &note : notes)
    {
        out.push_back(NoteData{note.id, type, noteText(note)});
    }
}

void addProperty(std::map<std::string, std::string> &out, const char *name, const std::optional<std::string> &value)
{
    if (value)
        out[name] = *value;
}

std::vector<std::string> readStringArray(const nlohmann::json &j, const char *field)
{
    std::vector<std::string> values;
    if (!j.contains(field))
        return values;
    if (!j[field].is_array())
    {
        throw std::runtime_error(std::string("Field '") + field + "' must be an array of strings");
    }
    for (const auto &item : j[field])
    {
        if (!item.is_string())
        {
            throw std::runtime_error(std::string("Field '") + field + "' must be an array of strings");
        }
        values.push_back(item.get<std::string>());
    }
    return values;
}

} // namespace

DocumentResponse DocumentResponse::fromDocument(const retrieval::Document &document)
{
    DocumentResponse response;
    response.markdown = document.to_markdown();
    response.text = document.extract_text();

    for (const auto &table : document.tables)
    {
        response.tables.push_back(TableData{table.to_cells(), retrieval::MarkdownRenderer::renderTable(table)});
    }
    for (const auto &header : document.headers)
    {
        response.headers.push_back(header.extract_text());
    }
    for (const auto &footer : document.footers)
    {
        response.footers.push_back(footer.extract_text());
    }

    addNotes(document.footnotes, "footnote", response.notes);
    addNotes(document.endnotes, "endnote", response.notes);

    const retrieval::CoreProperties &props = document.properties;
    addProperty(response.properties, "title", props.title);
    addProperty(response.properties, "subject", props.subject);
    addProperty(response.properties, "creator", props.creator);
    addProperty(response.properties, "keywords", props.keywords);
    addProperty(response.properties, "description", props.description);
    addProperty(response.properties, "last_modified_by", props.last_modified_by);
    addProperty(response.properties, "revision", props.revision);
    addProperty(response.properties, "created", props.created);
    addProperty(response.properties, "modified", props.modified);
    addProperty(response.properties, "category", props.category);
    addProperty(response.properties, "language", props.language);

    return response;
}

bool DocumentResponse::validate() const
{
    for (size_t i = 0; i < notes.size(); ++i)
    {
        if (notes[i].type != "footnote" && notes[i].type != "endnote")
        {
            Logger::logDebug("Validation failed: note %zu has type '%s'", i, notes[i].type.c_str());
            return false;
        }
        if (notes[i].id == "-1" || notes[i].id == "0")
        {
            Logger::logDebug("Validation failed: note %zu uses separator id '%s'", i, notes[i].id.c_str());
            return false;
        }
    }
    return true;
}

nlohmann::json DocumentResponse::to_json() const
{
    nlohmann::json j;
    j["markdown"] = markdown;
    j["text"] = text;

    nlohmann::json tables_array = nlohmann::json::array();
    for (const auto &table : tables)
    {
        tables_array.push_back({{"cells", table.cells}, {"markdown", table.markdown}});
    }
    j["tables"] = tables_array;
    j["headers"] = headers;
    j["footers"] = footers;

    nlohmann::json notes_array = nlohmann::json::array();
    for (const auto &note : notes)
    {
        notes_array.push_back({{"id", note.id}, {"type", note.type}, {"text", note.text}});
    }
    j["notes"] = notes_array;
    j["properties"] = properties;
    return j;
}

void DocumentResponse::from_json(const nlohmann::json &j)
{
    if (!j.contains("markdown") || !j["markdown"].is_string())
    {
        throw std::runtime_error("Missing or invalid 'markdown' field - must be a string");
    }
    markdown = j["markdown"].get<std::string>();
    text = j.value("text", std::string());

    tables.clear();
    if (j.contains("tables"))
    {
        if (!j["tables"].is_array())
        {
            throw std::runtime_error("Field 'tables' must be an array");
        }
        for (const auto &item : j["tables"])
        {
            TableData table;
            table.cells = item.value("cells", std::vector<std::vector<std::string>>());
            table.markdown = item.value("markdown", std::string());
            tables.push_back(std::move(table));
        }
    }

    headers = readStringArray(j, "headers");
    footers = readStringArray(j, "footers");

    notes.clear();
    if (j.contains("notes"))
    {
        if (!j["notes"].is_array())
        {
            throw std::runtime_error("Field 'notes' must be an array");
        }
        for (const auto &item : j["notes"])
        {
            notes.push_back(NoteData{item.value("id", std::string()), item.value("type", std::string("footnote")),
                                     item.value("text", std::string())});
        }
    }

    properties.clear();
    if (j.contains("properties") && j["properties"].is_object())
    {
        for (auto it = j["properties"].begin(); it != j["properties"].end(); ++it)
        {
            if (it.value().is_string())
                properties[it.key()] = it.value().get<std::string>();
        }
    }
}

} // namespace docintel
