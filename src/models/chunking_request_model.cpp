#include "docintel/models/chunking_request_model.hpp"
#include "docintel/logger.hpp"
#include <stdexcept>

namespace docintel
{

namespace
{

size_t readSize(const nlohmann::json &j, const char *field)
{
    const auto &value = j[field];
    if (!value.is_number_integer() || value.get<long long>() < 0)
    {
        throw std::runtime_error(std::string("Field '") + field + "' must be a non-negative integer");
    }
    return value.get<size_t>();
}

} // namespace

bool ChunkingRequest::validate() const
{
    if (!retrieval::parseChunkerType(chunker_type))
    {
        Logger::logDebug("Validation failed: chunker_type must be 'text' or 'markdown', got '%s'", chunker_type.c_str());
        return false;
    }

    if (max_characters == 0)
    {
        Logger::logDebug("Validation failed: max_characters must be greater than zero");
        return false;
    }

    if (overlap >= max_characters)
    {
        Logger::logDebug("Validation failed: overlap (%zu) must be less than max_characters (%zu)", overlap, max_characters);
        return false;
    }

    return true;
}

nlohmann::json ChunkingRequest::to_json() const
{
    nlohmann::json j;
    j["text"] = text;
    j["max_characters"] = max_characters;
    j["overlap"] = overlap;
    j["trim"] = trim;
    j["chunker_type"] = chunker_type;

    if (page_boundaries)
    {
        nlohmann::json boundaries = nlohmann::json::array();
        for (const auto &boundary : *page_boundaries)
        {
            boundaries.push_back({{"char_start", boundary.char_start},
                                  {"char_end", boundary.char_end},
                                  {"page_number", boundary.page_number}});
        }
        j["page_boundaries"] = boundaries;
    }
    return j;
}

void ChunkingRequest::from_json(const nlohmann::json &j)
{
    if (!j.is_object())
    {
        throw std::runtime_error("Chunking request must be a JSON object");
    }

    if (!j.contains("text") || !j["text"].is_string())
    {
        throw std::runtime_error("Missing or invalid 'text' field - must be a string");
    }
    text = j["text"].get<std::string>();

    if (j.contains("max_characters"))
    {
        max_characters = readSize(j, "max_characters");
    }

    if (j.contains("overlap"))
    {
        overlap = readSize(j, "overlap");
    }

    if (j.contains("trim"))
    {
        if (!j["trim"].is_boolean())
        {
            throw std::runtime_error("Field 'trim' must be a boolean");
        }
        trim = j["trim"].get<bool>();
    }

    if (j.contains("chunker_type"))
    {
        if (!j["chunker_type"].is_string())
        {
            throw std::runtime_error("Field 'chunker_type' must be a string");
        }
        chunker_type = j["chunker_type"].get<std::string>();
    }

    page_boundaries.reset();
    if (j.contains("page_boundaries") && !j["page_boundaries"].is_null())
    {
        if (!j["page_boundaries"].is_array())
        {
            throw std::runtime_error("Field 'page_boundaries' must be an array");
        }

        std::vector<retrieval::PageBoundary> boundaries;
        for (const auto &item : j["page_boundaries"])
        {
            if (!item.is_object() || !item.contains("char_start") || !item.contains("char_end") ||
                !item.contains("page_number"))
            {
                throw std::runtime_error("Each page boundary must have 'char_start', 'char_end' and 'page_number'");
            }
            boundaries.emplace_back(readSize(item, "char_start"), readSize(item, "char_end"),
                                    readSize(item, "page_number"));
        }
        page_boundaries = std::move(boundaries);
    }
}

retrieval::ChunkingConfig ChunkingRequest::toConfig() const
{
    auto type = retrieval::parseChunkerType(chunker_type);
    if (!type)
    {
        throw std::invalid_argument("Unknown chunker_type '" + chunker_type + "'");
    }

    retrieval::ChunkingConfig config;
    config.max_characters = max_characters;
    config.overlap = overlap;
    config.trim = trim;
    config.chunker_type = *type;
    return config;
}

} // namespace docintel
