#include "docintel/models/chunking_response_model.hpp"
#include "docintel/logger.hpp"
#include <stdexcept>

namespace docintel
{

ChunkData::ChunkData(const retrieval::Chunk &chunk)
    : content(chunk.content),
      char_start(chunk.metadata.char_start),
      char_end(chunk.metadata.char_end),
      chunk_index(chunk.metadata.chunk_index),
      total_chunks(chunk.metadata.total_chunks),
      first_page(chunk.metadata.first_page),
      last_page(chunk.metadata.last_page)
{
}

nlohmann::json ChunkData::to_json() const
{
    nlohmann::json j;
    j["content"] = content;
    j["char_start"] = char_start;
    j["char_end"] = char_end;
    j["chunk_index"] = chunk_index;
    j["total_chunks"] = total_chunks;
    j["first_page"] = first_page ? nlohmann::json(*first_page) : nlohmann::json(nullptr);
    j["last_page"] = last_page ? nlohmann::json(*last_page) : nlohmann::json(nullptr);
    return j;
}

void ChunkData::from_json(const nlohmann::json &j)
{
    if (!j.contains("content") || !j["content"].is_string())
    {
        throw std::runtime_error("Missing or invalid 'content' field in chunk");
    }
    content = j["content"].get<std::string>();
    char_start = j.value("char_start", static_cast<size_t>(0));
    char_end = j.value("char_end", static_cast<size_t>(0));
    chunk_index = j.value("chunk_index", static_cast<size_t>(0));
    total_chunks = j.value("total_chunks", static_cast<size_t>(0));

    first_page.reset();
    last_page.reset();
    if (j.contains("first_page") && j["first_page"].is_number_integer())
        first_page = j["first_page"].get<size_t>();
    if (j.contains("last_page") && j["last_page"].is_number_integer())
        last_page = j["last_page"].get<size_t>();
}

ChunkingResponse ChunkingResponse::fromResult(const retrieval::ChunkingResult &result, retrieval::ChunkerType type)
{
    ChunkingResponse response;
    response.chunker_type = retrieval::chunkerTypeToString(type);
    for (const auto &chunk : result.chunks)
    {
        response.addChunk(ChunkData(chunk));
    }
    return response;
}

bool ChunkingResponse::validate() const
{
    if (chunk_count != chunks.size())
    {
        Logger::logDebug("Validation failed: chunk_count (%zu) doesn't match chunks.size() (%zu)", chunk_count, chunks.size());
        return false;
    }

    for (size_t i = 0; i < chunks.size(); ++i)
    {
        if (chunks[i].chunk_index != i)
        {
            Logger::logDebug("Validation failed: chunk %zu has chunk_index %zu", i, chunks[i].chunk_index);
            return false;
        }
        if (chunks[i].char_end < chunks[i].char_start)
        {
            Logger::logDebug("Validation failed: chunk %zu ends before it starts", i);
            return false;
        }
    }

    return true;
}

nlohmann::json ChunkingResponse::to_json() const
{
    nlohmann::json j;
    j["chunker_type"] = chunker_type;
    j["chunk_count"] = chunk_count;

    nlohmann::json chunks_array = nlohmann::json::array();
    for (const auto &chunk : chunks)
    {
        chunks_array.push_back(chunk.to_json());
    }
    j["chunks"] = chunks_array;
    j["processing_time_ms"] = processing_time_ms;

    return j;
}

void ChunkingResponse::from_json(const nlohmann::json &j)
{
    if (j.contains("chunker_type") && j["chunker_type"].is_string())
    {
        chunker_type = j["chunker_type"].get<std::string>();
    }

    chunks.clear();
    if (j.contains("chunks"))
    {
        if (!j["chunks"].is_array())
        {
            throw std::runtime_error("Field 'chunks' must be an array");
        }
        for (const auto &item : j["chunks"])
        {
            ChunkData chunk;
            chunk.from_json(item);
            chunks.push_back(std::move(chunk));
        }
    }

    chunk_count = j.value("chunk_count", chunks.size());
    processing_time_ms = j.value("processing_time_ms", 0.0f);
}

void ChunkingResponse::addChunk(const ChunkData &chunk)
{
    chunks.push_back(chunk);
    chunk_count = chunks.size();
}

} // namespace docintel
