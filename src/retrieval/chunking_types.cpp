#include "docintel/retrieval/chunking_types.hpp"
#include "docintel/retrieval/chunking_errors.hpp"
#include "docintel/retrieval/text_splitter.hpp"
#include "docintel/logger.hpp"
#include "docintel/utils.hpp"
#include <algorithm>
#include <cctype>

namespace docintel
{
namespace retrieval
{

std::string chunkerTypeToString(ChunkerType type)
{
    switch (type)
    {
    case ChunkerType::Text:
        return "text";
    case ChunkerType::Markdown:
        return "markdown";
    }
    return "text";
}

std::optional<ChunkerType> parseChunkerType(const std::string &name)
{
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "text")
        return ChunkerType::Text;
    if (lowered == "markdown")
        return ChunkerType::Markdown;
    return std::nullopt;
}

ChunkingService::ChunkingService()
{
    Logger::logDebug("ChunkingService initialized");
}

ChunkingService::~ChunkingService() = default;

void ChunkingService::validateChunkingParameters(const ChunkingConfig &config)
{
    if (config.max_characters == 0)
    {
        throw ChunkingValidationError(ChunkingValidationError::Kind::InvalidChunkSize,
                                      "Invalid chunk size: max_characters must be greater than zero");
    }
    if (config.overlap >= config.max_characters)
    {
        throw ChunkingValidationError(ChunkingValidationError::Kind::InvalidOverlap,
                                      "Invalid overlap: overlap (" + std::to_string(config.overlap) +
                                          ") must be less than max_characters (" +
                                          std::to_string(config.max_characters) + ")");
    }
}

std::unique_ptr<ChunkSplitter> ChunkingService::createSplitter(const ChunkingConfig &config)
{
    switch (config.chunker_type)
    {
    case ChunkerType::Markdown:
        return std::make_unique<MarkdownSplitter>(config.max_characters, config.overlap, config.trim);
    case ChunkerType::Text:
        break;
    }
    return std::make_unique<TextSplitter>(config.max_characters, config.overlap, config.trim);
}

ChunkingResult ChunkingService::buildResult(const std::string &text,
                                            const ChunkingConfig &config,
                                            const std::vector<PageBoundary> *page_boundaries)
{
    ChunkingResult result;
    if (text.empty())
    {
        return result;
    }

    std::vector<std::string> segments = createSplitter(config)->split(text);
    const bool track_pages = page_boundaries != nullptr && !page_boundaries->empty();

    // Offsets run from 0; every chunk but the last hands back up to `overlap` characters
    size_t char_offset = 0;
    result.chunks.reserve(segments.size());
    for (size_t i = 0; i < segments.size(); ++i)
    {
        const size_t length = utf8::length(segments[i]);

        Chunk chunk;
        chunk.metadata.char_start = char_offset;
        chunk.metadata.char_end = char_offset + length;
        chunk.metadata.chunk_index = i;
        chunk.metadata.total_chunks = segments.size();

        if (track_pages)
        {
            auto pages = PageBoundaryValidator::pageRange(*page_boundaries,
                                                          chunk.metadata.char_start,
                                                          chunk.metadata.char_end);
            if (pages)
            {
                chunk.metadata.first_page = pages->first;
                chunk.metadata.last_page = pages->second;
            }
        }

        if (i + 1 < segments.size())
        {
            char_offset = chunk.metadata.char_end - std::min(config.overlap, length);
        }

        chunk.content = std::move(segments[i]);
        result.chunks.push_back(std::move(chunk));
    }

    result.chunk_count = result.chunks.size();
    return result;
}

ChunkingResult ChunkingService::chunkText(const std::string &text,
                                          const ChunkingConfig &config,
                                          const std::vector<PageBoundary> *page_boundaries) const
{
    if (page_boundaries != nullptr)
    {
        PageBoundaryValidator::validate(*page_boundaries);
    }
    validateChunkingParameters(config);

    ChunkingResult result = buildResult(text, config, page_boundaries);

    Logger::logDebug("Chunked %zu bytes into %zu %s chunks (max %zu, overlap %zu)",
                     text.size(), result.chunk_count, chunkerTypeToString(config.chunker_type).c_str(),
                     config.max_characters, config.overlap);
    return result;
}

ChunkingResult ChunkingService::chunkTextWithType(const std::string &text,
                                                  size_t max_characters,
                                                  size_t overlap,
                                                  bool trim,
                                                  ChunkerType chunker_type) const
{
    ChunkingConfig config;
    config.max_characters = max_characters;
    config.overlap = overlap;
    config.trim = trim;
    config.chunker_type = chunker_type;
    return chunkText(text, config);
}

std::vector<ChunkingResult> ChunkingService::chunkTextsBatch(const std::vector<std::string> &texts,
                                                             const ChunkingConfig &config) const
{
    validateChunkingParameters(config);

    std::vector<ChunkingResult> results;
    results.reserve(texts.size());
    for (const auto &text : texts)
    {
        results.push_back(buildResult(text, config, nullptr));
    }

    Logger::logDebug("Chunked batch of %zu texts", texts.size());
    return results;
}

} // namespace retrieval
} // namespace docintel
