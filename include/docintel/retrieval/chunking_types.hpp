#ifndef DOCINTEL_CHUNKING_TYPES_HPP
#define DOCINTEL_CHUNKING_TYPES_HPP

#include "../export.hpp"
#include "page_boundary.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace docintel
{
namespace retrieval
{

class ChunkSplitter;

enum class ChunkerType
{
    Text,
    Markdown
};

DOCINTEL_API std::string chunkerTypeToString(ChunkerType type);

// Case-insensitive "text" / "markdown"
DOCINTEL_API std::optional<ChunkerType> parseChunkerType(const std::string &name);

/**
 * @brief Chunking parameters
 *
 * `max_characters` and `overlap` count Unicode code points.
 */
struct ChunkingConfig
{
    size_t max_characters = 1000;
    size_t overlap = 200;
    bool trim = true;
    ChunkerType chunker_type = ChunkerType::Text;
};

struct ChunkMetadata
{
    size_t char_start = 0;
    size_t char_end = 0;
    size_t chunk_index = 0;
    size_t total_chunks = 0;
    std::optional<size_t> first_page;
    std::optional<size_t> last_page;
};

struct Chunk
{
    std::string content;
    ChunkMetadata metadata;
};

struct ChunkingResult
{
    std::vector<Chunk> chunks;
    size_t chunk_count = 0;
};

/**
 * @brief Service for text chunking operations
 *
 * Splits text into bounded, optionally overlapping chunks and annotates each
 * chunk with its offsets and page range. Stateless, so one instance can be
 * shared between threads.
 */
class DOCINTEL_API ChunkingService
{
public:
    ChunkingService();
    ~ChunkingService();

    /**
     * @brief Splits text according to the configuration
     *
     * @param text UTF-8 input text
     * @param config Chunking parameters
     * @param page_boundaries Optional page map of `text`; validated before any
     *        chunk is produced
     * @return Chunks in text order; empty text gives zero chunks
     * @throws ChunkingValidationError for an invalid configuration or boundary list
     */
    ChunkingResult chunkText(const std::string &text,
                             const ChunkingConfig &config,
                             const std::vector<PageBoundary> *page_boundaries = nullptr) const;

    ChunkingResult chunkTextWithType(const std::string &text,
                                     size_t max_characters,
                                     size_t overlap,
                                     bool trim,
                                     ChunkerType chunker_type) const;

    /**
     * @brief Chunks several texts with one configuration
     *
     * The configuration is validated once up front; results keep input order.
     */
    std::vector<ChunkingResult> chunkTextsBatch(const std::vector<std::string> &texts,
                                                const ChunkingConfig &config) const;

    /**
     * @brief Validates chunking parameters
     *
     * @throws ChunkingValidationError when max_characters is zero or overlap is
     *         not smaller than max_characters
     */
    static void validateChunkingParameters(const ChunkingConfig &config);

private:
    static std::unique_ptr<ChunkSplitter> createSplitter(const ChunkingConfig &config);
    static ChunkingResult buildResult(const std::string &text,
                                      const ChunkingConfig &config,
                                      const std::vector<PageBoundary> *page_boundaries);
};

} // namespace retrieval
} // namespace docintel

#endif // DOCINTEL_CHUNKING_TYPES_HPP
