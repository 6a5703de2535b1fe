#ifndef DOCINTEL_CHUNKING_RESPONSE_MODEL_HPP
#define DOCINTEL_CHUNKING_RESPONSE_MODEL_HPP

#include "../export.hpp"
#include "../retrieval/chunking_types.hpp"
#include "model_interface.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace docintel
{

/**
 * @brief Model for a single chunk in the response
 */
class DOCINTEL_API ChunkData
{
public:
    std::string content;
    size_t char_start = 0;
    size_t char_end = 0;
    size_t chunk_index = 0;
    size_t total_chunks = 0;
    std::optional<size_t> first_page;
    std::optional<size_t> last_page;

    ChunkData() = default;
    explicit ChunkData(const retrieval::Chunk &chunk);

    nlohmann::json to_json() const;
    void from_json(const nlohmann::json &j);
};

/**
 * @brief Model for a chunking response
 */
class DOCINTEL_API ChunkingResponse : public IModel
{
public:
    std::string chunker_type = "text";
    size_t chunk_count = 0;
    std::vector<ChunkData> chunks;
    float processing_time_ms = 0.0f;

    ChunkingResponse() = default;
    virtual ~ChunkingResponse() = default;

    static ChunkingResponse fromResult(const retrieval::ChunkingResult &result, retrieval::ChunkerType type);

    // chunk_count must match chunks and indices must run 0..n-1
    bool validate() const override;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json &j) override;

    void addChunk(const ChunkData &chunk);
};

} // namespace docintel

#endif // DOCINTEL_CHUNKING_RESPONSE_MODEL_HPP
