#ifndef DOCINTEL_CHUNKING_REQUEST_MODEL_HPP
#define DOCINTEL_CHUNKING_REQUEST_MODEL_HPP

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
 * @brief Model for a chunking request
 *
 * JSON form of the text, ChunkingConfig and optional page boundaries passed to
 * ChunkingService::chunkText.
 */
class DOCINTEL_API ChunkingRequest : public IModel
{
public:
    // Text to be chunked (required)
    std::string text;

    // Maximum code points per chunk (optional, default 1000)
    size_t max_characters = 1000;

    // Code points repeated at the start of the next chunk (optional, default 200)
    size_t overlap = 200;

    // Strip whitespace at chunk edges (optional, default true)
    bool trim = true;

    // "text" or "markdown", case-insensitive (optional, default "text")
    std::string chunker_type = "text";

    // Page map of `text` (optional)
    std::optional<std::vector<retrieval::PageBoundary>> page_boundaries;

    ChunkingRequest() = default;
    virtual ~ChunkingRequest() = default;

    /**
     * @brief Validates the chunking request
     * @return true if valid, false otherwise
     */
    bool validate() const override;

    /**
     * @brief Converts the request to JSON
     * @return JSON representation
     */
    nlohmann::json to_json() const override;

    /**
     * @brief Populates the request from JSON
     * @param j JSON object to parse
     * @throws std::runtime_error if a field is missing or has the wrong type
     */
    void from_json(const nlohmann::json &j) override;

    /**
     * @brief Builds the chunker configuration
     * @throws std::invalid_argument if chunker_type is unknown
     */
    retrieval::ChunkingConfig toConfig() const;
};

} // namespace docintel

#endif // DOCINTEL_CHUNKING_REQUEST_MODEL_HPP
