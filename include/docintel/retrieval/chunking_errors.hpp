#ifndef DOCINTEL_CHUNKING_ERRORS_HPP
#define DOCINTEL_CHUNKING_ERRORS_HPP

#include "../export.hpp"
#include <stdexcept>
#include <string>

namespace docintel
{
namespace retrieval
{

/**
 * @brief Rejected chunking configuration or page boundary list
 *
 * Raised before any chunk is computed, so a call either fails with this or
 * returns a complete result.
 */
class DOCINTEL_API ChunkingValidationError : public std::invalid_argument
{
public:
    enum class Kind
    {
        InvalidChunkSize,
        InvalidOverlap,
        InvalidBoundaryRange,
        UnsortedBoundaries,
        OverlappingBoundaries
    };

    ChunkingValidationError(Kind kind, const std::string &message)
        : std::invalid_argument(message), kind_(kind) {}

    Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

} // namespace retrieval
} // namespace docintel

#endif // DOCINTEL_CHUNKING_ERRORS_HPP
