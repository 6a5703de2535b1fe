#include "docintel/retrieval/page_boundary.hpp"
#include "docintel/retrieval/chunking_errors.hpp"
#include "docintel/logger.hpp"
#include <string>

namespace docintel
{
namespace retrieval
{

void PageBoundaryValidator::validate(const std::vector<PageBoundary> &boundaries)
{
    for (size_t i = 0; i < boundaries.size(); ++i)
    {
        const PageBoundary &boundary = boundaries[i];
        if (boundary.char_start >= boundary.char_end)
        {
            throw ChunkingValidationError(ChunkingValidationError::Kind::InvalidBoundaryRange,
                                          "Invalid boundary range at index " + std::to_string(i) +
                                              ": char_start (" + std::to_string(boundary.char_start) +
                                              ") must be less than char_end (" +
                                              std::to_string(boundary.char_end) + ")");
        }

        if (i == 0)
            continue;

        const PageBoundary &previous = boundaries[i - 1];
        if (boundary.char_start < previous.char_start)
        {
            throw ChunkingValidationError(ChunkingValidationError::Kind::UnsortedBoundaries,
                                          "Page boundaries must be sorted by char_start: boundary " +
                                              std::to_string(i) + " starts at " +
                                              std::to_string(boundary.char_start) + " before boundary " +
                                              std::to_string(i - 1) + " at " +
                                              std::to_string(previous.char_start));
        }
        if (previous.char_end > boundary.char_start)
        {
            throw ChunkingValidationError(ChunkingValidationError::Kind::OverlappingBoundaries,
                                          "Page boundaries overlap: boundary " + std::to_string(i - 1) +
                                              " ends at " + std::to_string(previous.char_end) +
                                              " but boundary " + std::to_string(i) + " starts at " +
                                              std::to_string(boundary.char_start));
        }
    }

    Logger::logDebug("Validated %zu page boundaries", boundaries.size());
}

std::optional<std::pair<size_t, size_t>> PageBoundaryValidator::pageRange(const std::vector<PageBoundary> &boundaries,
                                                                          size_t char_start,
                                                                          size_t char_end)
{
    std::optional<size_t> first_page;
    std::optional<size_t> last_page;

    for (const auto &boundary : boundaries)
    {
        if (boundary.char_start >= char_end)
            break;

        if (char_start < boundary.char_end && char_end > boundary.char_start)
        {
            if (!first_page)
                first_page = boundary.page_number;
            last_page = boundary.page_number;
        }
    }

    if (!first_page)
    {
        return std::nullopt;
    }
    return std::make_pair(*first_page, *last_page);
}

} // namespace retrieval
} // namespace docintel
