#ifndef DOCINTEL_PAGE_BOUNDARY_HPP
#define DOCINTEL_PAGE_BOUNDARY_HPP

#include "../export.hpp"
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace docintel
{
namespace retrieval
{

/**
 * @brief Half-open character range [char_start, char_end) covered by one page
 *
 * Offsets are in code points of the extracted text; page numbers start at 1.
 */
struct PageBoundary
{
    size_t char_start = 0;
    size_t char_end = 0;
    size_t page_number = 0;

    PageBoundary() = default;
    PageBoundary(size_t start, size_t end, size_t page)
        : char_start(start), char_end(end), page_number(page) {}
};

class DOCINTEL_API PageBoundaryValidator
{
public:
    /**
     * @brief Checks that every boundary has char_start < char_end, that the list
     * is sorted by char_start and that neighbours do not overlap
     *
     * Gaps between pages are allowed.
     * @throws ChunkingValidationError on the first violation
     */
    static void validate(const std::vector<PageBoundary> &boundaries);

    /**
     * @brief First and last page intersecting [char_start, char_end)
     *
     * Boundaries must already be validated. Returns nullopt when no boundary
     * intersects the span.
     */
    static std::optional<std::pair<size_t, size_t>> pageRange(const std::vector<PageBoundary> &boundaries,
                                                              size_t char_start,
                                                              size_t char_end);
};

} // namespace retrieval
} // namespace docintel

#endif // DOCINTEL_PAGE_BOUNDARY_HPP
