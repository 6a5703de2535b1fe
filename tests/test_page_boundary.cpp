#include "test_common.h"
#include "docintel/retrieval/chunking_errors.hpp"
#include "docintel/retrieval/page_boundary.hpp"
#include <cstring>

using namespace docintel::retrieval;

static int test_valid_lists() {
    PageBoundaryValidator::validate({});
    PageBoundaryValidator::validate({PageBoundary(0, 20, 1), PageBoundary(20, 40, 2)});
    // Gaps between pages are allowed
    PageBoundaryValidator::validate({PageBoundary(0, 10, 1), PageBoundary(15, 30, 2), PageBoundary(45, 46, 3)});
    return 0;
}

static int test_invalid_range() {
    if (!expect_throw<ChunkingValidationError>([&] {
            PageBoundaryValidator::validate({PageBoundary(0, 10, 1), PageBoundary(10, 10, 2)}); },
            [](const ChunkingValidationError &e) { return e.kind() == ChunkingValidationError::Kind::InvalidBoundaryRange &&
                                                          std::strstr(e.what(), "Invalid boundary range") != nullptr; },
            "kind, message")) return 1;
    if (!expect_throw<ChunkingValidationError>([&] { PageBoundaryValidator::validate({PageBoundary(30, 5, 1)}); },
            [](const ChunkingValidationError &e) { return e.kind() == ChunkingValidationError::Kind::InvalidBoundaryRange; },
            "reversed range")) return 1;
    return 0;
}

static int test_unsorted() {
    if (!expect_throw<ChunkingValidationError>([&] {
            PageBoundaryValidator::validate({PageBoundary(20, 40, 2), PageBoundary(0, 20, 1)}); },
            [](const ChunkingValidationError &e) { return e.kind() == ChunkingValidationError::Kind::UnsortedBoundaries &&
                                                          std::strstr(e.what(), "boundaries") != nullptr; },
            "kind, message")) return 1;
    return 0;
}

static int test_overlapping() {
    if (!expect_throw<ChunkingValidationError>([&] {
            PageBoundaryValidator::validate({PageBoundary(0, 25, 1), PageBoundary(20, 40, 2)}); },
            [](const ChunkingValidationError &e) { return e.kind() == ChunkingValidationError::Kind::OverlappingBoundaries &&
                                                          std::strstr(e.what(), "overlap") != nullptr; },
            "kind, message")) return 1;
    return 0;
}

static int test_page_range() {
    std::vector<PageBoundary> pages = {PageBoundary(0, 20, 1), PageBoundary(20, 40, 2), PageBoundary(50, 60, 3)};

    auto spanning = PageBoundaryValidator::pageRange(pages, 10, 30);
    if (!check(spanning && spanning->first == 1 && spanning->second == 2, "[10,30) covers pages 1..2")) return 1;

    auto first = PageBoundaryValidator::pageRange(pages, 0, 20);
    if (!check(first && first->first == 1 && first->second == 1, "half-open end does not touch page 2")) return 1;

    auto second = PageBoundaryValidator::pageRange(pages, 20, 21);
    if (!check(second && second->first == 2 && second->second == 2, "start on a boundary")) return 1;

    if (!check(!PageBoundaryValidator::pageRange(pages, 41, 49), "span inside a gap")) return 1;
    if (!check(!PageBoundaryValidator::pageRange(pages, 60, 70), "span after the last page")) return 1;

    auto across_gap = PageBoundaryValidator::pageRange(pages, 35, 55);
    if (!check(across_gap && across_gap->first == 2 && across_gap->second == 3, "span across a gap")) return 1;

    if (!check(!PageBoundaryValidator::pageRange({}, 0, 10), "no boundaries")) return 1;
    return 0;
}

int main() {
    if (run_test("test_valid_lists", test_valid_lists) != 0) return 1;
    if (run_test("test_invalid_range", test_invalid_range) != 0) return 1;
    if (run_test("test_unsorted", test_unsorted) != 0) return 1;
    if (run_test("test_overlapping", test_overlapping) != 0) return 1;
    if (run_test("test_page_range", test_page_range) != 0) return 1;
    std::cout << "[TEST] OK page boundaries" << std::endl;
    return 0;
}
