#ifndef DOCINTEL_ZIP_PACKAGE_HPP
#define DOCINTEL_ZIP_PACKAGE_HPP

#include "../export.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace docintel
{
namespace retrieval
{

/**
 * @brief Read-only view of a zip archive held in caller memory
 *
 * The archive bytes are not copied; the buffer must outlive the reader.
 * Lookups and reads move the reader's minizip cursor, so they are non-const
 * and a reader must not be shared between threads. Independent readers over
 * the same buffer are safe to use concurrently.
 *
 * Throws DocxParseError (Zip) when the buffer is not a readable archive.
 */
class DOCINTEL_API ZipPackageReader
{
public:
    ZipPackageReader(const unsigned char *data, size_t size);
    ~ZipPackageReader();

    ZipPackageReader(const ZipPackageReader &) = delete;
    ZipPackageReader &operator=(const ZipPackageReader &) = delete;

    bool hasPart(const std::string &name);

    // Throws DocxParseError (FileNotFound) when the part is missing
    std::string readPart(const std::string &name);

    // Empty when the part is missing; read errors still throw
    std::optional<std::string> readOptionalPart(const std::string &name);

    std::vector<std::string> partNames();

    struct MemoryStream
    {
        const unsigned char *data = nullptr;
        size_t size = 0;
        size_t position = 0;
    };

private:
    std::string readCurrentEntry(const std::string &name);

    MemoryStream stream_;
    void *archive_ = nullptr;
};

} // namespace retrieval
} // namespace docintel

#endif // DOCINTEL_ZIP_PACKAGE_HPP
