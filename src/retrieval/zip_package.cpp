#include "docintel/retrieval/zip_package.hpp"
#include "docintel/retrieval/docx_errors.hpp"
#include "docintel/logger.hpp"
#include <unzip.h>
#include <cstring>
#include <utility>

namespace docintel
{
namespace retrieval
{

namespace
{

using MemoryStream = ZipPackageReader::MemoryStream;

voidpf ZCALLBACK memory_open(voidpf opaque, const void * /*filename*/, int mode)
{
    // Read-only package access
    if ((mode & ZLIB_FILEFUNC_MODE_WRITE) != 0)
    {
        return nullptr;
    }
    auto *stream = static_cast<MemoryStream *>(opaque);
    stream->position = 0;
    return stream;
}

uLong ZCALLBACK memory_read(voidpf /*opaque*/, voidpf handle, void *buf, uLong size)
{
    auto *stream = static_cast<MemoryStream *>(handle);
    if (stream->position >= stream->size)
    {
        return 0;
    }
    size_t available = stream->size - stream->position;
    size_t count = static_cast<size_t>(size) < available ? static_cast<size_t>(size) : available;
    std::memcpy(buf, stream->data + stream->position, count);
    stream->position += count;
    return static_cast<uLong>(count);
}

uLong ZCALLBACK memory_write(voidpf /*opaque*/, voidpf /*handle*/, const void * /*buf*/, uLong /*size*/)
{
    return 0;
}

ZPOS64_T ZCALLBACK memory_tell(voidpf /*opaque*/, voidpf handle)
{
    return static_cast<ZPOS64_T>(static_cast<MemoryStream *>(handle)->position);
}

long ZCALLBACK memory_seek(voidpf /*opaque*/, voidpf handle, ZPOS64_T offset, int origin)
{
    auto *stream = static_cast<MemoryStream *>(handle);
    ZPOS64_T base = 0;
    switch (origin)
    {
    case ZLIB_FILEFUNC_SEEK_SET:
        base = 0;
        break;
    case ZLIB_FILEFUNC_SEEK_CUR:
        base = stream->position;
        break;
    case ZLIB_FILEFUNC_SEEK_END:
        base = stream->size;
        break;
    default:
        return -1;
    }

    ZPOS64_T target = base + offset;
    if (target > stream->size)
    {
        return -1;
    }
    stream->position = static_cast<size_t>(target);
    return 0;
}

int ZCALLBACK memory_close(voidpf /*opaque*/, voidpf /*handle*/)
{
    return 0;
}

int ZCALLBACK memory_error(voidpf /*opaque*/, voidpf /*handle*/)
{
    return 0;
}

unzFile as_unz(void *archive)
{
    return static_cast<unzFile>(archive);
}

} // namespace

ZipPackageReader::ZipPackageReader(const unsigned char *data, size_t size)
{
    if (!data || size == 0)
    {
        throw DocxParseError(DocxParseError::Kind::Zip, "empty archive buffer");
    }

    stream_.data = data;
    stream_.size = size;
    stream_.position = 0;

    zlib_filefunc64_def filefunc;
    filefunc.zopen64_file = memory_open;
    filefunc.zread_file = memory_read;
    filefunc.zwrite_file = memory_write;
    filefunc.ztell64_file = memory_tell;
    filefunc.zseek64_file = memory_seek;
    filefunc.zclose_file = memory_close;
    filefunc.zerror_file = memory_error;
    filefunc.opaque = &stream_;

    archive_ = unzOpen2_64("docx-memory", &filefunc);
    if (!archive_)
    {
        throw DocxParseError(DocxParseError::Kind::Zip, "failed to open archive (" + std::to_string(size) + " bytes)");
    }
}

ZipPackageReader::~ZipPackageReader()
{
    if (archive_)
    {
        unzClose(as_unz(archive_));
    }
}

bool ZipPackageReader::hasPart(const std::string &name)
{
    // Part names are matched case-insensitively as in OPC
    return unzLocateFile(as_unz(archive_), name.c_str(), 2) == UNZ_OK;
}

std::string ZipPackageReader::readPart(const std::string &name)
{
    if (!hasPart(name))
    {
        throw DocxParseError::fileNotFound(name);
    }
    return readCurrentEntry(name);
}

std::optional<std::string> ZipPackageReader::readOptionalPart(const std::string &name)
{
    if (!hasPart(name))
    {
        return std::nullopt;
    }
    return readCurrentEntry(name);
}

std::vector<std::string> ZipPackageReader::partNames()
{
    std::vector<std::string> names;
    unzFile archive = as_unz(archive_);

    int status = unzGoToFirstFile(archive);
    while (status == UNZ_OK)
    {
        // First call sizes the name, second copies it; minizip leaves it unterminated when it fills the buffer
        unz_file_info64 info;
        if (unzGetCurrentFileInfo64(archive, &info, nullptr, 0, nullptr, 0, nullptr, 0) != UNZ_OK)
        {
            throw DocxParseError(DocxParseError::Kind::Zip, "failed to read central directory entry");
        }
        std::string name(static_cast<size_t>(info.size_filename), '\0');
        if (!name.empty() &&
            unzGetCurrentFileInfo64(archive, &info, &name[0], static_cast<uLong>(name.size()), nullptr, 0, nullptr,
                                    0) != UNZ_OK)
        {
            throw DocxParseError(DocxParseError::Kind::Zip, "failed to read central directory entry");
        }
        names.push_back(std::move(name));
        status = unzGoToNextFile(archive);
    }

    if (status != UNZ_END_OF_LIST_OF_FILE)
    {
        throw DocxParseError(DocxParseError::Kind::Zip, "corrupt central directory");
    }
    return names;
}

std::string ZipPackageReader::readCurrentEntry(const std::string &name)
{
    unzFile archive = as_unz(archive_);

    if (unzOpenCurrentFile(archive) != UNZ_OK)
    {
        throw DocxParseError(DocxParseError::Kind::Zip, "failed to open " + name);
    }

    std::string content;
    char buffer[8192];
    int bytes_read;

    while ((bytes_read = unzReadCurrentFile(archive, buffer, sizeof(buffer))) > 0)
    {
        content.append(buffer, static_cast<size_t>(bytes_read));
    }

    int close_status = unzCloseCurrentFile(archive);

    if (bytes_read < 0)
    {
        auto kind = bytes_read == UNZ_ERRNO ? DocxParseError::Kind::Io : DocxParseError::Kind::Zip;
        throw DocxParseError(kind, "error reading " + name + " (code " + std::to_string(bytes_read) + ")");
    }
    if (close_status == UNZ_CRCERROR)
    {
        throw DocxParseError(DocxParseError::Kind::Zip, "CRC mismatch in " + name);
    }

    Logger::logDebug("Read part %s (%zu bytes)", name.c_str(), content.size());
    return content;
}

} // namespace retrieval
} // namespace docintel
