#ifndef DOCINTEL_DOCX_ERRORS_HPP
#define DOCINTEL_DOCX_ERRORS_HPP

#include "../export.hpp"
#include <stdexcept>
#include <string>

namespace docintel
{
namespace retrieval
{

/**
 * @brief Terminal failure while parsing a DOCX package
 */
class DOCINTEL_API DocxParseError : public std::runtime_error
{
public:
    enum class Kind
    {
        Io,
        Zip,
        Xml,
        FileNotFound
    };

    DocxParseError(Kind kind, const std::string &message)
        : std::runtime_error(prefix(kind) + message), kind_(kind) {}

    static DocxParseError fileNotFound(const std::string &part)
    {
        DocxParseError error(Kind::FileNotFound, part);
        error.part_ = part;
        return error;
    }

    Kind kind() const noexcept { return kind_; }

    // Name of the missing part for FileNotFound, empty otherwise
    const std::string &part() const noexcept { return part_; }

private:
    static std::string prefix(Kind kind)
    {
        switch (kind)
        {
        case Kind::Io:
            return "IO error: ";
        case Kind::Zip:
            return "ZIP error: ";
        case Kind::Xml:
            return "XML parsing error: ";
        case Kind::FileNotFound:
            return "Required file not found in DOCX: ";
        }
        return "";
    }

    Kind kind_;
    std::string part_;
};

} // namespace retrieval
} // namespace docintel

#endif // DOCINTEL_DOCX_ERRORS_HPP
