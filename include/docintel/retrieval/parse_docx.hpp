#ifndef DOCINTEL_PARSE_DOCX_HPP
#define DOCINTEL_PARSE_DOCX_HPP

#include "../export.hpp"
#include "body_builder.hpp"
#include "docx_document.hpp"
#include "docx_errors.hpp"
#include "relationships.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace docintel
{
namespace retrieval
{

class ZipPackageReader;

/**
 * @brief w:headerReference / w:footerReference found in a section
 */
struct PartReference
{
    std::string relationship_id;
    HeaderFooterType type = HeaderFooterType::Default;
};

/**
 * @brief Single forward scan of word/document.xml
 */
class DOCINTEL_API DocumentXmlParser
{
public:
    struct Result
    {
        BodyContent body;
        std::vector<PartReference> header_references;
        std::vector<PartReference> footer_references;
    };

    static Result parse(const std::string &xml, const RelationshipResolver *relationships,
                        const std::string &part_name = "word/document.xml");
};

class DOCINTEL_API HeaderFooterParser
{
public:
    static HeaderFooter parse(const std::string &xml, const std::string &part_name,
                              HeaderFooterType type, const RelationshipResolver *relationships);
};

/**
 * @brief Reads word/footnotes.xml or word/endnotes.xml
 *
 * Separator notes (ids "-1" and "0", or a separator w:type) are dropped.
 */
class DOCINTEL_API NotesParser
{
public:
    static std::vector<Note> parse(const std::string &xml, const std::string &part_name,
                                   NoteType type, const RelationshipResolver *relationships);
};

class DOCINTEL_API CorePropertiesParser
{
public:
    static CoreProperties parse(const std::string &xml, const std::string &part_name = "docProps/core.xml");
};

/**
 * @brief Entry point for DOCX packages held in memory
 *
 * Every call builds its own state; concurrent calls on different buffers
 * need no synchronisation. All failures throw DocxParseError and no partial
 * Document is returned.
 */
class DOCINTEL_API DOCXParser
{
public:
    static Document parse_document(const unsigned char *data, size_t size);
    static Document parse_document(const std::vector<unsigned char> &bytes);

    // Markdown rendering of the package
    static std::string parse_docx_from_bytes(const unsigned char *data, size_t size);

    // Plain-text flattening of the package
    static std::string extract_text_from_bytes(const unsigned char *data, size_t size);

    // True when the buffer opens as a zip holding word/document.xml; never throws
    static bool is_valid_docx(const unsigned char *data, size_t size);

    static constexpr const char *kDocumentPart = "word/document.xml";
    static constexpr const char *kNumberingPart = "word/numbering.xml";
    static constexpr const char *kFootnotesPart = "word/footnotes.xml";
    static constexpr const char *kEndnotesPart = "word/endnotes.xml";
    static constexpr const char *kCorePropertiesPart = "docProps/core.xml";

private:
    static Document parse_package(ZipPackageReader &package);
    static void parse_headers_footers(ZipPackageReader &package,
                                      const RelationshipResolver &relationships,
                                      const DocumentXmlParser::Result &body,
                                      Document &document);
    static void process_lists(Document &document);
    static RelationshipResolver load_relationships(ZipPackageReader &package, const std::string &part_name);
};

} // namespace retrieval
} // namespace docintel

#endif // DOCINTEL_PARSE_DOCX_HPP
