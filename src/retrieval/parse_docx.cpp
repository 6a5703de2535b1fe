#include "docintel/retrieval/parse_docx.hpp"
#include "docintel/retrieval/numbering.hpp"
#include "docintel/retrieval/zip_package.hpp"
#include "docintel/logger.hpp"
#include "docintel/utils.hpp"
#include <cstring>
#include <memory>
#include <set>
#include <utility>

namespace docintel
{
namespace retrieval
{

namespace
{

HeaderFooterType headerFooterTypeFromString(const std::string &value)
{
    if (value == "first")
        return HeaderFooterType::First;
    if (value == "even")
        return HeaderFooterType::Even;
    if (value == "odd")
        return HeaderFooterType::Odd;
    return HeaderFooterType::Default;
}

// Body content plus the section header/footer references
class DocumentPartHandler : public XmlEventHandler
{
public:
    DocumentPartHandler(const RelationshipResolver *relationships, DocumentXmlParser::Result &result)
        : builder_(relationships), result_(result) {}

    void startElement(const XmlElement &element) override
    {
        const char *name = element.name();
        if (std::strcmp(name, "w:headerReference") == 0 || std::strcmp(name, "w:footerReference") == 0)
        {
            PartReference reference;
            reference.relationship_id = attributeValue(element, "r:id");
            reference.type = headerFooterTypeFromString(attributeValue(element, "w:type"));
            if (!reference.relationship_id.empty())
            {
                auto &target = name[2] == 'h' ? result_.header_references : result_.footer_references;
                target.push_back(std::move(reference));
            }
        }
        builder_.startElement(element);
    }

    void text(const char *value, size_t length) override { builder_.text(value, length); }
    void endElement(const XmlElement &element) override { builder_.endElement(element); }

    BodyContent takeContent() { return builder_.takeContent(); }

private:
    BodyBuilder builder_;
    DocumentXmlParser::Result &result_;
};

// One BodyBuilder per w:footnote / w:endnote
class NotesHandler : public XmlEventHandler
{
public:
    NotesHandler(NoteType type, const RelationshipResolver *relationships, std::vector<Note> &notes)
        : type_(type), relationships_(relationships), notes_(notes) {}

    void startElement(const XmlElement &element) override
    {
        if (!builder_ && isNoteElement(element.name()))
        {
            current_ = Note();
            current_.id = attributeValue(element, "w:id");
            current_.note_type = type_;
            separator_ = isSeparatorType(attributeValue(element, "w:type"));
            builder_ = std::make_unique<BodyBuilder>(relationships_);
            note_depth_ = 0;
            return;
        }
        if (builder_)
        {
            ++note_depth_;
            builder_->startElement(element);
        }
    }

    void text(const char *value, size_t length) override
    {
        if (builder_)
            builder_->text(value, length);
    }

    void endElement(const XmlElement &element) override
    {
        if (!builder_)
        {
            return;
        }
        if (note_depth_ > 0)
        {
            --note_depth_;
            builder_->endElement(element);
            return;
        }

        // End of the note element itself
        current_.paragraphs = builder_->content().flattenedParagraphs();
        builder_.reset();
        if (current_.id == "-1" || current_.id == "0" || separator_)
        {
            return;
        }
        notes_.push_back(std::move(current_));
    }

private:
    bool isNoteElement(const char *name) const
    {
        return std::strcmp(name, type_ == NoteType::Footnote ? "w:footnote" : "w:endnote") == 0;
    }

    static bool isSeparatorType(const std::string &value)
    {
        return value == "separator" || value == "continuationSeparator" || value == "continuationNotice";
    }

    NoteType type_;
    const RelationshipResolver *relationships_;
    std::vector<Note> &notes_;
    std::unique_ptr<BodyBuilder> builder_;
    Note current_;
    size_t note_depth_ = 0;
    bool separator_ = false;
};

} // namespace

DocumentXmlParser::Result DocumentXmlParser::parse(const std::string &xml,
                                                   const RelationshipResolver *relationships,
                                                   const std::string &part_name)
{
    Result result;
    DocumentPartHandler handler(relationships, result);
    scanXml(xml, handler, part_name);
    result.body = handler.takeContent();

    Logger::logDebug("%s: %zu paragraphs, %zu tables", part_name.c_str(),
                     result.body.paragraphs.size(), result.body.tables.size());
    return result;
}

HeaderFooter HeaderFooterParser::parse(const std::string &xml, const std::string &part_name,
                                       HeaderFooterType type, const RelationshipResolver *relationships)
{
    BodyBuilder builder(relationships);
    scanXml(xml, builder, part_name);

    BodyContent content = builder.takeContent();
    HeaderFooter header_footer;
    header_footer.paragraphs = std::move(content.paragraphs);
    header_footer.tables = std::move(content.tables);
    header_footer.header_type = type;
    return header_footer;
}

std::vector<Note> NotesParser::parse(const std::string &xml, const std::string &part_name,
                                     NoteType type, const RelationshipResolver *relationships)
{
    std::vector<Note> notes;
    NotesHandler handler(type, relationships, notes);
    scanXml(xml, handler, part_name);

    Logger::logDebug("%s: %zu notes", part_name.c_str(), notes.size());
    return notes;
}

CoreProperties CorePropertiesParser::parse(const std::string &xml, const std::string &part_name)
{
    pugi::xml_document doc;
    loadXml(doc, xml, part_name);

    CoreProperties properties;
    const std::pair<const char *, std::optional<std::string> *> fields[] = {
        {"dc:title", &properties.title},
        {"dc:subject", &properties.subject},
        {"dc:creator", &properties.creator},
        {"cp:keywords", &properties.keywords},
        {"dc:description", &properties.description},
        {"cp:lastModifiedBy", &properties.last_modified_by},
        {"cp:revision", &properties.revision},
        {"dcterms:created", &properties.created},
        {"dcterms:modified", &properties.modified},
        {"cp:category", &properties.category},
        {"dc:language", &properties.language},
    };

    // Properties are direct children of cp:coreProperties
    for (pugi::xml_node child : doc.document_element().children())
    {
        for (const auto &field : fields)
        {
            if (std::strcmp(child.name(), field.first) != 0)
                continue;
            std::string value = trim_copy(child.child_value());
            if (!value.empty())
                *field.second = value;
        }
    }
    return properties;
}

Document DOCXParser::parse_document(const unsigned char *data, size_t size)
{
    try
    {
        ZipPackageReader package(data, size);
        return parse_package(package);
    }
    catch (const DocxParseError &e)
    {
        Logger::logError("Failed to parse DOCX from bytes: %s", e.what());
        throw;
    }
}

Document DOCXParser::parse_document(const std::vector<unsigned char> &bytes)
{
    return parse_document(bytes.data(), bytes.size());
}

std::string DOCXParser::parse_docx_from_bytes(const unsigned char *data, size_t size)
{
    return parse_document(data, size).to_markdown();
}

std::string DOCXParser::extract_text_from_bytes(const unsigned char *data, size_t size)
{
    return parse_document(data, size).extract_text();
}

bool DOCXParser::is_valid_docx(const unsigned char *data, size_t size)
{
    try
    {
        ZipPackageReader package(data, size);
        return package.hasPart(kDocumentPart);
    }
    catch (const DocxParseError &e)
    {
        Logger::logDebug("Not a DOCX package: %s", e.what());
        return false;
    }
}

Document DOCXParser::parse_package(ZipPackageReader &package)
{
    Document document;

    std::string document_xml = package.readPart(kDocumentPart);
    RelationshipResolver relationships = load_relationships(package, relationshipsPartFor(kDocumentPart));

    DocumentXmlParser::Result body = DocumentXmlParser::parse(document_xml, &relationships);
    document.paragraphs = std::move(body.body.paragraphs);
    document.tables = std::move(body.body.tables);
    document.elements = std::move(body.body.elements);

    if (auto numbering_xml = package.readOptionalPart(kNumberingPart))
    {
        document.numbering_defs = NumberingResolver::resolve(*numbering_xml, kNumberingPart);
    }
    process_lists(document);

    parse_headers_footers(package, relationships, body, document);

    if (auto footnotes_xml = package.readOptionalPart(kFootnotesPart))
    {
        RelationshipResolver note_rels = load_relationships(package, relationshipsPartFor(kFootnotesPart));
        document.footnotes = NotesParser::parse(*footnotes_xml, kFootnotesPart, NoteType::Footnote, &note_rels);
    }

    if (auto endnotes_xml = package.readOptionalPart(kEndnotesPart))
    {
        RelationshipResolver note_rels = load_relationships(package, relationshipsPartFor(kEndnotesPart));
        document.endnotes = NotesParser::parse(*endnotes_xml, kEndnotesPart, NoteType::Endnote, &note_rels);
    }

    if (auto core_xml = package.readOptionalPart(kCorePropertiesPart))
    {
        document.properties = CorePropertiesParser::parse(*core_xml, kCorePropertiesPart);
    }

    Logger::logDebug("Parsed DOCX: %zu paragraphs, %zu tables, %zu list items, %zu headers, %zu footers, %zu footnotes, %zu endnotes",
                     document.paragraphs.size(), document.tables.size(), document.lists.size(),
                     document.headers.size(), document.footers.size(),
                     document.footnotes.size(), document.endnotes.size());
    return document;
}

void DOCXParser::parse_headers_footers(ZipPackageReader &package,
                                       const RelationshipResolver &relationships,
                                       const DocumentXmlParser::Result &body,
                                       Document &document)
{
    auto collect = [&](const std::vector<PartReference> &references, bool headers,
                       std::vector<HeaderFooter> &out)
    {
        std::set<std::string> seen;
        for (const auto &reference : references)
        {
            const Relationship *rel = relationships.find(reference.relationship_id);
            if (!rel || (headers ? !rel->isHeader() : !rel->isFooter()))
            {
                Logger::logDebug("Section reference %s has no matching relationship",
                                 reference.relationship_id.c_str());
                continue;
            }

            std::string part = RelationshipResolver::resolvePartName(rel->target);
            if (!seen.insert(part).second)
            {
                continue;
            }

            auto xml = package.readOptionalPart(part);
            if (!xml)
            {
                Logger::logWarning("Referenced part %s is missing", part.c_str());
                continue;
            }
            RelationshipResolver part_rels = load_relationships(package, relationshipsPartFor(part));
            out.push_back(HeaderFooterParser::parse(*xml, part, reference.type, &part_rels));
        }

        // Packages without section references: probe the conventional part names
        if (references.empty())
        {
            const char *stem = headers ? "word/header" : "word/footer";
            for (int i = 1; i <= 3; ++i)
            {
                std::string part = stem + std::to_string(i) + ".xml";
                if (auto xml = package.readOptionalPart(part))
                {
                    RelationshipResolver part_rels = load_relationships(package, relationshipsPartFor(part));
                    out.push_back(HeaderFooterParser::parse(*xml, part, HeaderFooterType::Default, &part_rels));
                }
            }
        }
    };

    collect(body.header_references, true, document.headers);
    collect(body.footer_references, false, document.footers);
}

void DOCXParser::process_lists(Document &document)
{
    for (const auto &paragraph : document.paragraphs)
    {
        if (!paragraph.is_list_item())
        {
            continue;
        }

        ListItem item;
        item.level = static_cast<uint32_t>(*paragraph.numbering_level < 0 ? 0 : *paragraph.numbering_level);
        item.list_type = document.list_type_for(*paragraph.numbering_id, *paragraph.numbering_level);
        item.text = paragraph.to_text();
        document.lists.push_back(std::move(item));
    }
}

RelationshipResolver DOCXParser::load_relationships(ZipPackageReader &package, const std::string &part_name)
{
    if (auto xml = package.readOptionalPart(part_name))
    {
        return RelationshipResolver::parse(*xml, part_name);
    }
    return RelationshipResolver();
}

} // namespace retrieval
} // namespace docintel
