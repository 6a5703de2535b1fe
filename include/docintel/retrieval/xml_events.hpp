#ifndef DOCINTEL_XML_EVENTS_HPP
#define DOCINTEL_XML_EVENTS_HPP

#include "../export.hpp"
#include <pugixml.hpp>
#include <cstddef>
#include <string>

namespace docintel
{
namespace retrieval
{

/**
 * @brief Start or end tag as reported by the push parser
 *
 * Borrows the parser's buffers, so it is only valid inside the callback
 * that received it. End tags carry no attributes.
 */
class XmlElement
{
public:
    XmlElement(const char *name, const char **attributes) : name_(name), attributes_(attributes) {}

    const char *name() const { return name_; }

    // Value of the attribute, or nullptr when it is absent
    const char *attribute(const char *name) const;

private:
    const char *name_;
    const char **attributes_;
};

/**
 * @brief Receives start / text / end events in document order
 *
 * Element names are the qualified names as written in the part ("w:p"),
 * matching how WordprocessingML producers emit them. Character data may
 * arrive split over several text() calls.
 */
class XmlEventHandler
{
public:
    virtual ~XmlEventHandler() = default;

    virtual void startElement(const XmlElement &element) = 0;
    virtual void text(const char *value, size_t length) = 0;
    virtual void endElement(const XmlElement &element) = 0;
};

/**
 * @brief Feeds `xml` through a streaming parser, forwarding its events to `handler`
 *
 * No tree is built; the only state is what the handler keeps. Throws
 * DocxParseError (Xml) naming `part_name` when the content is not
 * well-formed. Exceptions thrown by the handler stop the scan and are
 * rethrown unchanged.
 */
DOCINTEL_API void scanXml(const std::string &xml, XmlEventHandler &handler, const std::string &part_name);

/**
 * @brief Loads a small metadata part (relationships, core properties) into `doc`
 *
 * Throws DocxParseError (Xml) naming `part_name` when the content is not
 * well-formed.
 */
DOCINTEL_API void loadXml(pugi::xml_document &doc, const std::string &xml, const std::string &part_name);

// Attribute value or empty string
inline std::string attributeValue(const XmlElement &element, const char *name)
{
    const char *value = element.attribute(name);
    return value ? value : "";
}

} // namespace retrieval
} // namespace docintel

#endif // DOCINTEL_XML_EVENTS_HPP
