#include "docintel/retrieval/xml_events.hpp"
#include "docintel/retrieval/docx_errors.hpp"
#include <expat.h>
#include <algorithm>
#include <cstring>
#include <exception>
#include <memory>
#include <new>
#include <type_traits>
#include <utility>

namespace docintel
{
namespace retrieval
{

namespace
{

constexpr size_t kParseChunkSize = 64 * 1024;

struct ParserDeleter
{
    void operator()(XML_Parser parser) const { XML_ParserFree(parser); }
};

using ParserHandle = std::unique_ptr<std::remove_pointer_t<XML_Parser>, ParserDeleter>;

struct ScanState
{
    XmlEventHandler *handler;
    XML_Parser parser;
    std::exception_ptr error;
};

// Handler exceptions must not unwind through expat's C frames
void stopWith(ScanState *state, std::exception_ptr error)
{
    state->error = std::move(error);
    XML_StopParser(state->parser, XML_FALSE);
}

void XMLCALL startElement(void *userData, const XML_Char *name, const XML_Char **atts)
{
    auto *state = static_cast<ScanState *>(userData);
    if (state->error)
        return;
    try
    {
        state->handler->startElement(XmlElement(name, atts));
    }
    catch (...)
    {
        stopWith(state, std::current_exception());
    }
}

void XMLCALL endElement(void *userData, const XML_Char *name)
{
    auto *state = static_cast<ScanState *>(userData);
    if (state->error)
        return;
    try
    {
        state->handler->endElement(XmlElement(name, nullptr));
    }
    catch (...)
    {
        stopWith(state, std::current_exception());
    }
}

void XMLCALL characterData(void *userData, const XML_Char *s, int len)
{
    auto *state = static_cast<ScanState *>(userData);
    if (state->error)
        return;
    try
    {
        state->handler->text(s, static_cast<size_t>(len));
    }
    catch (...)
    {
        stopWith(state, std::current_exception());
    }
}

} // namespace

const char *XmlElement::attribute(const char *name) const
{
    if (!attributes_)
    {
        return nullptr;
    }
    // Name / value pairs, terminated by a null name
    for (const char **attr = attributes_; attr[0]; attr += 2)
    {
        if (std::strcmp(attr[0], name) == 0)
        {
            return attr[1];
        }
    }
    return nullptr;
}

void scanXml(const std::string &xml, XmlEventHandler &handler, const std::string &part_name)
{
    ParserHandle parser(XML_ParserCreate(nullptr));
    if (!parser)
    {
        throw std::bad_alloc();
    }

    ScanState state{&handler, parser.get(), nullptr};
    XML_SetUserData(parser.get(), &state);
    XML_SetElementHandler(parser.get(), startElement, endElement);
    XML_SetCharacterDataHandler(parser.get(), characterData);

    size_t offset = 0;
    bool done = false;
    while (!done)
    {
        size_t len = std::min(kParseChunkSize, xml.size() - offset);
        done = offset + len == xml.size();

        if (XML_Parse(parser.get(), xml.data() + offset, static_cast<int>(len), done) == XML_STATUS_ERROR)
        {
            if (state.error)
            {
                std::rethrow_exception(state.error);
            }
            throw DocxParseError(DocxParseError::Kind::Xml,
                                 part_name + ": " + XML_ErrorString(XML_GetErrorCode(parser.get())) +
                                     " at line " + std::to_string(XML_GetCurrentLineNumber(parser.get())));
        }
        offset += len;
    }
}

void loadXml(pugi::xml_document &doc, const std::string &xml, const std::string &part_name)
{
    pugi::xml_parse_result result = doc.load_buffer(xml.data(), xml.size(), pugi::parse_default, pugi::encoding_auto);
    if (!result)
    {
        throw DocxParseError(DocxParseError::Kind::Xml,
                             part_name + ": " + result.description() + " at offset " +
                                 std::to_string(result.offset));
    }
}

} // namespace retrieval
} // namespace docintel
