#ifndef DOCINTEL_DOCUMENT_RESPONSE_MODEL_HPP
#define DOCINTEL_DOCUMENT_RESPONSE_MODEL_HPP

#include "../export.hpp"
#include "../retrieval/docx_document.hpp"
#include "model_interface.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace docintel
{

/**
 * @brief A table as a cell grid plus its Markdown rendering
 */
struct TableData
{
    std::vector<std::vector<std::string>> cells;
    std::string markdown;
};

struct NoteData
{
    std::string id;
    std::string type; // "footnote" or "endnote"
    std::string text;
};

/**
 * @brief Model for the extraction result of one DOCX package
 *
 * Carries the Markdown and plain-text renderings together with the separately
 * collected tables, header/footer text, notes and core properties.
 */
class DOCINTEL_API DocumentResponse : public IModel
{
public:
    std::string markdown;
    std::string text;
    std::vector<TableData> tables;
    std::vector<std::string> headers;
    std::vector<std::string> footers;
    std::vector<NoteData> notes;

    // Only properties present in the package
    std::map<std::string, std::string> properties;

    DocumentResponse() = default;
    virtual ~DocumentResponse() = default;

    static DocumentResponse fromDocument(const retrieval::Document &document);

    bool validate() const override;
    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json &j) override;
};

} // namespace docintel

#endif // DOCINTEL_DOCUMENT_RESPONSE_MODEL_HPP
