#ifndef DOCINTEL_NUMBERING_HPP
#define DOCINTEL_NUMBERING_HPP

#include "../export.hpp"
#include "docx_document.hpp"
#include <map>
#include <string>

namespace docintel
{
namespace retrieval
{

/**
 * @brief Resolves (numId, ilvl) pairs of word/numbering.xml to list types
 *
 * A w:num may appear before or after the w:abstractNum it references, so the
 * part is read in two phases: the first pass collects
 * abstractNumId -> (ilvl -> ListType) and numId -> abstractNumId, the second
 * chains them. Level overrides declared on a w:num win over the abstract
 * definition.
 */
class DOCINTEL_API NumberingResolver
{
public:
    // Throws DocxParseError (Xml) when the part is malformed
    static NumberingDefinitions resolve(const std::string &xml, const std::string &part_name = "word/numbering.xml");

    // decimal, decimalZero, lower/upperLetter, lower/upperRoman are numbered; everything else is a bullet
    static ListType listTypeForFormat(const std::string &num_fmt);

    struct Tables
    {
        std::map<int64_t, std::map<int64_t, ListType>> abstract_levels;
        std::map<int64_t, int64_t> num_to_abstract;
        std::map<int64_t, std::map<int64_t, ListType>> level_overrides;
    };

    static Tables collect(const std::string &xml, const std::string &part_name);
    static NumberingDefinitions chain(const Tables &tables);
};

} // namespace retrieval
} // namespace docintel

#endif // DOCINTEL_NUMBERING_HPP
