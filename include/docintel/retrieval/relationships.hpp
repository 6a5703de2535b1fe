#ifndef DOCINTEL_RELATIONSHIPS_HPP
#define DOCINTEL_RELATIONSHIPS_HPP

#include "../export.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace docintel
{
namespace retrieval
{

struct Relationship
{
    std::string id;
    std::string type;
    std::string target;
    std::string target_mode = "Internal";

    bool isHyperlink() const;
    bool isHeader() const;
    bool isFooter() const;
};

/**
 * @brief Parsed .rels part
 *
 * Keeps every relationship in source order and an id -> target index for
 * hyperlink relations only.
 */
class DOCINTEL_API RelationshipResolver
{
public:
    RelationshipResolver() = default;

    // Throws DocxParseError (Xml) when the part is malformed
    static RelationshipResolver parse(const std::string &xml, const std::string &part_name);

    const std::map<std::string, std::string> &hyperlinks() const { return hyperlinks_; }
    std::optional<std::string> hyperlinkTarget(const std::string &id) const;

    const Relationship *find(const std::string &id) const;
    const std::vector<Relationship> &all() const { return relationships_; }

    /**
     * @brief Package part name for an internal target of a part under `base_dir`
     *
     * "header1.xml" from "word/" becomes "word/header1.xml"; absolute targets
     * ("/word/header1.xml") lose their leading slash; "../" segments are folded.
     */
    static std::string resolvePartName(const std::string &target, const std::string &base_dir = "word/");

private:
    void add(Relationship relationship);

    std::vector<Relationship> relationships_;
    std::map<std::string, std::string> hyperlinks_;
};

} // namespace retrieval
} // namespace docintel

#endif // DOCINTEL_RELATIONSHIPS_HPP
