#include "docintel/retrieval/relationships.hpp"
#include "docintel/retrieval/xml_events.hpp"
#include "docintel/logger.hpp"
#include "docintel/utils.hpp"
#include <sstream>

namespace docintel
{
namespace retrieval
{

bool Relationship::isHyperlink() const
{
    return ends_with(type, "/hyperlink");
}

bool Relationship::isHeader() const
{
    return ends_with(type, "/header");
}

bool Relationship::isFooter() const
{
    return ends_with(type, "/footer");
}

RelationshipResolver RelationshipResolver::parse(const std::string &xml, const std::string &part_name)
{
    pugi::xml_document doc;
    loadXml(doc, xml, part_name);

    RelationshipResolver resolver;
    for (pugi::xml_node node : doc.document_element().children("Relationship"))
    {
        Relationship rel;
        rel.id = node.attribute("Id").as_string();
        rel.type = node.attribute("Type").as_string();
        rel.target = node.attribute("Target").as_string();
        std::string mode = node.attribute("TargetMode").as_string();
        if (!mode.empty())
        {
            rel.target_mode = mode;
        }
        if (!rel.id.empty())
        {
            resolver.add(std::move(rel));
        }
    }

    Logger::logDebug("%s: %zu relationships, %zu hyperlinks", part_name.c_str(),
                     resolver.relationships_.size(), resolver.hyperlinks_.size());
    return resolver;
}

void RelationshipResolver::add(Relationship relationship)
{
    if (relationship.isHyperlink())
    {
        hyperlinks_[relationship.id] = relationship.target;
    }
    relationships_.push_back(std::move(relationship));
}

std::optional<std::string> RelationshipResolver::hyperlinkTarget(const std::string &id) const
{
    auto it = hyperlinks_.find(id);
    if (it == hyperlinks_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

const Relationship *RelationshipResolver::find(const std::string &id) const
{
    for (const auto &rel : relationships_)
    {
        if (rel.id == id)
        {
            return &rel;
        }
    }
    return nullptr;
}

std::string RelationshipResolver::resolvePartName(const std::string &target, const std::string &base_dir)
{
    std::string joined = starts_with(target, "/") ? target.substr(1) : base_dir + target;

    std::vector<std::string> segments;
    std::stringstream ss(joined);
    std::string segment;
    while (std::getline(ss, segment, '/'))
    {
        if (segment.empty() || segment == ".")
        {
            continue;
        }
        if (segment == "..")
        {
            if (!segments.empty())
            {
                segments.pop_back();
            }
            continue;
        }
        segments.push_back(segment);
    }

    std::string result;
    for (const auto &part : segments)
    {
        if (!result.empty())
        {
            result += '/';
        }
        result += part;
    }
    return result;
}

} // namespace retrieval
} // namespace docintel
