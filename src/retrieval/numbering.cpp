#include "docintel/retrieval/numbering.hpp"
#include "docintel/retrieval/xml_events.hpp"
#include "docintel/logger.hpp"
#include "docintel/utils.hpp"
#include <cstring>
#include <optional>

namespace docintel
{
namespace retrieval
{

namespace
{

class NumberingHandler : public XmlEventHandler
{
public:
    explicit NumberingHandler(NumberingResolver::Tables &tables) : tables_(tables) {}

    void startElement(const XmlElement &element) override
    {
        const char *name = element.name();

        if (std::strcmp(name, "w:abstractNum") == 0)
        {
            abstract_id_ = parse_integer(attributeValue(element, "w:abstractNumId"));
            level_.reset();
        }
        else if (std::strcmp(name, "w:num") == 0)
        {
            num_id_ = parse_integer(attributeValue(element, "w:numId"));
            override_level_.reset();
        }
        else if (std::strcmp(name, "w:abstractNumId") == 0 && num_id_)
        {
            auto target = parse_integer(attributeValue(element, "w:val"));
            if (target)
            {
                tables_.num_to_abstract[*num_id_] = *target;
            }
        }
        else if (std::strcmp(name, "w:lvlOverride") == 0 && num_id_)
        {
            override_level_ = parse_integer(attributeValue(element, "w:ilvl"));
        }
        else if (std::strcmp(name, "w:lvl") == 0)
        {
            level_ = parse_integer(attributeValue(element, "w:ilvl"));
        }
        else if (std::strcmp(name, "w:numFmt") == 0)
        {
            ListType type = NumberingResolver::listTypeForFormat(attributeValue(element, "w:val"));
            if (num_id_ && override_level_)
            {
                tables_.level_overrides[*num_id_][*override_level_] = type;
            }
            else if (abstract_id_ && level_)
            {
                tables_.abstract_levels[*abstract_id_][*level_] = type;
            }
        }
    }

    void text(const char *, size_t) override {}

    void endElement(const XmlElement &element) override
    {
        const char *name = element.name();

        if (std::strcmp(name, "w:abstractNum") == 0)
        {
            abstract_id_.reset();
            level_.reset();
        }
        else if (std::strcmp(name, "w:num") == 0)
        {
            num_id_.reset();
            override_level_.reset();
        }
        else if (std::strcmp(name, "w:lvlOverride") == 0)
        {
            override_level_.reset();
        }
        else if (std::strcmp(name, "w:lvl") == 0)
        {
            level_.reset();
        }
    }

private:
    NumberingResolver::Tables &tables_;
    std::optional<int64_t> abstract_id_;
    std::optional<int64_t> level_;
    std::optional<int64_t> num_id_;
    std::optional<int64_t> override_level_;
};

} // namespace

ListType NumberingResolver::listTypeForFormat(const std::string &num_fmt)
{
    if (num_fmt == "decimal" || num_fmt == "decimalZero" || num_fmt == "lowerLetter" ||
        num_fmt == "upperLetter" || num_fmt == "lowerRoman" || num_fmt == "upperRoman")
    {
        return ListType::Numbered;
    }
    return ListType::Bullet;
}

NumberingResolver::Tables NumberingResolver::collect(const std::string &xml, const std::string &part_name)
{
    Tables tables;
    NumberingHandler handler(tables);
    scanXml(xml, handler, part_name);
    return tables;
}

NumberingDefinitions NumberingResolver::chain(const Tables &tables)
{
    NumberingDefinitions defs;

    for (const auto &[num_id, abstract_id] : tables.num_to_abstract)
    {
        auto levels = tables.abstract_levels.find(abstract_id);
        if (levels == tables.abstract_levels.end())
        {
            Logger::logDebug("numId %lld references unknown abstractNumId %lld",
                             static_cast<long long>(num_id), static_cast<long long>(abstract_id));
            continue;
        }
        for (const auto &[level, type] : levels->second)
        {
            defs[NumberingKey(num_id, level)] = type;
        }
    }

    for (const auto &[num_id, levels] : tables.level_overrides)
    {
        for (const auto &[level, type] : levels)
        {
            defs[NumberingKey(num_id, level)] = type;
        }
    }

    return defs;
}

NumberingDefinitions NumberingResolver::resolve(const std::string &xml, const std::string &part_name)
{
    NumberingDefinitions defs = chain(collect(xml, part_name));
    Logger::logDebug("%s: resolved %zu numbering levels", part_name.c_str(), defs.size());
    return defs;
}

} // namespace retrieval
} // namespace docintel
