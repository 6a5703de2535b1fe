#include "docintel/extractor_config.hpp"
#include "docintel/logger.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>

namespace docintel {

    namespace {
        std::string upperCase(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return value;
        }
    } // namespace

    bool ExtractorConfig::loadFromNode(const YAML::Node &config)
    {
        try
        {
            // Load logging settings
            if (config["logging"])
            {
                auto logging = config["logging"];
                if (logging["level"])
                    logLevel = upperCase(logging["level"].as<std::string>());
                if (logging["file"])
                    logFile = logging["file"].as<std::string>();
                if (logging["console"])
                    consoleOutput = logging["console"].as<bool>();
            }

            // Load chunking defaults
            if (config["chunking"])
            {
                auto chunkingNode = config["chunking"];
                if (chunkingNode["max_characters"])
                    chunking.max_characters = chunkingNode["max_characters"].as<size_t>();
                if (chunkingNode["overlap"])
                    chunking.overlap = chunkingNode["overlap"].as<size_t>();
                if (chunkingNode["trim"])
                    chunking.trim = chunkingNode["trim"].as<bool>();
                if (chunkingNode["chunker_type"])
                {
                    const std::string name = chunkingNode["chunker_type"].as<std::string>();
                    auto type = retrieval::parseChunkerType(name);
                    if (!type)
                    {
                        Logger::logError("Invalid chunker_type in configuration: %s", name.c_str());
                        return false;
                    }
                    chunking.chunker_type = *type;
                }
            }
        }
        catch (const YAML::Exception &e)
        {
            Logger::logError("Error reading configuration: %s", e.what());
            return false;
        }

        return validate();
    }

    bool ExtractorConfig::loadFromString(const std::string &yaml)
    {
        YAML::Node config;
        try
        {
            config = YAML::Load(yaml);
        }
        catch (const YAML::Exception &e)
        {
            Logger::logError("Error parsing configuration: %s", e.what());
            return false;
        }

        if (config.IsNull())
        {
            return validate();
        }
        if (!config.IsMap())
        {
            Logger::logError("Configuration root must be a mapping");
            return false;
        }
        return loadFromNode(config);
    }

    std::string ExtractorConfig::toYamlString() const
    {
        YAML::Node config;
        config["logging"]["level"] = logLevel;
        config["logging"]["file"] = logFile;
        config["logging"]["console"] = consoleOutput;

        config["chunking"]["max_characters"] = chunking.max_characters;
        config["chunking"]["overlap"] = chunking.overlap;
        config["chunking"]["trim"] = chunking.trim;
        config["chunking"]["chunker_type"] = retrieval::chunkerTypeToString(chunking.chunker_type);

        YAML::Emitter out;
        out << config;
        return out.c_str();
    }

    bool ExtractorConfig::validate() const
    {
        if (logLevel != "DEBUG" && logLevel != "INFO" && logLevel != "WARN" && logLevel != "WARNING" && logLevel != "ERROR")
        {
            Logger::logError("Invalid log level: %s", logLevel.c_str());
            return false;
        }

        if (chunking.max_characters == 0)
        {
            Logger::logError("chunking.max_characters must be greater than zero");
            return false;
        }

        if (chunking.overlap >= chunking.max_characters)
        {
            Logger::logError("chunking.overlap (%zu) must be less than chunking.max_characters (%zu)",
                             chunking.overlap, chunking.max_characters);
            return false;
        }

        return true;
    }

    bool ExtractorConfig::applyLogging() const
    {
        Logger &logger = Logger::instance();
        logger.setLevel(Logger::parseLevel(logLevel));
        logger.setConsoleOutput(consoleOutput);

        if (!logFile.empty() && !logger.setLogFile(logFile))
        {
            Logger::logWarning("Could not open log file: %s", logFile.c_str());
            return false;
        }
        return true;
    }

} // namespace docintel
