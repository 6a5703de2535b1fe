#pragma once

#include "export.hpp"
#include "retrieval/chunking_types.hpp"
#include <string>

namespace YAML
{
    class Node;
}

namespace docintel {

    /**
     * @brief Settings consumed by the extractor
     *
     * Populated from YAML text or an already loaded node supplied by the
     * embedding application; locating and merging configuration files is left
     * to the caller.
     *
     * @code
     * logging:
     *   level: DEBUG
     *   file: extractor.log
     *   console: false
     * chunking:
     *   max_characters: 800
     *   overlap: 100
     *   trim: true
     *   chunker_type: markdown
     * @endcode
     */
    struct DOCINTEL_API ExtractorConfig {
        std::string logLevel = "INFO";      // ERROR, WARNING (or WARN), INFO, DEBUG
        std::string logFile;                // Empty keeps logging in memory / console only
        bool consoleOutput = true;          // Echo log lines to stdout/stderr

        retrieval::ChunkingConfig chunking;

        ExtractorConfig() = default;

        // Reads the known keys of `node`; unknown keys are ignored. Returns false on type errors.
        bool loadFromNode(const YAML::Node &node);

        bool loadFromString(const std::string &yaml);

        std::string toYamlString() const;

        bool validate() const;

        // Pushes level, console flag and log file into Logger::instance()
        bool applyLogging() const;
    };

} // namespace docintel
