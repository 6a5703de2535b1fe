#pragma once

#include "export.hpp"

#include <cstdarg>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace docintel
{

enum class LogLevel
{
	LOG_ERROR,
	LOG_WARNING,
	LOG_INFO,
	LOG_DEBUG
};

struct LogEntry
{
	LogLevel level;
	std::string timestamp;
	std::string message;
};

class DOCINTEL_API Logger
{
public:
	static Logger& instance();

	Logger(const Logger&) = delete;
	Logger& operator=(const Logger&) = delete;
	Logger(Logger&&) = delete;
	Logger& operator=(Logger&&) = delete;

	// Set minimum log level
	void setLevel(LogLevel level);
	LogLevel level() const;

	// Console output is on by default; embedders usually route to a file instead
	void setConsoleOutput(bool enabled);

	// Keep at most this many entries in memory (0 disables retention)
	void setMaxRetainedEntries(size_t count);

	bool setLogFile(const std::string& filePath);

	void error(const std::string& message);
	void warning(const std::string& message);
	void info(const std::string& message);
	void debug(const std::string& message);

	void error(const char* format, ...);
	void warning(const char* format, ...);
	void info(const char* format, ...);
	void debug(const char* format, ...);

	static void logError(const std::string& message);
	static void logWarning(const std::string& message);
	static void logInfo(const std::string& message);
	static void logDebug(const std::string& message);

	static void logError(const char* format, ...);
	static void logWarning(const char* format, ...);
	static void logInfo(const char* format, ...);
	static void logDebug(const char* format, ...);

	// Snapshot of retained entries
	std::vector<LogEntry> getLogs() const;
	void clearLogs();

	static LogLevel parseLevel(const std::string& name, LogLevel fallback = LogLevel::LOG_INFO);
	static std::string levelToString(LogLevel level);

private:
	Logger();
	~Logger();

	void log(LogLevel level, const std::string& message);
	bool enabled(LogLevel level) const;

	static std::string formatString(const char* format, va_list args);
	static std::string getCurrentTimestamp();

	LogLevel minLevel;
	bool consoleOutput;
	size_t maxRetained;
#pragma warning(push)
#pragma warning(disable: 4251)
	std::vector<LogEntry> logs;
	std::ofstream logFile;
	std::string logFilePath;
#pragma warning(pop)
	mutable std::mutex logMutex;
};

} // namespace docintel
