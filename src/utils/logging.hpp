#pragma once

#include <iostream>
#include <fstream>
#include <string>
#include <iomanip>
#include <chrono>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <sys/stat.h>

using namespace std;

namespace logging
{
    enum class LogLevel
    {
        ERROR = 0,   // Most important - always show
        WARNING = 1, // Important - usually show
        INFO = 2,    // Normal - sometimes show
        DEBUG = 3    // Least important - rarely show
    };

    // Process-wide settings, shared by every translation unit
    struct LogSettings
    {
        LogLevel level = LogLevel::WARNING; // Default: show ERROR and WARNING only
        bool showTimestamp = false;         // Console timestamps off by default
        bool fileLogging = false;           // File logging off by default
        string filePath = "logs/openpothole.log";
    };

    inline LogSettings &settings()
    {
        static LogSettings instance;
        return instance;
    }

    inline void setLogLevel(LogLevel level)
    {
        settings().level = level;
    }

    // Create the parent directory of a log file (single level, like mkdir without -p)
    inline bool ensureParentDirectory(const string &filepath)
    {
        size_t slash = filepath.find_last_of('/');
        if (slash == string::npos || slash == 0)
            return true;

        string dir = filepath.substr(0, slash);
        if (mkdir(dir.c_str(), 0755) == 0 || errno == EEXIST)
            return true;

        cerr << "Cannot create log directory " << dir << endl;
        return false;
    }

    // Enable/disable file logging, returns false if the file cannot be opened
    inline bool setFileLogging(bool enable, const string &filepath = "logs/openpothole.log")
    {
        LogSettings &s = settings();
        s.fileLogging = false;
        s.filePath = filepath;

        if (!enable)
            return true;

        if (!ensureParentDirectory(filepath))
            return false;

        ofstream logFile(filepath, ios::app);
        if (!logFile.is_open())
            return false;

        logFile << "\n========== OpenPothole Session Started ==========\n";
        s.fileLogging = true;
        return true;
    }

    inline string getCurrentTimestamp()
    {
        auto now = chrono::system_clock::now();
        auto time_t = chrono::system_clock::to_time_t(now);
        auto ms = chrono::duration_cast<chrono::milliseconds>(now.time_since_epoch()) % 1000;

        stringstream ss;
        ss << put_time(localtime(&time_t), "%H:%M:%S");
        ss << '.' << setfill('0') << setw(3) << ms.count();
        return ss.str();
    }

    inline string logLevelToString(LogLevel level)
    {
        switch (level)
        {
        case LogLevel::ERROR:
            return "ERROR";
        case LogLevel::WARNING:
            return "WARN";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::DEBUG:
            return "DEBUG";
        default:
            return "UNKNOWN";
        }
    }

    // Parse a level name from the command line or config ("debug", "info", ...)
    inline bool parseLogLevel(const string &name, LogLevel &level)
    {
        string lower = name;
        transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

        if (lower == "error")
            level = LogLevel::ERROR;
        else if (lower == "warning" || lower == "warn")
            level = LogLevel::WARNING;
        else if (lower == "info")
            level = LogLevel::INFO;
        else if (lower == "debug")
            level = LogLevel::DEBUG;
        else
            return false;
        return true;
    }

// Highlight numbers in cyan, works for any type with to_string() support
#define log_string(value) ("\033[36m" + std::to_string(value) + "\033[0m")

    // Extract module name from function signature: "ns::Class::fn" -> "NS"
    inline string extractModuleName(const string &function)
    {
        if (function.find("logging::") != string::npos ||
            function.find("extractModuleName") != string::npos)
        {
            return "SYSTEM";
        }

        size_t parenPos = function.find('(');
        size_t colonPos = function.find("::");
        if (colonPos != string::npos && (parenPos == string::npos || colonPos < parenPos))
        {
            size_t startPos = 0;
            size_t spacePos = function.rfind(' ', colonPos);
            if (spacePos != string::npos)
            {
                startPos = spacePos + 1;
            }

            string moduleName = function.substr(startPos, colonPos - startPos);
            transform(moduleName.begin(), moduleName.end(), moduleName.begin(), ::toupper);
            return moduleName;
        }

        return "SYSTEM";
    }

    // Remove ANSI escape sequences before writing to the log file
    inline string stripColorCodes(const string &text)
    {
        string result = text;
        size_t pos = 0;

        while ((pos = result.find("\033[", pos)) != string::npos)
        {
            size_t endPos = result.find('m', pos);
            if (endPos != string::npos)
            {
                result.erase(pos, endPos - pos + 1);
            }
            else
            {
                break; // Malformed escape sequence
            }
        }

        return result;
    }

    inline const char *levelColor(LogLevel level)
    {
        switch (level)
        {
        case LogLevel::ERROR:
            return "\033[91m"; // Bright red
        case LogLevel::WARNING:
            return "\033[33m"; // Orange
        case LogLevel::INFO:
            return "\033[92m"; // Lime green
        case LogLevel::DEBUG:
            return "\033[34m"; // Blue
        default:
            return "";
        }
    }

    // [time][LEVEL][MODULE] - message, colored for the terminal
    inline string formatConsoleLine(const string &message, LogLevel level, const string &moduleName,
                                    const string &timestamp, bool withTimestamp)
    {
        const string bracket = "\033[37m"; // White
        const string reset = "\033[0m";

        string line;
        if (withTimestamp)
            line += bracket + "[" + "\033[32m" + timestamp + bracket + "]" + reset;

        line += bracket + "[" + levelColor(level) + logLevelToString(level) + bracket + "]";
        line += bracket + "[" + "\033[90m" + moduleName + bracket + "]" + reset;
        return line + " - " + message;
    }

    // Log file lines always carry a timestamp and never colors
    inline string formatFileLine(const string &message, LogLevel level, const string &moduleName,
                                 const string &timestamp)
    {
        return "[" + timestamp + "][" + logLevelToString(level) + "][" + moduleName + "] - " + stripColorCodes(message);
    }

    inline void log(const string &message, LogLevel level = LogLevel::INFO, const string &moduleName = "SYSTEM")
    {
        const LogSettings &s = settings();
        if (level > s.level)
            return;

        string timestamp = getCurrentTimestamp();

        // stdout stays free for --json output
        cerr << formatConsoleLine(message, level, moduleName, timestamp, s.showTimestamp) << endl;

        if (s.fileLogging)
        {
            ofstream logFile(s.filePath, ios::app);
            if (logFile.is_open())
                logFile << formatFileLine(message, level, moduleName, timestamp) << endl;
        }
    }

// Macros that auto-detect the module name
#define LOG_ERROR(message) logging::log(message, logging::LogLevel::ERROR, logging::extractModuleName(__PRETTY_FUNCTION__))
#define LOG_WARNING(message) logging::log(message, logging::LogLevel::WARNING, logging::extractModuleName(__PRETTY_FUNCTION__))
#define LOG_INFO(message) logging::log(message, logging::LogLevel::INFO, logging::extractModuleName(__PRETTY_FUNCTION__))
#define LOG_DEBUG(message) logging::log(message, logging::LogLevel::DEBUG, logging::extractModuleName(__PRETTY_FUNCTION__))

#define log_error(message) LOG_ERROR(message)
#define log_warning(message) LOG_WARNING(message)
#define log_info(message) LOG_INFO(message)
#define log_debug(message) LOG_DEBUG(message)

}
