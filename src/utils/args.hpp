#pragma once
#include <string>
#include <stdexcept>
#include "logging.hpp"

// Check if a flag exists in command line args
inline bool hasFlag(int argc, char **argv, const std::string &flag)
{
    for (int i = 1; i < argc; i++)
    {
        if (std::string(argv[i]) == flag)
        {
            return true;
        }
    }
    return false;
}

// Get a string argument from command line
inline std::string getArg(int argc, char **argv, const std::string &flag, const std::string &defaultValue)
{
    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == flag && i + 1 < argc)
        {
            return argv[i + 1];
        }
    }
    return defaultValue;
}

inline std::string getArg(int argc, char **argv, const std::string &flag, const char *defaultValue)
{
    return getArg(argc, argv, flag, std::string(defaultValue));
}

// Get an integer argument, falls back to the default on malformed input
inline int getArg(int argc, char **argv, const std::string &flag, int defaultValue)
{
    std::string value = getArg(argc, argv, flag, "");
    if (value.empty())
    {
        return defaultValue;
    }
    try
    {
        return std::stoi(value);
    }
    catch (const std::exception &)
    {
        log_warning("Invalid integer for " + flag + ": " + value + ", using " + std::to_string(defaultValue));
        return defaultValue;
    }
}

// Get a floating point argument, falls back to the default on malformed input
inline double getArg(int argc, char **argv, const std::string &flag, double defaultValue)
{
    std::string value = getArg(argc, argv, flag, "");
    if (value.empty())
    {
        return defaultValue;
    }
    try
    {
        return std::stod(value);
    }
    catch (const std::exception &)
    {
        log_warning("Invalid number for " + flag + ": " + value + ", using " + std::to_string(defaultValue));
        return defaultValue;
    }
}
