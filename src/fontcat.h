/*
 * Copyright (C) 2026, Robert Patterson
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#pragma once

#include <string>
#include <string_view>
#include <sstream>
#include <vector>
#include <optional>
#include <fstream>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <utility>

#include "catalog/fonttypes.h"
#include "utils/stringutils.h"

inline constexpr char SYSTEM_SOURCE[]   = "system";
inline constexpr char JSON_EXTENSION[]  = "json";
inline constexpr char XML_EXTENSION[]   = "xml";

inline constexpr int JSON_INDENT_SPACES = 4;

#ifndef FONTCAT_VERSION
#define FONTCAT_VERSION "0.0.0"
#endif

#define _MAIN main

namespace fontcat {

using LogMsg = std::stringstream;

// Function to find the appropriate processor
template <typename Processors>
inline decltype(Processors::value_type::processor) findProcessor(const Processors& processors, const std::string& extension)
{
    std::string key = utils::toLowerCase(extension);
    if (key.rfind(".", 0) == 0) {
        key = key.substr(1);
    }
    for (const auto& p : processors) {
        if (key == p.extension) {
            return p.processor;
        }
    }
    throw std::invalid_argument("Unsupported format: " + key);
}

/// @brief defines log message severity
enum class LogSeverity
{
    Info,       ///< No error. The message is for information.
    Warning,    ///< Something in the font data was suspicious or had to be corrected, but processing continues.
    Error,      ///< The current command has aborted. This level usually occurs in catch blocks.
    Verbose     ///< Only emit if --verbose option specified. The message is for information.
};

class Collection;

struct FontcatContext
{
public:
    FontcatContext(const std::string& progName)
        : programName(progName)
    {
    }

    mutable bool errorOccurred{};

    std::string programName;
    bool showVersion{};
    bool showHelp{};
    bool overwriteExisting{};
    bool noLog{};
    bool verbose{};
    std::optional<std::filesystem::path> logFilePath;
    std::shared_ptr<std::ofstream> logFile;

    // Specific options for `list` command
    bool showVariants{};

    // Specific options for `match` command
    std::optional<std::string> familyName;
    std::optional<FontWeight> weight;
    std::optional<FontStyle> style;
    std::optional<FontStretch> width;
    std::optional<bool> italic;
    bool rankedOutput{};
    bool showInformation{};

    // Specific options for `query` command
    std::vector<std::pair<std::string, std::string>> filters;

    // Specific options for `export` command
    std::optional<int> indentSpaces{ JSON_INDENT_SPACES };

    // Parse general options and return remaining options
    std::vector<const char*> parseOptions(int argc, char* argv[]);

    // validate output path
    bool validateOutputPath(const std::filesystem::path& outputFilePath) const;

    // Logging methods
    void startLogging(const std::filesystem::path& defaultLogPath, int argc, char* argv[]); ///< Starts logging if logging was requested

    /**
     * @brief logs a message to the log file or to std::cerr
     * @param msg a utf-8 encoded message.
     * @param severity the message severity
    */
    void logMessage(LogMsg&& msg, LogSeverity severity = LogSeverity::Info) const;

    void endLogging(); ///< Ends logging if logging was requested
};

class ICommand
{
public:
    ICommand() = default;
    virtual ~ICommand() = default;

    virtual int showHelpPage(const std::string_view& programName, const std::string& indentSpaces = {}) const = 0;

    /// @brief runs the command against a fully loaded collection.
    /// @param args the remaining arguments: args[0] is the command name and args[1] the font source.
    virtual void execute(const Collection& collection, const std::vector<const char*>& args, const FontcatContext& context) const = 0;

    virtual const std::string_view commandName() const = 0;
};

std::string getTimeStamp(const std::string& fmt);

bool createDirectoryIfNeeded(const std::filesystem::path& path);

} // namespace fontcat

#ifdef FONTCAT_TEST // this is defined on the command line by the test program
#undef _MAIN
#define _MAIN fontcatTestMain
int fontcatTestMain(int argc, char* argv[]);
#undef FONTCAT_VERSION
#define FONTCAT_VERSION "TEST"
#endif
