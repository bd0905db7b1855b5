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
#include <iostream>
#include <chrono>
#include <iomanip>
#include <ctime>

#include "fontcat.h"

namespace fontcat {

std::vector<const char*> FontcatContext::parseOptions(int argc, char* argv[])
{
    std::vector<const char*> args;
    for (int x = 1; x < argc; x++) {
        auto getNextArg = [&]() -> std::string_view {
                if (x + 1 < argc) {
                    std::string_view arg(argv[x + 1]);
                    if (x < (argc - 1) && arg.rfind("--", 0) != 0) {
                        x++;
                        return arg;
                    }
                }
                return {};
            };
        auto invalidValue = [&](std::string_view option, std::string_view value) {
                logMessage(LogMsg() << "Invalid value for " << option << ": \"" << value << "\"", LogSeverity::Error);
            };
        const std::string_view next(argv[x]);
        if (next == "--version") {
            showVersion = true;
        } else if (next == "--help") {
            showHelp = true;
        } else if (next == "--force") {
            overwriteExisting = true;
        } else if (next == "--log") {
            logFilePath = getNextArg();
        } else if (next == "--no-log") {
            noLog = true;
        } else if (next == "--verbose") {
            verbose = true;
        // Specific options for `list` command
        } else if (next == "--variants") {
            showVariants = true;
        // Specific options for `match` command
        } else if (next == "--family") {
            auto option = getNextArg();
            if (!option.empty()) {
                familyName = std::string(option);
            } else {
                invalidValue(next, option);
            }
        } else if (next == "--weight") {
            auto option = getNextArg();
            weight = parseWeight(option);
            if (!weight) {
                invalidValue(next, option);
            }
        } else if (next == "--style") {
            auto option = getNextArg();
            style = parseStyle(option);
            if (!style) {
                invalidValue(next, option);
            }
        } else if (next == "--width") {
            auto option = getNextArg();
            width = parseStretch(option);
            if (!width) {
                invalidValue(next, option);
            }
        } else if (next == "--italic") {
            italic = true;
        } else if (next == "--no-italic") {
            italic = false;
        } else if (next == "--ranked") {
            rankedOutput = true;
        } else if (next == "--info") {
            showInformation = true;
        // Specific options for `query` command
        } else if (next == "--filter") {
            auto option = getNextArg();
            if (auto keyValue = utils::splitKeyValue(option, '=')) {
                filters.push_back(std::move(keyValue.value()));
            } else {
                invalidValue(next, option);
            }
        // Specific options for `export` command
        } else if (next == "--indent") {
            auto option = getNextArg();
            auto spaces = utils::parseInteger(option);
            if (spaces && *spaces >= 0) {
                indentSpaces = spaces;
            } else {
                invalidValue(next, option);
            }
        } else if (next == "--no-indent") {
            indentSpaces = std::nullopt;
        } else {
            args.push_back(argv[x]);
        }
    }
    return args;
}

std::string getTimeStamp(const std::string& fmt)
{
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::tm localTime;
#ifdef _WIN32
    localtime_s(&localTime, &time_t_now); // Windows
#else
    localtime_r(&time_t_now, &localTime); // Linux/Unix
#endif
    std::ostringstream timestamp;
    timestamp << std::put_time(&localTime, fmt.c_str());
    return timestamp.str();
}

void FontcatContext::logMessage(LogMsg&& msg, LogSeverity severity) const
{
    auto getSeverityStr = [severity]() -> std::string {
            switch (severity) {
            default:
            case LogSeverity::Info: return "";
            case LogSeverity::Warning: return "[WARNING] ";
            case LogSeverity::Error: return "[***ERROR***] ";
            }
        };
    if (severity == LogSeverity::Verbose && !verbose) {
        return;
    }
    if (severity == LogSeverity::Error) {
        errorOccurred = true;
    }
    msg.flush();
    if (logFile && logFile->is_open()) {
        LogMsg prefix = LogMsg() << "[" << getTimeStamp("%Y-%m-%d %H:%M:%S") << "] ";
        prefix.flush();
        *logFile << prefix.str() << getSeverityStr() << msg.str() << std::endl;
        if (severity == LogSeverity::Error) {
            *logFile << prefix.str() << "COMMAND ABORTED" << std::endl;
        }
        if (severity != LogSeverity::Error) {
            return;
        }
    }
    std::cerr << getSeverityStr() << msg.str() << std::endl;
}

bool FontcatContext::validateOutputPath(const std::filesystem::path& outputFilePath) const
{
    if (std::filesystem::exists(outputFilePath)) {
        if (overwriteExisting) {
            logMessage(LogMsg() << "Overwriting " << utils::pathToString(outputFilePath));
        } else {
            logMessage(LogMsg() << utils::pathToString(outputFilePath) << " exists. Use --force to overwrite it.", LogSeverity::Warning);
            return false;
        }
    } else {
        logMessage(LogMsg() << "Output: " << utils::pathToString(outputFilePath));
    }

    return true;
}

/** returns true if path is a directory */
bool createDirectoryIfNeeded(const std::filesystem::path& path)
{
    std::error_code ec;
    const bool exists = std::filesystem::exists(path, ec);
    if (!exists && path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    if (std::filesystem::is_directory(path) || (!exists && !path.has_extension())) {
        std::filesystem::create_directories(path);
        return true;
    }
    return false;
}

void FontcatContext::startLogging(const std::filesystem::path& defaultLogPath, int argc, char* argv[])
{
    if (!noLog && logFilePath.has_value() && !logFile) {
        auto& path = logFilePath.value();
        if (path.empty()) {
            path = defaultLogPath / (programName + "-logs");
        }
        if (createDirectoryIfNeeded(path)) {
            std::string logFileName = programName + "-" + getTimeStamp("%Y%m%d-%H%M%S") + ".log";
            path /= logFileName;
        }
        bool appending = std::filesystem::is_regular_file(path);
        logFile = std::make_shared<std::ofstream>();
        logFile->exceptions(std::ios::failbit | std::ios::badbit);
        logFile->open(path, std::ios::app);
        if (appending) {
            *logFile << std::endl;
        }
        logMessage(LogMsg() << "======= START =======");
        logMessage(LogMsg() << programName << " executed with the following arguments:");
        LogMsg args;
        args << programName << " ";
        for (int i = 1; i < argc; i++) {
            args << argv[i] << " ";
        }
        logMessage(std::move(args));
    }
}

void FontcatContext::endLogging()
{
    if (!noLog && logFilePath.has_value() && logFile) {
        logMessage(LogMsg());
        logMessage(LogMsg() << programName << " processing complete");
        logMessage(LogMsg() << "======== END ========");
        logFile.reset();
    }
}

} // namespace fontcat
