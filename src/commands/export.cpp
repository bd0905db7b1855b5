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
#include <algorithm>
#include <iostream>
#include <stdexcept>

#include "commands/commands.h"
#include "catalog/collection.h"
#include "providers/snapshot.h"

namespace fontcat {

int ExportCommand::showHelpPage(const std::string_view& programName, const std::string& indentSpaces) const
{
    std::string fullCommand = std::string(programName) + " " + std::string(commandName());
    std::cout << indentSpaces << "Usage: " << fullCommand << " <font-source> --output-option [optional filepath] ..." << std::endl;
    std::cout << indentSpaces << std::endl;
    std::cout << indentSpaces << "Writes the catalog to snapshot files that can be used as a font source later." << std::endl;
    std::cout << indentSpaces << std::endl;
    std::cout << indentSpaces << "Supported output options (at least one is required):" << std::endl;
    for (const auto& format : snapshot::supportedFormats()) {
        std::cout << indentSpaces << "  --" << format << " [optional filepath]" << std::endl;
    }
    std::cout << indentSpaces << std::endl;
    std::cout << indentSpaces << "Options:" << std::endl;
    std::cout << indentSpaces << "  --indent n                      Indent nested elements by n spaces (default " << JSON_INDENT_SPACES << ")" << std::endl;
    std::cout << indentSpaces << "  --no-indent                     Write compact output" << std::endl;
    std::cout << indentSpaces << std::endl;
    std::cout << indentSpaces << "If the filepath is omitted or is a directory, the file is named after the font source." << std::endl;
    std::cout << indentSpaces << std::endl;
    std::cout << indentSpaces << "Examples:" << std::endl;
    std::cout << indentSpaces << "  " << fullCommand << " system --json" << std::endl;
    std::cout << indentSpaces << "  " << fullCommand << " system --json fonts.json --xml fonts.xml" << std::endl;
    std::cout << indentSpaces << "  " << fullCommand << " fonts.json --xml --force" << std::endl;
    return 1;
}

void ExportCommand::execute(const Collection& collection, const std::vector<const char*>& args, const FontcatContext& context) const
{
    const std::filesystem::path sourcePath = utils::utf8ToPath(args[1]);
    const bool sourceIsFile = std::string_view(args[1]) != SYSTEM_SOURCE;

    auto calcOutputFilePath = [&](const std::filesystem::path& path, const std::string& format) -> std::filesystem::path {
        std::filesystem::path retval = path;
        if (retval.empty()) {
            retval = sourceIsFile ? sourcePath.parent_path() : std::filesystem::current_path();
            if (retval.empty()) {
                retval = std::filesystem::current_path();
            }
        }
        if (createDirectoryIfNeeded(retval)) {
            std::filesystem::path outputFileName = sourceIsFile ? sourcePath.filename() : std::filesystem::path(SYSTEM_SOURCE);
            outputFileName.replace_extension(format);
            retval = retval / outputFileName;
        }
        return retval;
    };

    const FontSnapshot fonts = collection.toSnapshot();
    bool outputFormatSpecified = false;
    for (size_t i = 2; i < args.size(); ++i) {
        const std::string option = args[i];
        if (option.rfind("--", 0) != 0) {
            context.logMessage(LogMsg() << "Ignoring unrecognized argument: " << option, LogSeverity::Warning);
            continue;
        }
        const std::string outputFormat = utils::toLowerCase(option.substr(2));
        const auto& formats = snapshot::supportedFormats();
        if (std::find(formats.begin(), formats.end(), outputFormat) == formats.end()) {
            throw std::invalid_argument("Unsupported format: " + outputFormat);
        }
        std::filesystem::path outputFilePath;
        if (i + 1 < args.size() && std::string_view(args[i + 1]).rfind("--", 0) != 0) {
            outputFilePath = utils::utf8ToPath(args[++i]);
        }
        outputFilePath = calcOutputFilePath(outputFilePath, outputFormat);
        outputFormatSpecified = true;
        if (sourceIsFile && std::filesystem::exists(outputFilePath) && std::filesystem::equivalent(sourcePath, outputFilePath)) {
            context.logMessage(LogMsg() << utils::pathToString(outputFilePath) << ": Input and output are the same. No action taken.", LogSeverity::Warning);
            continue;
        }
        if (!context.validateOutputPath(outputFilePath)) {
            continue;
        }
        snapshot::write(outputFilePath, outputFormat, fonts, context);
        context.logMessage(LogMsg() << "Exported " << fonts.size() << " families to " << utils::pathToString(outputFilePath), LogSeverity::Verbose);
    }
    if (!outputFormatSpecified) {
        throw std::invalid_argument("No output option specified. Use --json or --xml.");
    }
}

} // namespace fontcat
