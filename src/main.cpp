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
#include <map>
#include <optional>
#include <memory>

#include "fontcat.h"
#include "commands/commands.h"
#include "catalog/collection.h"
#include "providers/providers.h"
#include "utils/stringutils.h"

static const auto registeredCommands = []()
    {
        std::map <std::string, std::shared_ptr <fontcat::ICommand>> retval;
        auto listCmd = std::make_shared<fontcat::ListCommand>();
        retval.emplace(listCmd->commandName(), listCmd);
        auto matchCmd = std::make_shared<fontcat::MatchCommand>();
        retval.emplace(matchCmd->commandName(), matchCmd);
        auto queryCmd = std::make_shared<fontcat::QueryCommand>();
        retval.emplace(queryCmd->commandName(), queryCmd);
        auto exportCmd = std::make_shared<fontcat::ExportCommand>();
        retval.emplace(exportCmd->commandName(), exportCmd);
        return retval;
    }();

static int showHelpPage(const std::string_view& programName)
{
    std::cout << "Usage: " << programName << " <command> <font-source> [--options]" << std::endl;
    std::cout << std::endl;
    std::cout << "<font-source> is `" << SYSTEM_SOURCE << "` for the fonts installed on this computer, or a snapshot file written by `export`." << std::endl;
    std::cout << std::endl;

    // General options
    std::cout << "General options:" << std::endl;
    std::cout << "  --help                          Show this help message and exit" << std::endl;
    std::cout << "  --force                         Overwrite existing file(s)" << std::endl;
    std::cout << "  --version                       Show program version and exit" << std::endl;
    std::cout << std::endl;
    std::cout << "By default, messages are sent to std::cerr." << std::endl;
    std::cout << std::endl;
    std::cout << "Logging options:" << std::endl;
    std::cout << "  --log [optional-logfile-path]   Log messages to a file instead of sending them to std::cerr" << std::endl;
    std::cout << "  --no-log                        Always send messages to std::cerr (overrides any other logging options)" << std::endl;
    std::cout << "  --verbose                       Verbose output" << std::endl;
    std::cout << std::endl;
    std::cout << "A relative log path is relative to the current directory.";
    std::cout << std::endl;

    for (const auto& command : registeredCommands) {
        std::string commandStr = "Command " + command.first;
        std::string sepStr(commandStr.size(), '=');
        std::cout << std::endl;
        std::cout << sepStr << std::endl;
        std::cout << commandStr << std::endl;
        std::cout << sepStr << std::endl;
        std::cout << std::endl;
        command.second->showHelpPage(programName, "    ");
    }
    return 1;
}

using namespace fontcat;

int _MAIN(int argc, char* argv[])
{
    if (argc <= 0) {
        std::cerr << "Error: argv[0] is unavailable" << std::endl;
        return 1;
    }

    FontcatContext fontcatContext(utils::pathToString(std::filesystem::path(*argv).stem()));

    if (argc < 2) {
        return showHelpPage(fontcatContext.programName);
    }

    std::vector<const char*> args = fontcatContext.parseOptions(argc, argv);

    if (fontcatContext.showVersion) {
        std::cout << fontcatContext.programName << " " << FONTCAT_VERSION << std::endl;
        return 0;
    }
    if (fontcatContext.showHelp) {
        showHelpPage(fontcatContext.programName);
        return 0;
    }
    if (fontcatContext.errorOccurred) {
        return 1;
    }
    if (args.size() < 2) {
        std::cerr << "Not enough arguments passed" << std::endl;
        return showHelpPage(fontcatContext.programName);
    }

    const auto currentCommand = [args]() -> std::shared_ptr<ICommand> {
            auto it = registeredCommands.find(args[0]);
            if (it != registeredCommands.end()) {
                return it->second;
            } else {
                std::cerr << "Unknown command: " << args[0] << std::endl;
                return nullptr;
            }
        }();
    if (!currentCommand) {
        return showHelpPage(fontcatContext.programName);
    }

    try {
        fontcatContext.startLogging(std::filesystem::current_path(), argc, argv);

        const auto provider = createFontProvider(args[1]);
        const Collection collection(*provider, fontcatContext);
        currentCommand->execute(collection, args, fontcatContext);
    }
    catch (const std::exception& e) {
        fontcatContext.logMessage(LogMsg() << e.what(), LogSeverity::Error);
    }

    fontcatContext.endLogging();

    return fontcatContext.errorOccurred;
}
