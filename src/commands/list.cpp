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

#include "commands/commands.h"
#include "catalog/collection.h"

namespace fontcat {

int ListCommand::showHelpPage(const std::string_view& programName, const std::string& indentSpaces) const
{
    std::string fullCommand = std::string(programName) + " " + std::string(commandName());
    std::cout << indentSpaces << "Usage: " << fullCommand << " <font-source> [--variants]" << std::endl;
    std::cout << indentSpaces << std::endl;
    std::cout << indentSpaces << "Lists every font family in enumeration order." << std::endl;
    std::cout << indentSpaces << std::endl;
    std::cout << indentSpaces << "Options:" << std::endl;
    std::cout << indentSpaces << "  --variants                      Also list the variants of each family" << std::endl;
    std::cout << indentSpaces << std::endl;
    std::cout << indentSpaces << "Examples:" << std::endl;
    std::cout << indentSpaces << "  " << fullCommand << " system" << std::endl;
    std::cout << indentSpaces << "  " << fullCommand << " catalog.json --variants" << std::endl;
    return 1;
}

void ListCommand::execute(const Collection& collection, const std::vector<const char*>& args, const FontcatContext& context) const
{
    warnUnusedArguments(args, context);
    for (const auto& family : collection.families()) {
        std::cout << family.name() << std::endl;
        if (context.showVariants) {
            for (const auto& variant : family.getMatchingVariants()) {
                std::cout << "    " << variant.name()
                          << " (weight=" << variant.weight()
                          << ", style=" << variant.style()
                          << ", width=" << variant.width() << ")" << std::endl;
            }
        }
    }
    context.logMessage(LogMsg() << "Listed " << collection.size() << " families", LogSeverity::Verbose);
}

} // namespace fontcat
