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
#include <stdexcept>

#include "commands/commands.h"
#include "catalog/collection.h"

namespace fontcat {

int MatchCommand::showHelpPage(const std::string_view& programName, const std::string& indentSpaces) const
{
    std::string fullCommand = std::string(programName) + " " + std::string(commandName());
    std::cout << indentSpaces << "Usage: " << fullCommand << " <font-source> --family <name> [--options]" << std::endl;
    std::cout << indentSpaces << std::endl;
    std::cout << indentSpaces << "Prints the variant of a family that best matches the requested weight, style and width." << std::endl;
    std::cout << indentSpaces << "Without --width, the nearest weight within the best available style wins." << std::endl;
    std::cout << indentSpaces << "With --width, style is compared first, then width, then weight." << std::endl;
    std::cout << indentSpaces << std::endl;
    std::cout << indentSpaces << "Options:" << std::endl;
    std::cout << indentSpaces << "  --family name                   The family to search (exact, case-sensitive)" << std::endl;
    std::cout << indentSpaces << "  --weight n|name                 Requested weight, 1-1000 or a name such as semi-bold (default 400)" << std::endl;
    std::cout << indentSpaces << "  --style normal|oblique|italic   Requested style (default normal)" << std::endl;
    std::cout << indentSpaces << "  --width 1-9|name                Requested width class such as condensed (default: not compared)" << std::endl;
    std::cout << indentSpaces << "  --italic, --no-italic           Shorthand for --style italic or --style normal" << std::endl;
    std::cout << indentSpaces << "  --ranked                        Print every variant, best match first" << std::endl;
    std::cout << indentSpaces << "  --info                          Print the font properties of the chosen variant" << std::endl;
    std::cout << indentSpaces << std::endl;
    std::cout << indentSpaces << "Examples:" << std::endl;
    std::cout << indentSpaces << "  " << fullCommand << " system --family Arial --weight bold --italic" << std::endl;
    std::cout << indentSpaces << "  " << fullCommand << " catalog.json --family Arial --width 3 --ranked" << std::endl;
    return 1;
}

void MatchCommand::execute(const Collection& collection, const std::vector<const char*>& args, const FontcatContext& context) const
{
    warnUnusedArguments(args, context);
    if (!context.familyName.has_value()) {
        throw std::invalid_argument("The match command requires --family <name>.");
    }
    if (context.style.has_value() && context.italic.has_value()) {
        context.logMessage(LogMsg() << "Both --style and --italic given. Using --style " << context.style.value(), LogSeverity::Warning);
    }

    const Family family = collection.at(context.familyName.value());
    VariantQuery query;
    query.weight = context.weight;
    query.style = context.style;
    query.width = context.width;
    query.italic = context.italic;

    if (context.rankedOutput) {
        size_t rank = 0;
        for (const auto& variant : family.getRankedVariants(query)) {
            std::cout << ++rank << ". " << variant << std::endl;
        }
    } else {
        std::cout << family.getBestVariant(query) << std::endl;
    }

    if (context.showInformation) {
        const auto& information = family.getBestVariant(query).information();
        for (const auto& entry : information) {
            std::cout << "    " << entry.name << " (" << static_cast<int>(entry.id) << "): " << entry.value << std::endl;
        }
    }
}

} // namespace fontcat
