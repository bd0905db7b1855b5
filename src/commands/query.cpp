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
#include "catalog/query.h"

namespace fontcat {

int QueryCommand::showHelpPage(const std::string_view& programName, const std::string& indentSpaces) const
{
    std::string fullCommand = std::string(programName) + " " + std::string(commandName());
    std::cout << indentSpaces << "Usage: " << fullCommand << " <font-source> --filter name=value [--filter name=value ...]" << std::endl;
    std::cout << indentSpaces << std::endl;
    std::cout << indentSpaces << "Prints every variant whose font properties equal all of the given values." << std::endl;
    std::cout << indentSpaces << std::endl;
    std::cout << indentSpaces << "Filterable properties:" << std::endl;
    for (const auto& descriptor : propertyDescriptors()) {
        if (descriptor.filterable) {
            std::cout << indentSpaces << "  " << descriptor.name << std::endl;
        }
    }
    for (const auto& alias : propertyAliases()) {
        if (findPropertyDescriptor(alias.name)->filterable) {
            std::cout << indentSpaces << "  " << alias.name << " (same as " << canonicalPropertyName(alias.id) << ")" << std::endl;
        }
    }
    std::cout << indentSpaces << std::endl;
    std::cout << indentSpaces << "Examples:" << std::endl;
    std::cout << indentSpaces << "  " << fullCommand << " system --filter \"full_name=Arial Bold Italic\"" << std::endl;
    std::cout << indentSpaces << "  " << fullCommand << " catalog.xml --filter win32_family_names=Arial --filter postscript_name=Arial-BoldMT" << std::endl;
    return 1;
}

void QueryCommand::execute(const Collection& collection, const std::vector<const char*>& args, const FontcatContext& context) const
{
    warnUnusedArguments(args, context);
    FontFilters filters;
    for (const auto& [name, value] : context.filters) {
        filters.push_back(FontFilter{ name, FilterValue(std::in_place_type<std::string>, value) });
    }
    const auto variants = getMatchingVariants(collection, filters);
    for (const auto& variant : variants) {
        std::cout << variant << std::endl;
    }
    context.logMessage(LogMsg() << variants.size() << " matching variants", LogSeverity::Verbose);
}

} // namespace fontcat
