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
#include <fstream>
#include <stdexcept>
#include <string>

#include "pugixml.hpp"

#include "providers/snapshot.h"
#include "fontcat.h"

namespace fontcat {
namespace snapshot {

using XmlDocument = ::pugi::xml_document;
using XmlElement = ::pugi::xml_node;
using XmlAttribute = ::pugi::xml_attribute;

inline constexpr char ROOT_ELEMENT[] = "fontCatalog";
inline constexpr char FAMILY_ELEMENT[] = "family";
inline constexpr char VARIANT_ELEMENT[] = "variant";
inline constexpr char PROPERTY_ELEMENT[] = "property";

namespace {

VariantRecord readVariant(const XmlElement& variantElement, const std::string& familyName, const FontcatContext& context)
{
    VariantRecord result;
    result.name = variantElement.attribute("name").as_string();
    result.weight = variantElement.attribute("weight").as_int(weight::NORMAL);
    result.width = variantElement.attribute("width").as_int(stretch::NORMAL);
    result.filename = variantElement.attribute("filename").as_string();
    const std::string styleText = variantElement.attribute("style").as_string("normal");
    if (auto style = parseStyle(styleText)) {
        result.style = style.value();
    } else {
        context.logMessage(LogMsg() << "font variant '" << result.name << "' of family '" << familyName
            << "' has unknown style \"" << styleText << "\". Using normal.", LogSeverity::Warning);
    }
    for (auto propertyElement : variantElement.children(PROPERTY_ELEMENT)) {
        const std::string propertyName = propertyElement.attribute("name").as_string();
        if (propertyName.empty()) {
            // hand-edited catalogs may give only the numeric id
            if (auto id = propertyIdFromInt(propertyElement.attribute("id").as_int())) {
                result.properties.emplace_back(id.value(), propertyElement.text().as_string());
                continue;
            }
        }
        const auto* descriptor = findPropertyDescriptor(propertyName);
        if (!descriptor) {
            context.logMessage(LogMsg() << "font variant '" << result.name << "' of family '" << familyName
                << "': unknown property '" << propertyName << "' skipped", LogSeverity::Warning);
            continue;
        }
        result.properties.emplace_back(descriptor->id, propertyElement.text().as_string());
    }
    return result;
}

} // namespace

FontSnapshot readXml(const std::filesystem::path& inputPath, const FontcatContext& context)
{
    // open the file ourselves to avoid encoding issues for path strings
    std::ifstream file;
    file.exceptions(std::ios::badbit);
    file.open(inputPath, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Unable to open " + utils::pathToString(inputPath));
    }
    XmlDocument xmlDoc;
    const auto loadResult = xmlDoc.load(file);
    if (!loadResult) {
        throw std::runtime_error("Load XML failed: " + utils::pathToString(inputPath) + ": " + loadResult.description());
    }
    const auto rootElement = xmlDoc.child(ROOT_ELEMENT);
    if (!rootElement) {
        throw std::runtime_error(utils::pathToString(inputPath) + " is not a font catalog snapshot.");
    }
    const int version = rootElement.attribute("version").as_int(SNAPSHOT_VERSION);
    if (version > SNAPSHOT_VERSION) {
        context.logMessage(LogMsg() << utils::pathToString(inputPath) << " has snapshot version " << version
            << ". Unknown elements are ignored.", LogSeverity::Warning);
    }

    FontSnapshot result;
    for (auto familyElement : rootElement.children(FAMILY_ELEMENT)) {
        FamilyRecord family;
        family.name = familyElement.attribute("name").as_string();
        for (auto variantElement : familyElement.children(VARIANT_ELEMENT)) {
            family.variants.push_back(readVariant(variantElement, family.name, context));
        }
        result.push_back(std::move(family));
    }
    return result;
}

void writeXml(const std::filesystem::path& outputPath, const FontSnapshot& fonts, const FontcatContext& context)
{
    XmlDocument xmlDoc;
    auto declaration = xmlDoc.append_child(pugi::node_declaration);
    declaration.append_attribute("version") = "1.0";
    declaration.append_attribute("encoding") = "UTF-8";
    auto rootElement = xmlDoc.append_child(ROOT_ELEMENT);
    rootElement.append_attribute("version") = SNAPSHOT_VERSION;
    for (const auto& family : fonts) {
        auto familyElement = rootElement.append_child(FAMILY_ELEMENT);
        familyElement.append_attribute("name") = family.name.c_str();
        for (const auto& variant : family.variants) {
            auto variantElement = familyElement.append_child(VARIANT_ELEMENT);
            variantElement.append_attribute("name") = variant.name.c_str();
            variantElement.append_attribute("weight") = variant.weight;
            variantElement.append_attribute("style") = utils::toLowerCase(toString(variant.style)).c_str();
            variantElement.append_attribute("width") = variant.width;
            variantElement.append_attribute("filename") = variant.filename.c_str();
            for (const auto& [id, value] : variant.properties) {
                auto propertyElement = variantElement.append_child(PROPERTY_ELEMENT);
                propertyElement.append_attribute("name") = std::string(canonicalPropertyName(id)).c_str();
                propertyElement.append_attribute("id") = static_cast<int>(id);
                propertyElement.text().set(value.c_str());
            }
        }
    }

    // open the file ourselves to avoid encoding issues for path strings
    std::ofstream file;
    file.exceptions(std::ofstream::failbit | std::ofstream::badbit);
    file.open(outputPath, std::ios::out | std::ios::binary);
    const std::string indent(static_cast<size_t>(context.indentSpaces.value_or(0)), ' ');
    xmlDoc.save(file, indent.c_str(), context.indentSpaces ? pugi::format_default : pugi::format_raw);
    file.close();
}

} // namespace snapshot
} // namespace fontcat
