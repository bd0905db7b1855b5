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

#include "nlohmann/json.hpp"

#include "providers/snapshot.h"
#include "fontcat.h"

namespace fontcat {
namespace snapshot {

using json = nlohmann::ordered_json;

namespace {

std::string styleToText(FontStyle style)
{
    return utils::toLowerCase(toString(style));
}

VariantRecord readVariant(const json& jsonVariant, const std::string& familyName, const FontcatContext& context)
{
    VariantRecord result;
    result.name = jsonVariant.value("name", std::string{});
    result.weight = jsonVariant.value("weight", weight::NORMAL);
    result.width = jsonVariant.value("width", stretch::NORMAL);
    result.filename = jsonVariant.value("filename", std::string{});
    const std::string styleText = jsonVariant.value("style", std::string("normal"));
    if (auto style = parseStyle(styleText)) {
        result.style = style.value();
    } else {
        context.logMessage(LogMsg() << "font variant '" << result.name << "' of family '" << familyName
            << "' has unknown style \"" << styleText << "\". Using normal.", LogSeverity::Warning);
    }
    if (jsonVariant.contains("information")) {
        for (const auto& [propertyName, value] : jsonVariant["information"].items()) {
            const auto* descriptor = findPropertyDescriptor(propertyName);
            if (!descriptor) {
                context.logMessage(LogMsg() << "font variant '" << result.name << "' of family '" << familyName
                    << "': unknown property '" << propertyName << "' skipped", LogSeverity::Warning);
                continue;
            }
            result.properties.emplace_back(descriptor->id, value.get<std::string>());
        }
    }
    return result;
}

} // namespace

FontSnapshot readJson(const std::filesystem::path& inputPath, const FontcatContext& context)
{
    std::ifstream jsonFile;
    jsonFile.exceptions(std::ios::failbit | std::ios::badbit);
    jsonFile.open(inputPath);
    json jsonDoc;
    jsonFile >> jsonDoc;
    if (!jsonDoc.is_object() || !jsonDoc.contains("families") || !jsonDoc["families"].is_array()) {
        throw std::runtime_error(utils::pathToString(inputPath) + " is not a font catalog snapshot.");
    }
    const int version = jsonDoc.value("version", SNAPSHOT_VERSION);
    if (version > SNAPSHOT_VERSION) {
        context.logMessage(LogMsg() << utils::pathToString(inputPath) << " has snapshot version " << version
            << ". Unknown fields are ignored.", LogSeverity::Warning);
    }

    FontSnapshot result;
    for (const auto& jsonFamily : jsonDoc["families"]) {
        FamilyRecord family;
        family.name = jsonFamily.value("name", std::string{});
        if (jsonFamily.contains("variants")) {
            for (const auto& jsonVariant : jsonFamily["variants"]) {
                family.variants.push_back(readVariant(jsonVariant, family.name, context));
            }
        }
        result.push_back(std::move(family));
    }
    return result;
}

void writeJson(const std::filesystem::path& outputPath, const FontSnapshot& fonts, const FontcatContext& context)
{
    json jsonDoc;
    jsonDoc["version"] = SNAPSHOT_VERSION;
    jsonDoc["families"] = json::array();
    for (const auto& family : fonts) {
        json jsonFamily;
        jsonFamily["name"] = family.name;
        jsonFamily["variants"] = json::array();
        for (const auto& variant : family.variants) {
            json jsonVariant;
            jsonVariant["name"] = variant.name;
            jsonVariant["weight"] = variant.weight;
            jsonVariant["style"] = styleToText(variant.style);
            jsonVariant["width"] = variant.width;
            jsonVariant["filename"] = variant.filename;
            json information = json::object();
            for (const auto& [id, value] : variant.properties) {
                information[std::string(canonicalPropertyName(id))] = value;
            }
            jsonVariant["information"] = std::move(information);
            jsonFamily["variants"].push_back(std::move(jsonVariant));
        }
        jsonDoc["families"].push_back(std::move(jsonFamily));
    }

    std::ofstream file;
    file.exceptions(std::ofstream::failbit | std::ofstream::badbit);
    file.open(outputPath, std::ios::out | std::ios::binary);
    file << jsonDoc.dump(context.indentSpaces.value_or(-1)) << std::endl;
    file.close();
}

} // namespace snapshot
} // namespace fontcat
