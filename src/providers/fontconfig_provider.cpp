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
#include <array>
#include <cmath>
#include <cstdlib>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

#include <fontconfig/fontconfig.h>

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_SFNT_NAMES_H
#include FT_TRUETYPE_IDS_H

#include "providers/providers.h"
#include "fontcat.h"

namespace fontcat {

namespace {

// sfnt name ids and the property each one populates
constexpr auto kNameIdProperties = std::to_array<std::pair<FT_UShort, PropertyId>>({
    { TT_NAME_ID_COPYRIGHT,             PropertyId::Copyright },
    { TT_NAME_ID_FONT_FAMILY,           PropertyId::Win32FamilyNames },
    { TT_NAME_ID_FONT_SUBFAMILY,        PropertyId::Win32SubfamilyNames },
    { TT_NAME_ID_FULL_NAME,             PropertyId::FullName },
    { TT_NAME_ID_VERSION_STRING,        PropertyId::Versions },
    { TT_NAME_ID_PS_NAME,               PropertyId::PostscriptName },
    { TT_NAME_ID_TRADEMARK,             PropertyId::Trademark },
    { TT_NAME_ID_MANUFACTURER,          PropertyId::Manufacturer },
    { TT_NAME_ID_DESIGNER,              PropertyId::Designer },
    { TT_NAME_ID_DESCRIPTION,           PropertyId::Description },
    { TT_NAME_ID_VENDOR_URL,            PropertyId::VendorUrl },
    { TT_NAME_ID_DESIGNER_URL,          PropertyId::DesignerUrl },
    { TT_NAME_ID_LICENSE,               PropertyId::LicenseDescription },
    { TT_NAME_ID_LICENSE_URL,           PropertyId::LicenseInfoUrl },
    { TT_NAME_ID_TYPOGRAPHIC_FAMILY,    PropertyId::TypographicFamilyNames },
    { TT_NAME_ID_TYPOGRAPHIC_SUBFAMILY, PropertyId::TypographicSubfamilyNames },
    { TT_NAME_ID_SAMPLE_TEXT,           PropertyId::SampleText },
    { TT_NAME_ID_CID_FINDFONT_NAME,     PropertyId::PostscriptCidName },
    { TT_NAME_ID_WWS_FAMILY,            PropertyId::WeightStretchStyleFamilyName },
});

// primary language ids (the low 10 bits of a Windows LCID) by ISO 639-1 code
struct WindowsLanguage
{
    std::string_view isoCode;
    FT_UShort primaryLanguageId;
};

constexpr auto kWindowsLanguages = std::to_array<WindowsLanguage>({
    { "ar", 0x01 }, { "zh", 0x04 }, { "cs", 0x05 }, { "da", 0x06 }, { "de", 0x07 }, { "el", 0x08 },
    { "en", 0x09 }, { "es", 0x0A }, { "fi", 0x0B }, { "fr", 0x0C }, { "he", 0x0D }, { "hu", 0x0E },
    { "it", 0x10 }, { "ja", 0x11 }, { "ko", 0x12 }, { "nl", 0x13 }, { "nb", 0x14 }, { "pl", 0x15 },
    { "pt", 0x16 }, { "ru", 0x19 }, { "sv", 0x1D }, { "th", 0x1E }, { "tr", 0x1F }, { "uk", 0x22 },
    { "vi", 0x2A },
});

struct FcPatternDeleter { void operator()(FcPattern* p) const { FcPatternDestroy(p); } };
struct FcObjectSetDeleter { void operator()(FcObjectSet* os) const { FcObjectSetDestroy(os); } };
struct FcFontSetDeleter { void operator()(FcFontSet* fs) const { FcFontSetDestroy(fs); } };

class FreeTypeLibrary
{
public:
    FreeTypeLibrary()
    {
        if (FT_Init_FreeType(&m_library) != 0) {
            m_library = nullptr;
        }
    }

    ~FreeTypeLibrary()
    {
        if (m_library) {
            FT_Done_FreeType(m_library);
        }
    }

    FreeTypeLibrary(const FreeTypeLibrary&) = delete;
    FreeTypeLibrary& operator=(const FreeTypeLibrary&) = delete;

    FT_Library get() const { return m_library; }

private:
    FT_Library m_library{};
};

std::string userLanguage()
{
    for (const char* variable : { "LC_ALL", "LC_MESSAGES", "LANG" }) {
        if (auto value = utils::getEnvironmentValue(variable)) {
            std::string language = utils::toLowerCase(value.value().substr(0, value.value().find_first_of("_.@")));
            if (language == "c" || language == "posix") {
                return "en";
            }
            return language;
        }
    }
    return "en";
}

bool languageMatches(std::string_view tag, std::string_view language)
{
    if (language.empty() || tag.size() < language.size() || tag.compare(0, language.size(), language) != 0) {
        return false;
    }
    return tag.size() == language.size() || tag[language.size()] == '-';
}

std::optional<std::string> getString(FcPattern* font, const char* object, int n = 0)
{
    FcChar8* value = nullptr;
    if (FcPatternGetString(font, object, n, &value) == FcResultMatch && value) {
        return std::string(reinterpret_cast<const char*>(value));
    }
    return std::nullopt;
}

/// picks the value of @p object whose language (in @p langObject) is @p language, then English, then the first
std::string pickLocalized(FcPattern* font, const char* object, const char* langObject, const std::string& language)
{
    std::optional<std::string> first;
    std::optional<std::string> english;
    for (int n = 0; auto value = getString(font, object, n); n++) {
        const std::string tag = getString(font, langObject, n).value_or(std::string{});
        if (languageMatches(tag, language)) {
            return value.value();
        }
        if (!english && languageMatches(tag, "en")) {
            english = value;
        }
        if (!first) {
            first = value;
        }
    }
    return english.value_or(first.value_or(std::string{}));
}

double getNumber(FcPattern* font, const char* object, double defaultValue)
{
    double result{};
    if (FcPatternGetDouble(font, object, 0, &result) == FcResultMatch) {
        return result;
    }
    int intResult{};
    if (FcPatternGetInteger(font, object, 0, &intResult) == FcResultMatch) {
        return intResult;
    }
    return defaultValue;
}

FontWeight readWeight(FcPattern* font)
{
    const double openTypeWeight = FcWeightToOpenTypeDouble(getNumber(font, FC_WEIGHT, FC_WEIGHT_REGULAR));
    if (openTypeWeight < 0) {
        return weight::NORMAL;
    }
    return clampWeight(static_cast<FontWeight>(std::lround(openTypeWeight)));
}

FontStyle readStyle(FcPattern* font)
{
    switch (static_cast<int>(getNumber(font, FC_SLANT, FC_SLANT_ROMAN))) {
    case FC_SLANT_ITALIC: return FontStyle::Italic;
    case FC_SLANT_OBLIQUE: return FontStyle::Oblique;
    default: return FontStyle::Normal;
    }
}

std::optional<std::string> decodeNameRecord(const FT_SfntName& record)
{
    switch (record.platform_id) {
    case TT_PLATFORM_APPLE_UNICODE:
        return utils::utf16BeToString(record.string, record.string_len);
    case TT_PLATFORM_MICROSOFT:
        if (record.encoding_id == TT_MS_ID_UNICODE_CS || record.encoding_id == TT_MS_ID_SYMBOL_CS || record.encoding_id == TT_MS_ID_UCS_4) {
            return utils::utf16BeToString(record.string, record.string_len);
        }
        return std::nullopt;
    case TT_PLATFORM_MACINTOSH:
        if (record.encoding_id == TT_MAC_ID_ROMAN) {
            std::string result(reinterpret_cast<const char*>(record.string), record.string_len);
            // only the ASCII subset of Mac Roman is passed through
            if (std::all_of(result.begin(), result.end(), [](unsigned char c) { return c < 0x80; })) {
                return result;
            }
        }
        return std::nullopt;
    default:
        return std::nullopt;
    }
}

// higher is better: user language, then en-US, then any other Windows record, then anything decodable
int nameRecordScore(const FT_SfntName& record, std::optional<FT_UShort> userLanguageId)
{
    if (record.platform_id != TT_PLATFORM_MICROSOFT) {
        return 1;
    }
    if (userLanguageId && (record.language_id & 0x3FF) == userLanguageId.value()) {
        return 4;
    }
    if (record.language_id == TT_MS_LANGID_ENGLISH_UNITED_STATES) {
        return 3;
    }
    return 2;
}

std::optional<PropertyId> propertyForNameId(FT_UShort nameId)
{
    for (const auto& [id, property] : kNameIdProperties) {
        if (id == nameId) {
            return property;
        }
    }
    return std::nullopt;
}

std::optional<FT_UShort> windowsLanguageId(std::string_view language)
{
    for (const auto& entry : kWindowsLanguages) {
        if (entry.isoCode == language) {
            return entry.primaryLanguageId;
        }
    }
    return std::nullopt;
}

std::map<PropertyId, std::string> readNameTable(FT_Library library, const std::string& filename, int faceIndex,
                                                std::optional<FT_UShort> userLanguageId)
{
    std::map<PropertyId, std::string> result;
    FT_Face face = nullptr;
    if (!library || FT_New_Face(library, filename.c_str(), faceIndex, &face) != 0 || !face) {
        return result;
    }
    std::map<PropertyId, int> bestScores;
    const FT_UInt count = FT_Get_Sfnt_Name_Count(face);
    for (FT_UInt x = 0; x < count; x++) {
        FT_SfntName record{};
        if (FT_Get_Sfnt_Name(face, x, &record) != 0) {
            continue;
        }
        const auto property = propertyForNameId(record.name_id);
        if (!property) {
            continue;
        }
        auto text = decodeNameRecord(record);
        if (!text || text->empty()) {
            continue;
        }
        const int score = nameRecordScore(record, userLanguageId);
        auto [it, inserted] = bestScores.emplace(property.value(), score);
        if (inserted || score > it->second) {
            it->second = score;
            result[property.value()] = std::move(text.value());
        }
    }
    FT_Done_Face(face);
    return result;
}

// regular upright faces first, then by distance from the regular width and weight
auto variantOrderKey(const VariantRecord& variant)
{
    return std::make_tuple(static_cast<int>(variant.style), std::abs(variant.width - stretch::NORMAL),
                           std::abs(variant.weight - weight::NORMAL), variant.weight, std::cref(variant.name));
}

} // namespace

FontSnapshot FontconfigProvider::enumerateFonts(const FontcatContext& context) const
{
    if (FcInit() == FcFalse) {
        throw std::runtime_error("Unable to initialize fontconfig.");
    }
    FreeTypeLibrary freeType;
    if (!freeType.get()) {
        context.logMessage(LogMsg() << "Unable to initialize FreeType. Font name tables will not be read.", LogSeverity::Warning);
    }

    const std::string language = m_language.empty() ? userLanguage() : utils::toLowerCase(m_language);
    const auto languageId = windowsLanguageId(language);
    context.logMessage(LogMsg() << "Using language \"" << language << "\" for localized font names", LogSeverity::Verbose);

    std::unique_ptr<FcPattern, FcPatternDeleter> pattern(FcPatternCreate());
    std::unique_ptr<FcObjectSet, FcObjectSetDeleter> objectSet(FcObjectSetBuild(
        FC_FAMILY, FC_FAMILYLANG, FC_STYLE, FC_STYLELANG, FC_FULLNAME, FC_FULLNAMELANG, FC_POSTSCRIPT_NAME,
        FC_WEIGHT, FC_SLANT, FC_WIDTH, FC_FILE, FC_INDEX, FC_VARIABLE, nullptr));
    if (!pattern || !objectSet) {
        throw std::runtime_error("Unable to create fontconfig pattern.");
    }
    std::unique_ptr<FcFontSet, FcFontSetDeleter> fontSet(FcFontList(nullptr, pattern.get(), objectSet.get()));
    if (!fontSet) {
        context.logMessage(LogMsg() << "fontconfig reported no fonts.", LogSeverity::Warning);
        return {};
    }

    std::map<std::string, FamilyRecord> families;
    std::set<std::pair<std::string, int>> seenFaces;
    for (int x = 0; x < fontSet->nfont; x++) {
        FcPattern* font = fontSet->fonts[x];
        FcBool variable = FcFalse;
        if (FcPatternGetBool(font, FC_VARIABLE, 0, &variable) == FcResultMatch && variable) {
            continue; // the named instances of a variable font are listed separately
        }
        const auto filename = getString(font, FC_FILE);
        const std::string familyName = pickLocalized(font, FC_FAMILY, FC_FAMILYLANG, language);
        if (!filename || familyName.empty()) {
            continue;
        }
        const int faceIndex = static_cast<int>(getNumber(font, FC_INDEX, 0));
        if (!seenFaces.emplace(filename.value(), faceIndex).second) {
            context.logMessage(LogMsg() << "duplicate face " << filename.value() << " #" << faceIndex << " skipped", LogSeverity::Verbose);
            continue;
        }

        VariantRecord variant;
        variant.name = pickLocalized(font, FC_STYLE, FC_STYLELANG, language);
        if (variant.name.empty()) {
            variant.name = "Regular";
        }
        variant.weight = readWeight(font);
        variant.style = readStyle(font);
        variant.width = stretchFromWidthPercent(getNumber(font, FC_WIDTH, FC_WIDTH_NORMAL));
        variant.filename = filename.value();

        auto names = readNameTable(freeType.get(), variant.filename, faceIndex, languageId);
        if (!names.count(PropertyId::FullName)) {
            const std::string fullName = pickLocalized(font, FC_FULLNAME, FC_FULLNAMELANG, language);
            if (!fullName.empty()) {
                names.emplace(PropertyId::FullName, fullName);
            }
        }
        if (!names.count(PropertyId::PostscriptName)) {
            if (auto postscriptName = getString(font, FC_POSTSCRIPT_NAME)) {
                names.emplace(PropertyId::PostscriptName, postscriptName.value());
            }
        }
        if (!names.count(PropertyId::Win32FamilyNames)) {
            names.emplace(PropertyId::Win32FamilyNames, familyName);
        }
        for (auto& [id, value] : names) {
            variant.properties.emplace_back(id, std::move(value));
        }

        auto& family = families[familyName];
        family.name = familyName;
        family.variants.push_back(std::move(variant));
    }

    FontSnapshot result;
    result.reserve(families.size());
    for (auto& [name, family] : families) {
        std::stable_sort(family.variants.begin(), family.variants.end(), [](const VariantRecord& lhs, const VariantRecord& rhs) {
            return variantOrderKey(lhs) < variantOrderKey(rhs);
        });
        result.push_back(std::move(family));
    }
    context.logMessage(LogMsg() << "fontconfig listed " << fontSet->nfont << " faces in " << result.size() << " families", LogSeverity::Verbose);
    return result;
}

} // namespace fontcat
