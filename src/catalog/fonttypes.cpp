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
#include <cmath>
#include <utility>

#include "catalog/fonttypes.h"
#include "utils/stringutils.h"

namespace fontcat {

namespace {

constexpr auto kStyleFallbacks = std::to_array<std::array<FontStyle, 3>>({
    { FontStyle::Normal, FontStyle::Oblique, FontStyle::Italic },   // Normal
    { FontStyle::Oblique, FontStyle::Italic, FontStyle::Normal },   // Oblique
    { FontStyle::Italic, FontStyle::Oblique, FontStyle::Normal },   // Italic
});

struct NamedValue
{
    std::string_view name;
    int value;
};

// names are compared after utils::normalizeName; the first entry for a value is its canonical name
constexpr auto kWeightNames = std::to_array<NamedValue>({
    { "thin",        weight::THIN },
    { "hairline",    weight::THIN },
    { "extralight",  weight::EXTRA_LIGHT },
    { "ultralight",  weight::ULTRA_LIGHT },
    { "light",       weight::LIGHT },
    { "semilight",   weight::SEMI_LIGHT },
    { "normal",      weight::NORMAL },
    { "regular",     weight::REGULAR },
    { "medium",      weight::MEDIUM },
    { "semibold",    weight::SEMI_BOLD },
    { "demibold",    weight::DEMI_BOLD },
    { "bold",        weight::BOLD },
    { "extrabold",   weight::EXTRA_BOLD },
    { "ultrabold",   weight::ULTRA_BOLD },
    { "black",       weight::BLACK },
    { "heavy",       weight::HEAVY },
    { "extrablack",  weight::EXTRA_BLACK },
    { "ultrablack",  weight::ULTRA_BLACK },
});

constexpr auto kStretchNames = std::to_array<NamedValue>({
    { "ultracondensed", stretch::ULTRA_CONDENSED },
    { "extracondensed", stretch::EXTRA_CONDENSED },
    { "condensed",      stretch::CONDENSED },
    { "semicondensed",  stretch::SEMI_CONDENSED },
    { "normal",         stretch::NORMAL },
    { "medium",         stretch::MEDIUM },
    { "semiexpanded",   stretch::SEMI_EXPANDED },
    { "expanded",       stretch::EXPANDED },
    { "extraexpanded",  stretch::EXTRA_EXPANDED },
    { "ultraexpanded",  stretch::ULTRA_EXPANDED },
});

// width percentages of the nine OpenType width classes
constexpr auto kStretchPercents = std::to_array<double>({ 50.0, 62.5, 75.0, 87.5, 100.0, 112.5, 125.0, 150.0, 200.0 });

template <typename Table>
std::optional<int> findNamedValue(const Table& table, std::string_view text)
{
    const std::string key = utils::normalizeName(text);
    for (const auto& entry : table) {
        if (entry.name == key) {
            return entry.value;
        }
    }
    return std::nullopt;
}

} // namespace

const std::array<FontStyle, 3>& styleFallbackOrder(FontStyle requested)
{
    return kStyleFallbacks[static_cast<size_t>(requested)];
}

std::string_view toString(FontStyle style)
{
    switch (style) {
    case FontStyle::Normal: return "NORMAL";
    case FontStyle::Oblique: return "OBLIQUE";
    case FontStyle::Italic: return "ITALIC";
    }
    return "NORMAL";
}

std::ostream& operator<<(std::ostream& os, FontStyle style)
{
    return os << toString(style);
}

std::optional<FontStyle> parseStyle(std::string_view text)
{
    const std::string key = utils::normalizeName(text);
    if (key == "normal" || key == "regular" || key == "roman" || key == "upright") {
        return FontStyle::Normal;
    } else if (key == "oblique" || key == "slanted") {
        return FontStyle::Oblique;
    } else if (key == "italic") {
        return FontStyle::Italic;
    }
    return std::nullopt;
}

std::optional<FontWeight> parseWeight(std::string_view text)
{
    if (auto number = utils::parseInteger(text)) {
        return number;
    }
    return findNamedValue(kWeightNames, text);
}

std::optional<FontStretch> parseStretch(std::string_view text)
{
    if (auto number = utils::parseInteger(text)) {
        if (*number >= stretch::MIN && *number <= stretch::MAX) {
            return number;
        }
        return std::nullopt;
    }
    return findNamedValue(kStretchNames, text);
}

std::string_view weightName(FontWeight value)
{
    for (const auto& entry : kWeightNames) {
        if (entry.value == value) {
            return entry.name;
        }
    }
    return {};
}

FontWeight clampWeight(FontWeight value)
{
    return std::clamp(value, weight::MIN, weight::MAX);
}

FontStretch clampStretch(FontStretch value)
{
    return std::clamp(value, stretch::MIN, stretch::MAX);
}

FontStretch stretchFromWidthPercent(double percent)
{
    size_t best = 0;
    for (size_t x = 1; x < kStretchPercents.size(); x++) {
        if (std::abs(kStretchPercents[x] - percent) < std::abs(kStretchPercents[best] - percent)) {
            best = x;
        }
    }
    return static_cast<FontStretch>(best) + stretch::MIN;
}

} // namespace fontcat
