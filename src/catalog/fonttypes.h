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
#pragma once

#include <array>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace fontcat {

/// OpenType weight class, 1 to 1000
using FontWeight = int;

/// OpenType width class, 1 (ultra-condensed) to 9 (ultra-expanded)
using FontStretch = int;

namespace weight {
inline constexpr FontWeight MIN = 1;
inline constexpr FontWeight THIN = 100;
inline constexpr FontWeight EXTRA_LIGHT = 200;
inline constexpr FontWeight ULTRA_LIGHT = EXTRA_LIGHT;
inline constexpr FontWeight LIGHT = 300;
inline constexpr FontWeight SEMI_LIGHT = 350;
inline constexpr FontWeight NORMAL = 400;
inline constexpr FontWeight REGULAR = NORMAL;
inline constexpr FontWeight MEDIUM = 500;
inline constexpr FontWeight DEMI_BOLD = 600;
inline constexpr FontWeight SEMI_BOLD = DEMI_BOLD;
inline constexpr FontWeight BOLD = 700;
inline constexpr FontWeight EXTRA_BOLD = 800;
inline constexpr FontWeight ULTRA_BOLD = EXTRA_BOLD;
inline constexpr FontWeight BLACK = 900;
inline constexpr FontWeight HEAVY = BLACK;
inline constexpr FontWeight EXTRA_BLACK = 950;
inline constexpr FontWeight ULTRA_BLACK = EXTRA_BLACK;
inline constexpr FontWeight MAX = 1000;
} // namespace weight

namespace stretch {
inline constexpr FontStretch ULTRA_CONDENSED = 1;
inline constexpr FontStretch EXTRA_CONDENSED = 2;
inline constexpr FontStretch CONDENSED = 3;
inline constexpr FontStretch SEMI_CONDENSED = 4;
inline constexpr FontStretch NORMAL = 5;
inline constexpr FontStretch MEDIUM = NORMAL;
inline constexpr FontStretch SEMI_EXPANDED = 6;
inline constexpr FontStretch EXPANDED = 7;
inline constexpr FontStretch EXTRA_EXPANDED = 8;
inline constexpr FontStretch ULTRA_EXPANDED = 9;
inline constexpr FontStretch MIN = ULTRA_CONDENSED;
inline constexpr FontStretch MAX = ULTRA_EXPANDED;
} // namespace stretch

enum class FontStyle
{
    Normal = 0,
    Oblique = 1,
    Italic = 2
};

/// @brief the order in which styles are tried when @p requested is not present in a family.
/// The first element is always @p requested itself.
const std::array<FontStyle, 3>& styleFallbackOrder(FontStyle requested);

/// "NORMAL", "OBLIQUE" or "ITALIC"
std::string_view toString(FontStyle style);

std::ostream& operator<<(std::ostream& os, FontStyle style);

std::optional<FontStyle> parseStyle(std::string_view text);

/// @brief parses a weight given either as a number or as a name such as "semi-bold". Numbers are not clamped.
std::optional<FontWeight> parseWeight(std::string_view text);

/// @brief parses a width class given either as a number from 1 to 9 or as a name such as "condensed".
std::optional<FontStretch> parseStretch(std::string_view text);

/// returns the canonical name of a named weight, or an empty view for any other value
std::string_view weightName(FontWeight value);

FontWeight clampWeight(FontWeight value);
FontStretch clampStretch(FontStretch value);

/// @brief maps a width given as a percentage of normal (fontconfig, CSS) to the nearest width class.
FontStretch stretchFromWidthPercent(double percent);

} // namespace fontcat
