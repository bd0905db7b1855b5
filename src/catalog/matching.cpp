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
#include <cstdlib>
#include <numeric>
#include <tuple>

#include "catalog/collection.h"

namespace fontcat {
namespace matching {

namespace {

// position of @p style in the fallback order of @p requested. 0 is an exact match.
int styleRank(FontStyle requested, FontStyle style)
{
    const auto& order = styleFallbackOrder(requested);
    const auto it = std::find(order.begin(), order.end(), style);
    return static_cast<int>(it - order.begin());
}

// weight and style only. Within the best style group: nearest weight, then heavier, then enumeration order.
std::tuple<int, int, int, size_t> basicKey(const detail::VariantData& variant, size_t index,
                                           FontStyle style, FontWeight weight)
{
    return { styleRank(style, variant.style), std::abs(variant.weight - weight), -variant.weight, index };
}

// style first, then width distance, then weight distance, then enumeration order.
std::tuple<int, int, int, size_t> extendedKey(const detail::VariantData& variant, size_t index,
                                              FontStyle style, FontWeight weight, FontStretch width)
{
    return { styleRank(style, variant.style), std::abs(variant.width - width), std::abs(variant.weight - weight), index };
}

} // namespace

std::vector<size_t> rankVariants(const detail::FamilyData& family, const VariantQuery& query)
{
    const FontStyle style = query.requestedStyle();
    // requests outside the valid ranges rank like the nearest valid value
    const FontWeight weight = clampWeight(query.weight.value_or(weight::NORMAL));

    std::vector<size_t> result(family.variants.size());
    std::iota(result.begin(), result.end(), size_t(0));

    if (query.width.has_value()) {
        const FontStretch width = clampStretch(query.width.value());
        std::sort(result.begin(), result.end(), [&](size_t lhs, size_t rhs) {
            return extendedKey(family.variants[lhs], lhs, style, weight, width)
                 < extendedKey(family.variants[rhs], rhs, style, weight, width);
        });
    } else {
        std::sort(result.begin(), result.end(), [&](size_t lhs, size_t rhs) {
            return basicKey(family.variants[lhs], lhs, style, weight)
                 < basicKey(family.variants[rhs], rhs, style, weight);
        });
    }
    return result;
}

} // namespace matching
} // namespace fontcat
