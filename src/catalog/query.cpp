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
#include <string>
#include <type_traits>

#include "catalog/query.h"
#include "catalog/errors.h"

namespace fontcat {

std::string_view filterValueTypeName(const FilterValue& value)
{
    return std::visit([](const auto& v) -> std::string_view {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return "string";
            } else if constexpr (std::is_same_v<T, bool>) {
                return "bool";
            } else if constexpr (std::is_same_v<T, double>) {
                return "double";
            } else {
                return "int";
            }
        }, value);
}

MatchQuery::MatchQuery(const FontFilters& filters)
{
    if (filters.empty()) {
        throw invalid_argument("no filter conditions passed");
    }
    m_conditions.reserve(filters.size());
    for (const auto& filter : filters) {
        const auto* descriptor = findPropertyDescriptor(filter.name);
        if (!descriptor) {
            throw invalid_argument("'" + filter.name + "' isn't a known font property name");
        }
        if (!descriptor->filterable) {
            throw invalid_argument("'" + filter.name + "' doesn't have a mapping to font property id");
        }
        const auto* text = std::get_if<std::string>(&filter.value);
        if (!text) {
            throw type_mismatch(std::string(filterValueTypeName(filter.value)));
        }
        m_conditions.emplace_back(descriptor->id, *text);
    }
}

bool MatchQuery::matches(const Variant& variant) const
{
    const auto& information = variant.information();
    for (const auto& [id, expected] : m_conditions) {
        const std::string* actual = information.find(id);
        if (!actual || *actual != expected) {
            return false;
        }
    }
    return true;
}

std::vector<Variant> getMatchingVariants(const Collection& collection, const FontFilters& filters)
{
    const MatchQuery query(filters);
    std::vector<Variant> result;
    for (const auto& family : collection.families()) {
        for (const auto& variant : family.getMatchingVariants()) {
            if (query.matches(variant)) {
                result.push_back(variant);
            }
        }
    }
    return result;
}

} // namespace fontcat
