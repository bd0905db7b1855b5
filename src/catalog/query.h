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

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "catalog/collection.h"
#include "catalog/propertymap.h"

namespace fontcat {

using FilterValue = std::variant<std::string, std::int64_t, double, bool>;

struct FontFilter
{
    std::string name;       ///< a font property name, e.g. "full_name"
    FilterValue value;
};

using FontFilters = std::vector<FontFilter>;

/// the type name reported when a filter value cannot be compared with a property string
std::string_view filterValueTypeName(const FilterValue& value);

/**
 * @brief a validated set of filter conditions, all of which must hold.
 *
 * Construction checks every filter in order and throws on the first problem, so matches() itself never throws.
 */
class MatchQuery
{
public:
    /// @throws invalid_argument if @p filters is empty or names an unknown or unfilterable property
    /// @throws type_mismatch if a value is not a string
    explicit MatchQuery(const FontFilters& filters);

    /// true if every condition holds for @p variant. A property the variant lacks fails its condition.
    bool matches(const Variant& variant) const;

    size_t size() const { return m_conditions.size(); }

private:
    std::vector<std::pair<PropertyId, std::string>> m_conditions;
};

/// @brief every variant of @p collection that satisfies all @p filters, in collection order.
std::vector<Variant> getMatchingVariants(const Collection& collection, const FontFilters& filters);

} // namespace fontcat
