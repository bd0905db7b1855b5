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
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace fontcat {

/// @brief identifies a localized informational string of a font face.
///
/// The numbering follows the informational string ids of the DirectWrite API, so that catalogs
/// exchanged with Windows tooling keep their ids.
enum class PropertyId : int
{
    None = 0,
    Copyright = 1,
    Versions = 2,
    Trademark = 3,
    Manufacturer = 4,
    Designer = 5,
    DesignerUrl = 6,
    Description = 7,
    VendorUrl = 8,
    LicenseDescription = 9,
    LicenseInfoUrl = 10,
    Win32FamilyNames = 11,
    Win32SubfamilyNames = 12,
    TypographicFamilyNames = 13,
    TypographicSubfamilyNames = 14,
    SampleText = 15,
    FullName = 16,
    PostscriptName = 17,
    PostscriptCidName = 18,
    WeightStretchStyleFamilyName = 19,
    DesignScriptLanguageTag = 20,
    SupportedScriptLanguageTag = 21
};

struct PropertyDescriptor
{
    std::string_view name;
    PropertyId id;
    bool filterable;    ///< whether the name may be used in a collection query
};

/// an alternate name for a property. It shares the canonical descriptor, including whether it is filterable.
struct PropertyAlias
{
    std::string_view name;
    PropertyId id;
};

/// @brief finds a property by canonical or alias name (exact match)
/// @return the canonical descriptor, or nullptr if @p name is not a known property name
const PropertyDescriptor* findPropertyDescriptor(std::string_view name);

/// @brief the canonical name of @p id, or an empty view for PropertyId::None
std::string_view canonicalPropertyName(PropertyId id);

/// @brief converts an integer to a PropertyId, returning std::nullopt for 0 and unknown values
std::optional<PropertyId> propertyIdFromInt(std::int64_t value);

/// All canonical descriptors in id order (aliases excluded)
const std::vector<PropertyDescriptor>& propertyDescriptors();

/// All alias names in table order
const std::vector<PropertyAlias>& propertyAliases();

/// A key accepted by PropertyMap: a property name, an integer id, or a floating-point value that never matches.
using PropertyKey = std::variant<std::string, std::int64_t, double>;

/**
 * @brief read-only table of the localized informational strings of one font variant.
 *
 * Every entry can be reached by its canonical name, by any alias of that name, or by its integer id.
 * Iteration, keys(), values() and items() all follow the order in which entries were supplied.
 */
class PropertyMap
{
public:
    struct Entry
    {
        PropertyId id;
        std::string_view name;  ///< canonical name
        std::string value;
    };

    using const_iterator = std::vector<Entry>::const_iterator;

    PropertyMap() = default;

    /// @throws std::invalid_argument if an id is PropertyId::None or appears more than once
    explicit PropertyMap(std::vector<std::pair<PropertyId, std::string>> entries);

    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

    /// never throws: keys of the wrong type or unknown names simply are not contained
    bool contains(const PropertyKey& key) const noexcept;
    bool contains(PropertyId id) const noexcept { return find(id) != nullptr; }

    /// @throws not_found if the key does not resolve to a populated entry
    const std::string& at(const PropertyKey& key) const;
    const std::string& at(PropertyId id) const;

    const std::string& operator[](const PropertyKey& key) const { return at(key); }
    const std::string& operator[](PropertyId id) const { return at(id); }

    /// @return the value for @p id, or nullptr if absent
    const std::string* find(PropertyId id) const noexcept;

    std::vector<std::string_view> keys() const;
    std::vector<std::string_view> values() const;
    std::vector<std::pair<std::string_view, std::string_view>> items() const;

    const_iterator begin() const { return m_entries.begin(); }
    const_iterator end() const { return m_entries.end(); }

private:
    std::optional<PropertyId> resolve(const PropertyKey& key) const noexcept;

    std::vector<Entry> m_entries;
    std::unordered_map<std::string_view, size_t> m_nameIndex;
    std::unordered_map<int, size_t> m_idIndex;
};

} // namespace fontcat
