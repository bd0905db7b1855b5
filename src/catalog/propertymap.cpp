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
#include <array>
#include <stdexcept>
#include <string>
#include <type_traits>

#include "catalog/propertymap.h"
#include "catalog/errors.h"

namespace fontcat {

namespace {

constexpr auto kPropertyTable = std::to_array<PropertyDescriptor>({
    { "copyright",                          PropertyId::Copyright,                      false },
    { "versions",                           PropertyId::Versions,                       false },
    { "trademark",                          PropertyId::Trademark,                      false },
    { "manufacturer",                       PropertyId::Manufacturer,                   false },
    { "designer",                           PropertyId::Designer,                       false },
    { "designer_url",                       PropertyId::DesignerUrl,                    false },
    { "description",                        PropertyId::Description,                    false },
    { "vendor_url",                         PropertyId::VendorUrl,                      false },
    { "license_description",                PropertyId::LicenseDescription,             false },
    { "license_info_url",                   PropertyId::LicenseInfoUrl,                 false },
    { "win32_family_names",                 PropertyId::Win32FamilyNames,               true },
    { "win32_subfamily_names",              PropertyId::Win32SubfamilyNames,            false },
    { "typographic_family_names",           PropertyId::TypographicFamilyNames,         true },
    { "typographic_subfamily_names",        PropertyId::TypographicSubfamilyNames,      false },
    { "sample_text",                        PropertyId::SampleText,                     false },
    { "full_name",                          PropertyId::FullName,                       true },
    { "postscript_name",                    PropertyId::PostscriptName,                 true },
    { "postscript_cid_name",                PropertyId::PostscriptCidName,              false },
    { "weight_stretch_style_family_name",   PropertyId::WeightStretchStyleFamilyName,   true },
    { "design_script_language_tag",         PropertyId::DesignScriptLanguageTag,        true },
    { "supported_script_language_tag",      PropertyId::SupportedScriptLanguageTag,     true },
});

// alternate names accepted on lookup; they never appear in keys()
constexpr auto kPropertyAliases = std::to_array<PropertyAlias>({
    { "preferred_family_names",             PropertyId::TypographicFamilyNames },
    { "preferred_subfamily_names",          PropertyId::TypographicSubfamilyNames },
    { "wws_family_name",                    PropertyId::WeightStretchStyleFamilyName },
    { "wss_family_name",                    PropertyId::WeightStretchStyleFamilyName },
});

const PropertyDescriptor* findCanonicalDescriptor(PropertyId id)
{
    for (const auto& descriptor : kPropertyTable) {
        if (descriptor.id == id) {
            return &descriptor;
        }
    }
    return nullptr;
}

std::string describeKey(const PropertyKey& key)
{
    return std::visit([](const auto& value) -> std::string {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return "'" + value + "'";
            } else {
                return std::to_string(value);
            }
        }, key);
}

} // namespace

const PropertyDescriptor* findPropertyDescriptor(std::string_view name)
{
    for (const auto& descriptor : kPropertyTable) {
        if (descriptor.name == name) {
            return &descriptor;
        }
    }
    for (const auto& alias : kPropertyAliases) {
        if (alias.name == name) {
            return findCanonicalDescriptor(alias.id);
        }
    }
    return nullptr;
}

std::string_view canonicalPropertyName(PropertyId id)
{
    if (const auto* descriptor = findCanonicalDescriptor(id)) {
        return descriptor->name;
    }
    return {};
}

std::optional<PropertyId> propertyIdFromInt(std::int64_t value)
{
    for (const auto& descriptor : kPropertyTable) {
        if (static_cast<std::int64_t>(descriptor.id) == value) {
            return descriptor.id;
        }
    }
    return std::nullopt;
}

const std::vector<PropertyDescriptor>& propertyDescriptors()
{
    static const std::vector<PropertyDescriptor> descriptors(kPropertyTable.begin(), kPropertyTable.end());
    return descriptors;
}

const std::vector<PropertyAlias>& propertyAliases()
{
    static const std::vector<PropertyAlias> aliases(kPropertyAliases.begin(), kPropertyAliases.end());
    return aliases;
}

PropertyMap::PropertyMap(std::vector<std::pair<PropertyId, std::string>> entries)
{
    m_entries.reserve(entries.size());
    for (auto& [id, value] : entries) {
        const std::string_view name = canonicalPropertyName(id);
        if (name.empty()) {
            throw std::invalid_argument("invalid font property id " + std::to_string(static_cast<int>(id)));
        }
        if (!m_idIndex.emplace(static_cast<int>(id), m_entries.size()).second) {
            throw std::invalid_argument("duplicate font property '" + std::string(name) + "'");
        }
        m_nameIndex.emplace(name, m_entries.size());
        m_entries.push_back({ id, name, std::move(value) });
    }
}

std::optional<PropertyId> PropertyMap::resolve(const PropertyKey& key) const noexcept
{
    if (const auto* name = std::get_if<std::string>(&key)) {
        if (const auto* descriptor = findPropertyDescriptor(*name)) {
            return descriptor->id;
        }
    } else if (const auto* number = std::get_if<std::int64_t>(&key)) {
        return propertyIdFromInt(*number);
    }
    return std::nullopt;
}

const std::string* PropertyMap::find(PropertyId id) const noexcept
{
    const auto it = m_idIndex.find(static_cast<int>(id));
    if (it == m_idIndex.end()) {
        return nullptr;
    }
    return &m_entries[it->second].value;
}

bool PropertyMap::contains(const PropertyKey& key) const noexcept
{
    if (const auto* name = std::get_if<std::string>(&key)) {
        if (m_nameIndex.find(*name) != m_nameIndex.end()) {
            return true;
        }
    }
    const auto id = resolve(key);
    return id && contains(*id);
}

const std::string& PropertyMap::at(const PropertyKey& key) const
{
    if (const auto* name = std::get_if<std::string>(&key)) {
        const auto it = m_nameIndex.find(*name);
        if (it != m_nameIndex.end()) {
            return m_entries[it->second].value;
        }
    }
    if (const auto id = resolve(key)) {
        if (const auto* value = find(*id)) {
            return *value;
        }
    }
    throw not_found(describeKey(key) + " doesn't exist");
}

const std::string& PropertyMap::at(PropertyId id) const
{
    if (const auto* value = find(id)) {
        return *value;
    }
    throw not_found(std::to_string(static_cast<int>(id)) + " doesn't exist");
}

std::vector<std::string_view> PropertyMap::keys() const
{
    std::vector<std::string_view> result;
    result.reserve(m_entries.size());
    for (const auto& entry : m_entries) {
        result.push_back(entry.name);
    }
    return result;
}

std::vector<std::string_view> PropertyMap::values() const
{
    std::vector<std::string_view> result;
    result.reserve(m_entries.size());
    for (const auto& entry : m_entries) {
        result.push_back(entry.value);
    }
    return result;
}

std::vector<std::pair<std::string_view, std::string_view>> PropertyMap::items() const
{
    std::vector<std::pair<std::string_view, std::string_view>> result;
    result.reserve(m_entries.size());
    for (const auto& entry : m_entries) {
        result.emplace_back(entry.name, entry.value);
    }
    return result;
}

} // namespace fontcat
