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
#include <sstream>
#include <unordered_set>
#include <utility>

#include "catalog/collection.h"
#include "catalog/errors.h"
#include "fontcat.h"

namespace fontcat {

namespace {

detail::VariantData buildVariant(VariantRecord&& record, const std::string& familyName, const FontcatContext& context)
{
    auto describe = [&]() -> std::string {
            return "font variant '" + record.name + "' of family '" + familyName + "'";
        };

    detail::VariantData result;
    result.weight = clampWeight(record.weight);
    if (result.weight != record.weight) {
        context.logMessage(LogMsg() << describe() << ": weight " << record.weight << " clamped to " << result.weight, LogSeverity::Warning);
    }
    result.width = clampStretch(record.width);
    if (result.width != record.width) {
        context.logMessage(LogMsg() << describe() << ": width " << record.width << " clamped to " << result.width, LogSeverity::Warning);
    }
    result.style = record.style;

    std::vector<std::pair<PropertyId, std::string>> properties;
    properties.reserve(record.properties.size());
    std::unordered_set<int> seenIds;
    for (auto& [id, value] : record.properties) {
        if (canonicalPropertyName(id).empty()) {
            context.logMessage(LogMsg() << describe() << ": property id " << static_cast<int>(id) << " skipped", LogSeverity::Warning);
            continue;
        }
        if (!seenIds.insert(static_cast<int>(id)).second) {
            context.logMessage(LogMsg() << describe() << ": duplicate property '" << canonicalPropertyName(id) << "' ignored", LogSeverity::Warning);
            continue;
        }
        properties.emplace_back(id, std::move(value));
    }
    result.information = PropertyMap(std::move(properties));
    result.name = std::move(record.name);
    result.filename = std::move(record.filename);
    return result;
}

std::unique_ptr<const detail::CollectionData> buildCollection(FontSnapshot&& snapshot, const FontcatContext& context)
{
    auto data = std::make_unique<detail::CollectionData>();
    for (auto& familyRecord : snapshot) {
        if (familyRecord.variants.empty()) {
            context.logMessage(LogMsg() << "font family '" << familyRecord.name << "' has no variants and was skipped", LogSeverity::Warning);
            continue;
        }
        auto [it, inserted] = data->familyIndex.emplace(familyRecord.name, data->families.size());
        if (inserted) {
            data->families.push_back(detail::FamilyData{ familyRecord.name, {} });
        } else {
            context.logMessage(LogMsg() << "font family '" << familyRecord.name << "' is listed more than once. Its variants were merged.", LogSeverity::Warning);
        }
        auto& family = data->families[it->second];
        for (auto& variantRecord : familyRecord.variants) {
            family.variants.push_back(buildVariant(std::move(variantRecord), family.name, context));
        }
    }
    return data;
}

} // namespace

FontStyle VariantQuery::requestedStyle() const
{
    if (style) {
        return *style;
    }
    if (italic) {
        return *italic ? FontStyle::Italic : FontStyle::Normal;
    }
    return FontStyle::Normal;
}

// ***********
// ** Variant
// ***********

Family Variant::family() const
{
    return Family(m_data, m_familyIndex);
}

std::string Variant::toString() const
{
    std::stringstream result;
    result << "<FontVariant name=" << name() << ", family=" << family().toString()
           << ", style=" << style() << ", weight=" << weight() << ", width=" << width() << ">";
    return result.str();
}

std::ostream& operator<<(std::ostream& os, const Variant& variant)
{
    return os << variant.toString();
}

// **********
// ** Family
// **********

Variant Family::at(size_t index) const
{
    if (index >= size()) {
        throw index_out_of_range(index, size());
    }
    return Variant(m_data, m_index, index);
}

Variant Family::at(std::string_view variantName) const
{
    const auto& variants = data().variants;
    for (size_t x = 0; x < variants.size(); x++) {
        if (variants[x].name == variantName) {
            return Variant(m_data, m_index, x);
        }
    }
    throw not_found("unknown font variant '" + std::string(variantName) + "'");
}

std::vector<Variant> Family::getMatchingVariants() const
{
    std::vector<Variant> result;
    result.reserve(size());
    for (size_t x = 0; x < size(); x++) {
        result.emplace_back(m_data, m_index, x);
    }
    return result;
}

Variant Family::getBestVariant(const VariantQuery& query) const
{
    const auto ranking = matching::rankVariants(data(), query);
    if (ranking.empty()) {
        throw index_out_of_range(0, 0);
    }
    return Variant(m_data, m_index, ranking.front());
}

std::vector<Variant> Family::getRankedVariants(const VariantQuery& query) const
{
    std::vector<Variant> result;
    for (size_t index : matching::rankVariants(data(), query)) {
        result.emplace_back(m_data, m_index, index);
    }
    return result;
}

std::string Family::toString() const
{
    return "<FontFamily name=\"" + name() + "\">";
}

std::ostream& operator<<(std::ostream& os, const Family& family)
{
    return os << family.toString();
}

// **************
// ** Collection
// **************

Collection::Collection(const IFontProvider& provider, const FontcatContext& context)
{
    context.logMessage(LogMsg() << "Enumerating fonts from " << provider.providerName(), LogSeverity::Verbose);
    m_data = buildCollection(provider.enumerateFonts(context), context);
    context.logMessage(LogMsg() << "Loaded " << size() << " font families with " << variantCount() << " variants", LogSeverity::Verbose);
}

Family Collection::at(size_t index) const
{
    if (index >= size()) {
        throw index_out_of_range(index, size());
    }
    return Family(m_data.get(), index);
}

Family Collection::at(std::string_view familyName) const
{
    if (auto family = find(familyName)) {
        return *family;
    }
    throw not_found("unknown font family '" + std::string(familyName) + "'");
}

std::optional<Family> Collection::find(std::string_view familyName) const
{
    const auto it = m_data->familyIndex.find(familyName);
    if (it == m_data->familyIndex.end()) {
        return std::nullopt;
    }
    return Family(m_data.get(), it->second);
}

std::vector<Family> Collection::families() const
{
    std::vector<Family> result;
    result.reserve(size());
    for (size_t x = 0; x < size(); x++) {
        result.emplace_back(m_data.get(), x);
    }
    return result;
}

size_t Collection::variantCount() const
{
    size_t result = 0;
    for (const auto& family : m_data->families) {
        result += family.variants.size();
    }
    return result;
}

FontSnapshot Collection::toSnapshot() const
{
    FontSnapshot result;
    result.reserve(size());
    for (const auto& family : m_data->families) {
        FamilyRecord familyRecord{ family.name, {} };
        for (const auto& variant : family.variants) {
            VariantRecord variantRecord{ variant.name, variant.weight, variant.style, variant.width, variant.filename, {} };
            for (const auto& entry : variant.information) {
                variantRecord.properties.emplace_back(entry.id, entry.value);
            }
            familyRecord.variants.push_back(std::move(variantRecord));
        }
        result.push_back(std::move(familyRecord));
    }
    return result;
}

} // namespace fontcat
