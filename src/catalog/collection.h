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

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "catalog/fonttypes.h"
#include "catalog/propertymap.h"
#include "catalog/provider.h"

namespace fontcat {

struct FontcatContext;

namespace detail {

struct VariantData
{
    std::string name;
    FontWeight weight{};
    FontStyle style{};
    FontStretch width{};
    std::string filename;
    PropertyMap information;
};

struct FamilyData
{
    std::string name;
    std::vector<VariantData> variants;
};

struct CollectionData
{
    std::vector<FamilyData> families;
    std::map<std::string, size_t, std::less<>> familyIndex;
};

} // namespace detail

/// @brief criteria for Family::getBestVariant. Every field is optional.
///
/// If #width is set the three-axis ranking is used, otherwise the weight/style ranking.
/// #italic is shorthand for a style: true means Italic, false means Normal. #style wins when both are set.
struct VariantQuery
{
    std::optional<FontWeight> weight;
    std::optional<FontStyle> style;
    std::optional<FontStretch> width;
    std::optional<bool> italic;

    /// the style actually requested after resolving #style and #italic
    FontStyle requestedStyle() const;
};

class Family;

/// @brief a single face of a family. A view into the Collection that created it.
class Variant
{
public:
    Variant(const detail::CollectionData* data, size_t familyIndex, size_t variantIndex)
        : m_data(data), m_familyIndex(familyIndex), m_variantIndex(variantIndex) {}

    const std::string& name() const { return data().name; }
    FontWeight weight() const { return data().weight; }
    FontStyle style() const { return data().style; }
    FontStretch width() const { return data().width; }
    const std::string& filename() const { return data().filename; }
    const PropertyMap& information() const { return data().information; }

    Family family() const;

    /// position of this variant within its family
    size_t index() const { return m_variantIndex; }

    std::string toString() const;

    bool operator==(const Variant& other) const
    {
        return m_data == other.m_data && m_familyIndex == other.m_familyIndex && m_variantIndex == other.m_variantIndex;
    }

private:
    const detail::VariantData& data() const { return m_data->families[m_familyIndex].variants[m_variantIndex]; }

    const detail::CollectionData* m_data;
    size_t m_familyIndex;
    size_t m_variantIndex;
};

/// @brief a named group of variants. A view into the Collection that created it.
class Family
{
public:
    Family(const detail::CollectionData* data, size_t index)
        : m_data(data), m_index(index) {}

    const std::string& name() const { return data().name; }
    size_t size() const { return data().variants.size(); }

    /// position of this family within its collection
    size_t index() const { return m_index; }

    /// @throws index_out_of_range
    Variant at(size_t index) const;
    /// @throws not_found if no variant has the display name @p variantName
    Variant at(std::string_view variantName) const;

    Variant operator[](size_t index) const { return at(index); }
    Variant operator[](std::string_view variantName) const { return at(variantName); }

    /// all variants in enumeration order
    std::vector<Variant> getMatchingVariants() const;

    /// @brief selects the variant closest to @p query. Never throws for a family with variants.
    Variant getBestVariant(const VariantQuery& query = {}) const;

    /// every variant, best match first, in the order getBestVariant ranks them
    std::vector<Variant> getRankedVariants(const VariantQuery& query = {}) const;

    std::string toString() const;

    bool operator==(const Family& other) const
    {
        return m_data == other.m_data && m_index == other.m_index;
    }

private:
    const detail::FamilyData& data() const { return m_data->families[m_index]; }

    const detail::CollectionData* m_data;
    size_t m_index;
};

/**
 * @brief immutable snapshot of the fonts reported by a provider.
 *
 * Family and Variant objects obtained from a Collection are valid for as long as the Collection lives.
 * Moving a Collection keeps them valid.
 */
class Collection
{
public:
    /// @brief enumerates @p provider once and normalizes its data, logging each correction as a warning.
    Collection(const IFontProvider& provider, const FontcatContext& context);

    Collection(const Collection&) = delete;
    Collection& operator=(const Collection&) = delete;
    Collection(Collection&&) noexcept = default;
    Collection& operator=(Collection&&) noexcept = default;

    size_t size() const { return m_data->families.size(); }
    bool empty() const { return m_data->families.empty(); }

    /// @throws index_out_of_range
    Family at(size_t index) const;
    /// @throws not_found if no family is named exactly @p familyName
    Family at(std::string_view familyName) const;

    Family operator[](size_t index) const { return at(index); }
    Family operator[](std::string_view familyName) const { return at(familyName); }

    std::optional<Family> find(std::string_view familyName) const;

    std::vector<Family> families() const;

    /// total number of variants over all families
    size_t variantCount() const;

    /// the normalized catalog in provider form, used to write snapshot files
    FontSnapshot toSnapshot() const;

private:
    std::unique_ptr<const detail::CollectionData> m_data;
};

std::ostream& operator<<(std::ostream& os, const Variant& variant);
std::ostream& operator<<(std::ostream& os, const Family& family);

namespace matching {

/// @brief ranks the variants of @p family for @p query, best first.
/// @return variant indices
std::vector<size_t> rankVariants(const detail::FamilyData& family, const VariantQuery& query);

} // namespace matching

} // namespace fontcat
