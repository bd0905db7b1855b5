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

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "catalog/fonttypes.h"
#include "catalog/propertymap.h"

namespace fontcat {

struct FontcatContext;

struct VariantRecord
{
    std::string name;
    FontWeight weight{ weight::NORMAL };
    FontStyle style{ FontStyle::Normal };
    FontStretch width{ stretch::NORMAL };
    std::string filename;
    std::vector<std::pair<PropertyId, std::string>> properties;

    bool operator==(const VariantRecord&) const = default;
};

struct FamilyRecord
{
    std::string name;
    std::vector<VariantRecord> variants;

    bool operator==(const FamilyRecord&) const = default;
};

/// the complete result of one font enumeration, in enumeration order
using FontSnapshot = std::vector<FamilyRecord>;

/**
 * @brief source of the installed (or recorded) fonts a Collection is built from.
 *
 * A provider is called exactly once per Collection. It may log through the context but reports
 * failures by throwing.
 */
class IFontProvider
{
public:
    IFontProvider() = default;
    virtual ~IFontProvider() = default;

    virtual FontSnapshot enumerateFonts(const FontcatContext& context) const = 0;

    virtual const std::string_view providerName() const = 0;
};

/// provider over a snapshot held in memory
class StaticFontProvider : public IFontProvider
{
public:
    explicit StaticFontProvider(FontSnapshot snapshot) : m_snapshot(std::move(snapshot)) {}

    FontSnapshot enumerateFonts(const FontcatContext&) const override { return m_snapshot; }

    const std::string_view providerName() const override { return "memory"; }

private:
    FontSnapshot m_snapshot;
};

} // namespace fontcat
