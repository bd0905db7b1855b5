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

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "catalog/provider.h"
#include "providers/snapshot.h"

namespace fontcat {

/**
 * @brief enumerates the fonts installed on this system through fontconfig.
 *
 * Localized names (family, style and the sfnt name table read with FreeType) are chosen by the
 * user's language from LANG, then English, then the first one listed.
 */
class FontconfigProvider : public IFontProvider
{
public:
    /// @param language overrides the user's language (an ISO 639 code such as "de"). Empty means use LANG.
    explicit FontconfigProvider(std::string language = {}) : m_language(std::move(language)) {}

    /// @throws std::runtime_error if fontconfig cannot be initialized
    FontSnapshot enumerateFonts(const FontcatContext& context) const override;

    const std::string_view providerName() const override { return "fontconfig"; }

private:
    std::string m_language;
};

/// @brief creates the provider for a font source given on the command line: "system" or a snapshot file path
/// @throws std::invalid_argument if @p source is a file with an unsupported extension
std::unique_ptr<IFontProvider> createFontProvider(const std::string& source);

} // namespace fontcat
