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

#include <filesystem>
#include <string_view>

#include "catalog/provider.h"

namespace fontcat {

struct FontcatContext;

namespace snapshot {

inline constexpr int SNAPSHOT_VERSION = 1;

FontSnapshot readJson(const std::filesystem::path& inputPath, const FontcatContext& context);
void writeJson(const std::filesystem::path& outputPath, const FontSnapshot& fonts, const FontcatContext& context);

FontSnapshot readXml(const std::filesystem::path& inputPath, const FontcatContext& context);
void writeXml(const std::filesystem::path& outputPath, const FontSnapshot& fonts, const FontcatContext& context);

/// @brief reads a snapshot, choosing the format by file extension
/// @throws std::invalid_argument for an unsupported extension
FontSnapshot read(const std::filesystem::path& inputPath, const FontcatContext& context);

/// @brief writes a snapshot, choosing the format by @p format (a file extension without the dot)
/// @throws std::invalid_argument for an unsupported format
void write(const std::filesystem::path& outputPath, std::string_view format, const FontSnapshot& fonts, const FontcatContext& context);

/// extensions accepted by read and write
const std::vector<std::string_view>& supportedFormats();

} // namespace snapshot

/// provider that replays a snapshot file written by `export`
class SnapshotFileProvider : public IFontProvider
{
public:
    explicit SnapshotFileProvider(const std::filesystem::path& path) : m_path(path) {}

    FontSnapshot enumerateFonts(const FontcatContext& context) const override;

    const std::string_view providerName() const override { return "snapshot"; }

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

} // namespace fontcat
