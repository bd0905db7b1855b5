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

#include "providers/snapshot.h"
#include "fontcat.h"

namespace fontcat {
namespace snapshot {

namespace {

// Snapshot readers
constexpr auto readers = []() {
    struct SnapshotReader
    {
        const char* extension;
        FontSnapshot(*processor)(const std::filesystem::path&, const FontcatContext&);
    };

    return std::to_array<SnapshotReader>({
        { JSON_EXTENSION, readJson },
        { XML_EXTENSION, readXml },
        });
    }();

// Snapshot writers
constexpr auto writers = []() {
    struct SnapshotWriter
    {
        const char* extension;
        void(*processor)(const std::filesystem::path&, const FontSnapshot&, const FontcatContext&);
    };

    return std::to_array<SnapshotWriter>({
        { JSON_EXTENSION, writeJson },
        { XML_EXTENSION, writeXml },
        });
    }();

} // namespace

FontSnapshot read(const std::filesystem::path& inputPath, const FontcatContext& context)
{
    auto reader = findProcessor(readers, utils::pathExtension(inputPath));
    return reader(inputPath, context);
}

void write(const std::filesystem::path& outputPath, std::string_view format, const FontSnapshot& fonts, const FontcatContext& context)
{
    auto writer = findProcessor(writers, std::string(format));
    writer(outputPath, fonts, context);
}

const std::vector<std::string_view>& supportedFormats()
{
    static const std::vector<std::string_view> formats = []() {
            std::vector<std::string_view> result;
            for (const auto& writer : writers) {
                result.emplace_back(writer.extension);
            }
            return result;
        }();
    return formats;
}

} // namespace snapshot

FontSnapshot SnapshotFileProvider::enumerateFonts(const FontcatContext& context) const
{
    if (!std::filesystem::is_regular_file(m_path)) {
        throw std::runtime_error("Input file " + utils::pathToString(m_path) + " does not exist or is not a file.");
    }
    context.logMessage(LogMsg() << "Reading font snapshot " << utils::pathToString(m_path), LogSeverity::Verbose);
    return snapshot::read(m_path, context);
}

} // namespace fontcat
