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
#include "providers/providers.h"
#include "fontcat.h"

namespace fontcat {

std::unique_ptr<IFontProvider> createFontProvider(const std::string& source)
{
    if (source == SYSTEM_SOURCE) {
        return std::make_unique<FontconfigProvider>();
    }
    const std::filesystem::path path = utils::utf8ToPath(source);
    const std::string extension = utils::pathExtension(path);
    for (const auto& format : snapshot::supportedFormats()) {
        if (extension == format) {
            return std::make_unique<SnapshotFileProvider>(path);
        }
    }
    throw std::invalid_argument("Unsupported format: " + extension);
}

} // namespace fontcat
