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
#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "test_utils.h"

using namespace fontcat;

// Optional setup/teardown for test suite
class TestEnvironment : public ::testing::Environment {
public:
    void SetUp() override {
        std::filesystem::create_directories(getOutputPath());
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(getOutputPath(), ec);
    }
};

// checks for a specific error string in the output
void checkStderr(const std::vector<std::string_view>& expectedMessages, std::function<void()> callback)
{
    // Redirect stderr to capture messages
    std::ostringstream nullStream; // used to suppress std::cout
    std::streambuf* originalCout = std::cout.rdbuf(nullStream.rdbuf()); // Redirect std::cout to null
    std::ostringstream errStream;
    std::streambuf* originalCerr = std::cerr.rdbuf(errStream.rdbuf());

    // do the callback
    callback();

    // Restore stderr and stdout
    std::cout.rdbuf(originalCout);
    std::cerr.rdbuf(originalCerr);

    // check for errStream for error
    std::string capturedErrors = errStream.str();
    for (const auto& expectedMessage : expectedMessages) {
        if (expectedMessage.empty()) {
            EXPECT_TRUE(capturedErrors.empty()) << "No error message expected but got " << capturedErrors;
        } else {
            EXPECT_NE(capturedErrors.find(expectedMessage), std::string::npos)
                << "Expected error message \"" << expectedMessage << "\" not found. Actual: " << capturedErrors;
        }
    }
}

void checkStdout(const std::vector<std::string_view>& expectedMessages, std::function<void()> callback)
{
    // Redirect stdout to capture messages
    std::ostringstream nullStream; // used to suppress std::cerr
    std::streambuf* originalCerr = std::cerr.rdbuf(nullStream.rdbuf()); // Redirect std::cerr to null
    std::ostringstream coutStream;
    std::streambuf* originalCout = std::cout.rdbuf(coutStream.rdbuf());

    // do the callback
    callback();

    // Restore stderr and stdout
    std::cout.rdbuf(originalCout);
    std::cerr.rdbuf(originalCerr);

    EXPECT_TRUE(nullStream.str().empty()) << "Error occurred: " << nullStream.str();

    // check for coutStream for the expected output
    std::string capturedMessages = coutStream.str();
    for (const auto& expectedMessage : expectedMessages) {
        if (expectedMessage.empty()) {
            EXPECT_TRUE(capturedMessages.empty()) << "No output expected but got " << capturedMessages;
        } else {
            EXPECT_NE(capturedMessages.find(expectedMessage), std::string::npos)
                << "Expected output \"" << expectedMessage << "\" not found. Actual: " << capturedMessages;
        }
    }
}

std::filesystem::path getInputPath()
{
    return std::filesystem::path(FONTCAT_TEST_DATA_DIR);
}

std::filesystem::path getOutputPath()
{
    return std::filesystem::temp_directory_path() / "fontcat-tests-output";
}

void setupTestDataPaths()
{
    std::filesystem::remove_all(getOutputPath());
    std::filesystem::create_directories(getOutputPath());
}

void copyInputToOutput(const std::string& fileName, std::filesystem::path& outputPath)
{
    const auto inputPath = getInputPath() / utils::utf8ToPath(fileName);
    outputPath = getOutputPath() / utils::utf8ToPath(fileName);
    std::filesystem::create_directories(outputPath.parent_path());
    std::filesystem::copy_file(inputPath, outputPath, std::filesystem::copy_options::overwrite_existing);
}

void assertStringsInFile(const std::vector<std::string>& expected, const std::filesystem::path& path, const std::string& extension)
{
    std::filesystem::path filePath = path;
    if (std::filesystem::is_directory(path)) {
        // use the newest file with the extension
        filePath.clear();
        for (const auto& entry : std::filesystem::directory_iterator(path)) {
            if (entry.is_regular_file() && (extension.empty() || entry.path().extension() == extension)) {
                if (filePath.empty() || entry.last_write_time() > std::filesystem::last_write_time(filePath)) {
                    filePath = entry.path();
                }
            }
        }
    }
    ASSERT_FALSE(filePath.empty()) << "no file with extension " << extension << " found in " << path.string();
    std::ifstream file(filePath, std::ios::binary);
    ASSERT_TRUE(file.is_open()) << "unable to open " << filePath.string();
    std::stringstream buffer;
    buffer << file.rdbuf();
    const std::string contents = buffer.str();
    for (const auto& text : expected) {
        EXPECT_NE(contents.find(text), std::string::npos) << "\"" << text << "\" not found in " << filePath.string();
    }
}

namespace {

VariantRecord makeVariant(const std::string& name, FontWeight weight, FontStyle style, FontStretch width,
                          const std::string& filename, const std::string& fullName, const std::string& postscriptName)
{
    return VariantRecord{ name, weight, style, width, filename, {
        { PropertyId::Win32FamilyNames, "" },
        { PropertyId::FullName, fullName },
        { PropertyId::PostscriptName, postscriptName },
    } };
}

FamilyRecord makeFamily(const std::string& name, std::vector<VariantRecord> variants)
{
    for (auto& variant : variants) {
        for (auto& [id, value] : variant.properties) {
            if (id == PropertyId::Win32FamilyNames) {
                value = name;
            }
        }
    }
    return FamilyRecord{ name, std::move(variants) };
}

} // namespace

FontSnapshot makeTestSnapshot()
{
    auto arialRegular = makeVariant("Regular", weight::REGULAR, FontStyle::Normal, stretch::NORMAL, "/fonts/arial.ttf", "Arial", "ArialMT");
    arialRegular.properties.insert(arialRegular.properties.begin(), {
        { PropertyId::Copyright, "(c) 2006 The Monotype Corporation. All Rights Reserved." },
        { PropertyId::Designer, "Robin Nicholas, Patricia Saunders" },
    });
    arialRegular.properties.emplace_back(PropertyId::Win32SubfamilyNames, "Regular");
    return {
        makeFamily("Arial", {
            arialRegular,
            makeVariant("Italic", weight::REGULAR, FontStyle::Italic, stretch::NORMAL, "/fonts/ariali.ttf", "Arial Italic", "Arial-ItalicMT"),
            makeVariant("Bold", weight::BOLD, FontStyle::Normal, stretch::NORMAL, "/fonts/arialbd.ttf", "Arial Bold", "Arial-BoldMT"),
            makeVariant("Bold Italic", weight::BOLD, FontStyle::Italic, stretch::NORMAL, "/fonts/arialbi.ttf", "Arial Bold Italic", "Arial-BoldItalicMT"),
            makeVariant("Black", weight::BLACK, FontStyle::Normal, stretch::NORMAL, "/fonts/ariblk.ttf", "Arial Black", "Arial-Black"),
            makeVariant("Narrow", weight::REGULAR, FontStyle::Normal, stretch::CONDENSED, "/fonts/arialn.ttf", "Arial Narrow", "ArialNarrow"),
            makeVariant("Narrow Bold", weight::BOLD, FontStyle::Normal, stretch::CONDENSED, "/fonts/arialnb.ttf", "Arial Narrow Bold", "ArialNarrow-Bold"),
            makeVariant("Narrow Italic", weight::REGULAR, FontStyle::Italic, stretch::CONDENSED, "/fonts/arialni.ttf", "Arial Narrow Italic", "ArialNarrow-Italic"),
        }),
        makeFamily("Sparse", {
            makeVariant("Regular", weight::REGULAR, FontStyle::Normal, stretch::NORMAL, "/fonts/sparse-regular.otf", "Sparse Regular", "Sparse-Regular"),
            makeVariant("Ultra", weight::MAX, FontStyle::Normal, stretch::NORMAL, "/fonts/sparse-ultra.otf", "Sparse Ultra", "Sparse-Ultra"),
        }),
        makeFamily("Slanted", {
            makeVariant("Oblique", weight::REGULAR, FontStyle::Oblique, stretch::NORMAL, "/fonts/slanted-oblique.otf", "Slanted Oblique", "Slanted-Oblique"),
            makeVariant("Bold Oblique", weight::BOLD, FontStyle::Oblique, stretch::NORMAL, "/fonts/slanted-boldoblique.otf", "Slanted Bold Oblique", "Slanted-BoldOblique"),
        }),
        makeFamily("Script", {
            makeVariant("Italic", weight::REGULAR, FontStyle::Italic, stretch::NORMAL, "/fonts/script-italic.otf", "Script Italic", "Script-Italic"),
            makeVariant("Bold Italic", weight::BOLD, FontStyle::Italic, stretch::NORMAL, "/fonts/script-bolditalic.otf", "Script Bold Italic", "Script-BoldItalic"),
        }),
    };
}

Collection makeTestCollection()
{
    FontcatContext context(FONTCAT_NAME);
    return Collection(StaticFontProvider(makeTestSnapshot()), context);
}

int main(int argc, char** argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    ::testing::AddGlobalTestEnvironment(new TestEnvironment);
    return RUN_ALL_TESTS();
}
