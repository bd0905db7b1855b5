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
#include <string>
#include <filesystem>
#include <iostream>
#include <sstream>

#include "gtest/gtest.h"
#include "fontcat.h"
#include "test_utils.h"
#include "providers/snapshot.h"
#include "commands/commands.h"

using namespace fontcat;

static std::string catalogPath(const std::string& fileName = "catalog.json")
{
    return utils::pathToString(getInputPath() / fileName);
}

TEST(ListCommand, Families)
{
    ArgList args = { FONTCAT_NAME, "list", catalogPath() };
    checkStdout({ "Arial\nSparse\nSlanted\nScript\n" }, [&]() {
        EXPECT_EQ(fontcatTestMain(args.argc(), args.argv()), 0) << "list families";
    });
}

TEST(ListCommand, Variants)
{
    ArgList args = { FONTCAT_NAME, "list", catalogPath("catalog.xml"), "--variants" };
    checkStdout({ "Arial\n    Regular (weight=400, style=NORMAL, width=5)\n",
                  "    Bold Italic (weight=700, style=ITALIC, width=5)",
                  "    Narrow Italic (weight=400, style=ITALIC, width=3)",
                  "Slanted\n    Oblique (weight=400, style=OBLIQUE, width=5)",
                  "    Ultra (weight=1000, style=NORMAL, width=5)" }, [&]() {
        EXPECT_EQ(fontcatTestMain(args.argc(), args.argv()), 0) << "list variants";
    });
}

TEST(ListCommand, IgnoresExtraArguments)
{
    ArgList args = { FONTCAT_NAME, "list", catalogPath(), "extra" };
    checkStderr({ "[WARNING] Ignoring unrecognized argument: extra" }, [&]() {
        EXPECT_EQ(fontcatTestMain(args.argc(), args.argv()), 0) << "warnings do not fail the command";
    });
}

TEST(MatchCommand, BestVariant)
{
    {
        ArgList args = { FONTCAT_NAME, "match", catalogPath(), "--family", "Arial", "--weight", "bold", "--italic" };
        checkStdout({ "<FontVariant name=Bold Italic, family=<FontFamily name=\"Arial\">, style=ITALIC, weight=700, width=5>" }, [&]() {
            EXPECT_EQ(fontcatTestMain(args.argc(), args.argv()), 0) << "bold italic";
        });
    }
    {
        ArgList args = { FONTCAT_NAME, "match", catalogPath(), "--family", "Arial" };
        checkStdout({ "<FontVariant name=Regular," }, [&]() {
            EXPECT_EQ(fontcatTestMain(args.argc(), args.argv()), 0) << "default query";
        });
    }
    {
        ArgList args = { FONTCAT_NAME, "match", catalogPath(), "--family", "Arial", "--width", "condensed", "--weight", "700" };
        checkStdout({ "<FontVariant name=Narrow Bold," }, [&]() {
            EXPECT_EQ(fontcatTestMain(args.argc(), args.argv()), 0) << "width compared";
        });
    }
    {
        ArgList args = { FONTCAT_NAME, "match", catalogPath(), "--family", "Script", "--no-italic" };
        checkStdout({ "<FontVariant name=Italic, family=<FontFamily name=\"Script\">" }, [&]() {
            EXPECT_EQ(fontcatTestMain(args.argc(), args.argv()), 0) << "italic-only family";
        });
    }
}

TEST(MatchCommand, RankedWithInformation)
{
    ArgList args = { FONTCAT_NAME, "match", catalogPath(), "--family", "Arial", "--weight", "700", "--style", "italic", "--ranked", "--info" };
    checkStdout({ "1. <FontVariant name=Bold Italic,", "2. <FontVariant name=Italic,", "8. <FontVariant name=Narrow,",
                  "    full_name (16): Arial Bold Italic", "    postscript_name (17): Arial-BoldItalicMT" }, [&]() {
        EXPECT_EQ(fontcatTestMain(args.argc(), args.argv()), 0) << "ranked output";
    });
}

TEST(MatchCommand, StyleAndItalic)
{
    ArgList args = { FONTCAT_NAME, "match", catalogPath(), "--family", "Slanted", "--style", "normal", "--italic" };
    checkStderr({ "Both --style and --italic given. Using --style NORMAL" }, [&]() {
        EXPECT_EQ(fontcatTestMain(args.argc(), args.argv()), 0) << "style wins";
    });
}

TEST(MatchCommand, Errors)
{
    {
        ArgList args = { FONTCAT_NAME, "match", catalogPath(), "--weight", "bold" };
        checkStderr({ "The match command requires --family <name>." }, [&]() {
            EXPECT_NE(fontcatTestMain(args.argc(), args.argv()), 0) << "missing family";
        });
    }
    {
        ArgList args = { FONTCAT_NAME, "match", catalogPath(), "--family", "arial" };
        checkStderr({ "unknown font family 'arial'" }, [&]() {
            EXPECT_NE(fontcatTestMain(args.argc(), args.argv()), 0) << "family names are case-sensitive";
        });
    }
}

TEST(QueryCommand, MatchingVariants)
{
    {
        ArgList args = { FONTCAT_NAME, "query", catalogPath(), "--filter", "full_name=Arial Bold Italic" };
        checkStdout({ "<FontVariant name=Bold Italic, family=<FontFamily name=\"Arial\">" }, [&]() {
            EXPECT_EQ(fontcatTestMain(args.argc(), args.argv()), 0) << "full name";
        });
    }
    {
        ArgList args = { FONTCAT_NAME, "query", catalogPath(), "--filter", "win32_family_names=Script" };
        checkStdout({ "<FontVariant name=Italic, family=<FontFamily name=\"Script\">",
                      "<FontVariant name=Bold Italic, family=<FontFamily name=\"Script\">" }, [&]() {
            EXPECT_EQ(fontcatTestMain(args.argc(), args.argv()), 0) << "family name";
        });
    }
    {
        ArgList args = { FONTCAT_NAME, "query", catalogPath(), "--filter", "full_name=Arial Bold Italic", "--filter", "postscript_name=ArialMT" };
        checkStdout({ "" }, [&]() {
            EXPECT_EQ(fontcatTestMain(args.argc(), args.argv()), 0) << "conditions are combined";
        });
    }
}

TEST(QueryCommand, Errors)
{
    {
        ArgList args = { FONTCAT_NAME, "query", catalogPath() };
        checkStderr({ "no filter conditions passed" }, [&]() {
            EXPECT_NE(fontcatTestMain(args.argc(), args.argv()), 0) << "no filters";
        });
    }
    {
        ArgList args = { FONTCAT_NAME, "query", catalogPath(), "--filter", "glyph_count=3" };
        checkStderr({ "'glyph_count' isn't a known font property name" }, [&]() {
            EXPECT_NE(fontcatTestMain(args.argc(), args.argv()), 0) << "unknown property";
        });
    }
    {
        ArgList args = { FONTCAT_NAME, "query", catalogPath(), "--filter", "preferred_subfamily_names=Bold" };
        checkStderr({ "'preferred_subfamily_names' doesn't have a mapping to font property id" }, [&]() {
            EXPECT_NE(fontcatTestMain(args.argc(), args.argv()), 0) << "property cannot be filtered";
        });
    }
}

TEST(QueryCommand, HelpListsFilterableAliases)
{
    std::ostringstream coutStream;
    std::streambuf* originalCout = std::cout.rdbuf(coutStream.rdbuf());
    QueryCommand().showHelpPage(FONTCAT_NAME);
    std::cout.rdbuf(originalCout);

    const std::string helpText = coutStream.str();
    for (const auto& alias : propertyAliases()) {
        const bool listed = helpText.find("  " + std::string(alias.name) + " ") != std::string::npos;
        EXPECT_EQ(listed, findPropertyDescriptor(alias.name)->filterable) << alias.name;
    }
    EXPECT_NE(helpText.find("wss_family_name (same as weight_stretch_style_family_name)"), std::string::npos) << helpText;
    EXPECT_NE(helpText.find("preferred_family_names (same as typographic_family_names)"), std::string::npos) << helpText;
    EXPECT_EQ(helpText.find("preferred_subfamily_names"), std::string::npos) << helpText;
    EXPECT_EQ(helpText.find("  copyright"), std::string::npos) << helpText;
}

TEST(ExportCommand, DefaultOutputPath)
{
    setupTestDataPaths();
    std::filesystem::path inputPath;
    copyInputToOutput("catalog.json", inputPath);
    const auto xmlPath = getOutputPath() / "catalog.xml";
    {
        ArgList args = { FONTCAT_NAME, "export", utils::pathToString(inputPath), "--xml" };
        checkStderr({ "Output: ", "catalog.xml" }, [&]() {
            EXPECT_EQ(fontcatTestMain(args.argc(), args.argv()), 0) << "export xml";
        });
        ASSERT_TRUE(std::filesystem::is_regular_file(xmlPath));
        assertStringsInFile({ "<fontCatalog version=\"1\">", "<family name=\"Sparse\">" }, xmlPath);
    }
    {
        ArgList args = { FONTCAT_NAME, "export", utils::pathToString(inputPath), "--xml" };
        checkStderr({ "exists. Use --force to overwrite it." }, [&]() {
            EXPECT_EQ(fontcatTestMain(args.argc(), args.argv()), 0) << "existing file is kept";
        });
    }
    {
        ArgList args = { FONTCAT_NAME, "export", utils::pathToString(inputPath), "--xml", "--force" };
        checkStderr({ "Overwriting", "catalog.xml" }, [&]() {
            EXPECT_EQ(fontcatTestMain(args.argc(), args.argv()), 0) << "existing file is replaced";
        });
    }
    {
        ArgList args = { FONTCAT_NAME, "export", utils::pathToString(inputPath), "--json" };
        checkStderr({ "Input and output are the same. No action taken." }, [&]() {
            EXPECT_EQ(fontcatTestMain(args.argc(), args.argv()), 0) << "input is not overwritten";
        });
    }
}

TEST(ExportCommand, ReadBack)
{
    setupTestDataPaths();
    const auto jsonPath = getOutputPath() / "exported" / "fonts.json";
    ArgList args = { FONTCAT_NAME, "export", catalogPath("catalog.xml"), "--json", utils::pathToString(jsonPath), "--indent", "2" };
    checkStderr({ "Output: ", "fonts.json" }, [&]() {
        EXPECT_EQ(fontcatTestMain(args.argc(), args.argv()), 0) << "export json";
    });
    ASSERT_TRUE(std::filesystem::is_regular_file(jsonPath));
    assertStringsInFile({ "\n  \"families\": [" }, jsonPath);

    FontcatContext context(FONTCAT_NAME);
    context.noLog = true;
    EXPECT_EQ(snapshot::read(jsonPath, context), makeTestSnapshot());
}

TEST(ExportCommand, Errors)
{
    setupTestDataPaths();
    std::filesystem::path inputPath;
    copyInputToOutput("catalog.json", inputPath);
    {
        ArgList args = { FONTCAT_NAME, "export", utils::pathToString(inputPath) };
        checkStderr({ "No output option specified. Use --json or --xml." }, [&]() {
            EXPECT_NE(fontcatTestMain(args.argc(), args.argv()), 0) << "no output option";
        });
    }
    {
        ArgList args = { FONTCAT_NAME, "export", utils::pathToString(inputPath), "--yaml" };
        checkStderr({ "Unsupported format: yaml" }, [&]() {
            EXPECT_NE(fontcatTestMain(args.argc(), args.argv()), 0) << "unsupported output format";
        });
    }
}
