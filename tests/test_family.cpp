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
#include <climits>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "test_utils.h"
#include "catalog/errors.h"

using namespace fontcat;

TEST(Family, Basics)
{
    const auto collection = makeTestCollection();
    const Family arial = collection["Arial"];
    EXPECT_EQ(arial.name(), "Arial");
    EXPECT_EQ(arial.size(), 8);
    EXPECT_EQ(arial.toString(), "<FontFamily name=\"Arial\">");
    EXPECT_EQ(arial["Bold"], arial[2]);
    EXPECT_THROW((void)arial[arial.size()], index_out_of_range);
    try {
        (void)arial["Semibold"];
        FAIL() << "expected not_found";
    } catch (const not_found& ex) {
        EXPECT_STREQ(ex.what(), "unknown font variant 'Semibold'");
    }
}

TEST(Family, GetMatchingVariants)
{
    const auto collection = makeTestCollection();
    for (const auto& family : collection.families()) {
        const auto variants = family.getMatchingVariants();
        ASSERT_EQ(variants.size(), family.size());
        ASSERT_FALSE(variants.empty());
        for (size_t x = 0; x < variants.size(); x++) {
            EXPECT_EQ(variants[x].index(), x);
            EXPECT_EQ(variants[x].family(), family);
        }
    }
}

TEST(Family, BestVariantDefault)
{
    const auto collection = makeTestCollection();
    const Variant best = collection["Arial"].getBestVariant();
    EXPECT_EQ(best.name(), "Regular");
    EXPECT_EQ(best.weight(), weight::NORMAL);
    EXPECT_EQ(best.style(), FontStyle::Normal);
}

TEST(Family, BestVariantWeightAndStyle)
{
    const auto collection = makeTestCollection();
    const Family arial = collection["Arial"];
    EXPECT_EQ(arial.getBestVariant({ weight::BOLD, std::nullopt, std::nullopt, true }).name(), "Bold Italic");
    EXPECT_EQ(arial.getBestVariant({ weight::BOLD, FontStyle::Italic }).name(), "Bold Italic");
    EXPECT_EQ(arial.getBestVariant({ weight::BOLD }).name(), "Bold");
    EXPECT_EQ(arial.getBestVariant({ weight::SEMI_BOLD }).name(), "Bold") << "equal candidates resolve to the lower index";
    EXPECT_EQ(arial.getBestVariant({ weight::EXTRA_BOLD }).name(), "Black") << "ties prefer the heavier weight";
    EXPECT_EQ(arial.getBestVariant({ weight::THIN }).name(), "Regular");
    EXPECT_EQ(arial.getBestVariant({ std::nullopt, std::nullopt, std::nullopt, false }).name(), "Regular");
}

TEST(Family, BestVariantPrefersHeavierOnTie)
{
    const auto collection = makeTestCollection();
    const Variant best = collection["Sparse"].getBestVariant({ weight::BOLD });
    EXPECT_EQ(best.weight(), 1000);
    EXPECT_EQ(best.name(), "Ultra");
}

TEST(Family, BestVariantStyleFallback)
{
    const auto collection = makeTestCollection();
    const Family arial = collection["Arial"];
    EXPECT_EQ(arial.getBestVariant({ std::nullopt, FontStyle::Oblique }).name(), "Italic") << "oblique falls back to italic";

    const Family slanted = collection["Slanted"];
    EXPECT_EQ(slanted.getBestVariant().name(), "Oblique") << "normal falls back to oblique";
    EXPECT_EQ(slanted.getBestVariant({ std::nullopt, std::nullopt, std::nullopt, true }).name(), "Oblique") << "italic falls back to oblique";
    EXPECT_EQ(slanted.getBestVariant({ weight::BLACK }).name(), "Bold Oblique");

    const Family script = collection["Script"];
    EXPECT_EQ(script.getBestVariant().style(), FontStyle::Italic) << "normal falls back to italic when there is no oblique";
    EXPECT_EQ(script.getBestVariant({ weight::BOLD, FontStyle::Oblique }).name(), "Bold Italic");
}

TEST(Family, StyleTakesPrecedenceOverItalic)
{
    const auto collection = makeTestCollection();
    const Family arial = collection["Arial"];
    EXPECT_EQ(arial.getBestVariant({ weight::BOLD, FontStyle::Normal, std::nullopt, true }).name(), "Bold");
    EXPECT_EQ(arial.getBestVariant({ weight::BOLD, FontStyle::Italic, std::nullopt, false }).name(), "Bold Italic");
}

TEST(Family, BestVariantWithWidth)
{
    const auto collection = makeTestCollection();
    const Family arial = collection["Arial"];
    EXPECT_EQ(arial.getBestVariant({ weight::NORMAL, std::nullopt, stretch::NORMAL, true }).name(), "Italic");
    EXPECT_EQ(arial.getBestVariant({ std::nullopt, std::nullopt, stretch::CONDENSED }).name(), "Narrow");
    EXPECT_EQ(arial.getBestVariant({ weight::BOLD, std::nullopt, stretch::CONDENSED, true }).name(), "Narrow Italic")
        << "width is compared before weight";
    EXPECT_EQ(arial.getBestVariant({ weight::BLACK, std::nullopt, stretch::ULTRA_CONDENSED }).name(), "Narrow Bold");
    EXPECT_EQ(arial.getBestVariant({ weight::BLACK, std::nullopt, stretch::EXPANDED }).name(), "Black");
    EXPECT_EQ(arial.getBestVariant({ std::nullopt, FontStyle::Oblique, stretch::NORMAL }).name(), "Italic");
}

TEST(Family, ItalicBeatsExactWidth)
{
    FontSnapshot snapshot = {
        FamilyRecord{ "Mixed", {
            VariantRecord{ "Regular", weight::NORMAL, FontStyle::Normal, stretch::NORMAL, "mixed.ttf", {} },
            VariantRecord{ "Compressed Italic", weight::NORMAL, FontStyle::Italic, stretch::ULTRA_CONDENSED, "mixed-ci.ttf", {} },
        } },
    };
    FontcatContext context(FONTCAT_NAME);
    const Collection collection(StaticFontProvider(snapshot), context);
    const Variant best = collection["Mixed"].getBestVariant({ weight::NORMAL, std::nullopt, stretch::NORMAL, true });
    EXPECT_EQ(best.style(), FontStyle::Italic);
    EXPECT_EQ(best.width(), stretch::ULTRA_CONDENSED);
}

TEST(Family, BestVariantClampsRequest)
{
    const auto collection = makeTestCollection();
    const Family arial = collection["Arial"];
    EXPECT_EQ(arial.getBestVariant({ INT_MIN }).name(), "Regular");
    EXPECT_EQ(arial.getBestVariant({ INT_MAX }).name(), "Black");
    EXPECT_EQ(arial.getBestVariant({ weight::NORMAL, std::nullopt, INT_MIN }).name(), "Narrow");
    EXPECT_EQ(arial.getBestVariant({ weight::NORMAL, std::nullopt, INT_MAX }).name(), "Regular");
    EXPECT_EQ(arial.getRankedVariants({ INT_MIN, std::nullopt, INT_MAX }).size(), arial.size());

    const Family sparse = collection["Sparse"];
    EXPECT_EQ(sparse.getBestVariant({ INT_MIN }).name(), "Regular");
    EXPECT_EQ(sparse.getBestVariant({ INT_MAX }).name(), "Ultra");
    EXPECT_EQ(sparse.getBestVariant({ weight::MAX + 1 }).name(), "Ultra");
}

TEST(Family, RankedVariants)
{
    const auto collection = makeTestCollection();
    const Family arial = collection["Arial"];
    const std::vector<VariantQuery> queries = {
        {},
        { weight::BOLD, std::nullopt, std::nullopt, true },
        { weight::EXTRA_BOLD },
        { weight::BOLD, std::nullopt, stretch::CONDENSED, true },
        { std::nullopt, FontStyle::Oblique, stretch::EXPANDED },
    };
    for (const auto& query : queries) {
        const auto ranked = arial.getRankedVariants(query);
        ASSERT_EQ(ranked.size(), arial.size());
        EXPECT_EQ(ranked.front(), arial.getBestVariant(query));
    }

    std::vector<std::string> names;
    for (const auto& variant : arial.getRankedVariants({ weight::BOLD, FontStyle::Italic })) {
        names.push_back(variant.name());
    }
    EXPECT_EQ(names, (std::vector<std::string>{ "Bold Italic", "Italic", "Narrow Italic", "Bold", "Narrow Bold", "Black", "Regular", "Narrow" }))
        << "italic group first, then the normal group because there is no oblique";
}
