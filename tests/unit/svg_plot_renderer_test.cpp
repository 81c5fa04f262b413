// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include "services/render/svg_plot_renderer.hpp"

#include <gtest/gtest.h>

#include <regex>

#include "test_utils/upload_builder.hpp"

namespace acr_qa::services::test {

namespace {

size_t countOccurrences(const std::string& haystack, const std::string& needle) {
    size_t count = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

} // anonymous namespace

// ============================================================================
// Helpers
// ============================================================================

TEST(SvgPlotRendererTest, FlatRangeIsWidened) {
    auto range = SvgPlotRenderer::computeRange({5.0, 5.0, 5.0});
    EXPECT_DOUBLE_EQ(range.min, 5.0);
    EXPECT_DOUBLE_EQ(range.max, 6.0);

    auto spread = SvgPlotRenderer::computeRange({3.0, -1.0, 7.0});
    EXPECT_DOUBLE_EQ(spread.min, -1.0);
    EXPECT_DOUBLE_EQ(spread.max, 7.0);
}

TEST(SvgPlotRendererTest, EscapesMarkupCharacters) {
    EXPECT_EQ(SvgPlotRenderer::escapeText("A & B <c> \"d\""),
              "A &amp; B &lt;c&gt; &quot;d&quot;");
    EXPECT_EQ(SvgPlotRenderer::escapeText("plain"), "plain");
}

TEST(SvgPlotRendererTest, UniqueIdsAreHexAndDistinct) {
    auto a = SvgPlotRenderer::generateUniqueId();
    auto b = SvgPlotRenderer::generateUniqueId();
    EXPECT_TRUE(std::regex_match(a, std::regex("[0-9a-f]{32}")));
    EXPECT_NE(a, b);
}

// ============================================================================
// Rendering
// ============================================================================

TEST(SvgPlotRendererTest, DocumentStructure) {
    SvgPlotRenderer renderer;
    auto svg = renderer.render("Profile", {0, 1, 2},
                               {{"Line A", {1, 2, 3}}, {"Line B", {3, 2, 1}}});
    ASSERT_TRUE(svg.has_value());

    EXPECT_EQ(svg->rfind("<svg xmlns='http://www.w3.org/2000/svg' width='900' height='420' "
                         "viewBox='0 0 900 420'>", 0), 0u);
    EXPECT_TRUE(svg->ends_with("</svg>\n"));
    EXPECT_EQ(countOccurrences(*svg, "<polyline"), 2u);
    EXPECT_EQ(countOccurrences(*svg, "stroke='#f3f4f6'"), 12u);
    EXPECT_NE(svg->find("stroke='#2563eb'"), std::string::npos);
    EXPECT_NE(svg->find("stroke='#ef4444'"), std::string::npos);
    EXPECT_NE(svg->find(">Line A</text>"), std::string::npos);
    EXPECT_NE(svg->find(">Pixel Number</text>"), std::string::npos);
    EXPECT_NE(svg->find(">Pixel Value</text>"), std::string::npos);
}

TEST(SvgPlotRendererTest, FlatSeriesSitsOnBottomEdge) {
    SvgPlotRenderer renderer;
    auto svg = renderer.render("Flat", {0, 1, 2}, {{"Flat", {5, 5, 5}}});
    ASSERT_TRUE(svg.has_value());
    EXPECT_NE(svg->find("points='70.00,365.00 475.00,365.00 880.00,365.00'"),
              std::string::npos);
}

TEST(SvgPlotRendererTest, LegendEntriesStackDownwards) {
    SvgPlotRenderer renderer;
    auto svg = renderer.render("Legend", {0, 1}, {{"one", {0, 1}}, {"two", {1, 0}}});
    ASSERT_TRUE(svg.has_value());
    EXPECT_NE(svg->find("<line x1='710' y1='54' x2='736' y2='54' stroke='#2563eb' stroke-width='3' />"),
              std::string::npos);
    EXPECT_NE(svg->find("<text x='742' y='78' font-family='Segoe UI, Arial' font-size='12' "
                        "fill='#111827'>two</text>"),
              std::string::npos);
}

TEST(SvgPlotRendererTest, PaletteCycles) {
    SvgPlotRenderer renderer;
    std::vector<PlotSeries> series;
    for (int i = 0; i < 5; ++i) {
        series.push_back({"s" + std::to_string(i), {0.0, static_cast<double>(i)}});
    }
    auto svg = renderer.render("Many", {0, 1}, series);
    ASSERT_TRUE(svg.has_value());
    EXPECT_EQ(countOccurrences(*svg, "<polyline fill='none' stroke='#2563eb'"), 2u);
}

TEST(SvgPlotRendererTest, TitleAndLabelsAreEscaped) {
    SvgPlotRenderer renderer;
    auto svg = renderer.render("T1 & <T2>", {0, 1}, {{"a<b", {0, 1}}});
    ASSERT_TRUE(svg.has_value());
    EXPECT_NE(svg->find(">T1 &amp; &lt;T2&gt;</text>"), std::string::npos);
    EXPECT_NE(svg->find(">a&lt;b</text>"), std::string::npos);
    EXPECT_EQ(svg->find("<T2>"), std::string::npos);
}

TEST(SvgPlotRendererTest, InvalidInputIsRejected) {
    SvgPlotRenderer renderer;

    auto noX = renderer.render("t", {}, {{"a", {}}});
    ASSERT_FALSE(noX.has_value());
    EXPECT_EQ(noX.error().code, PlotError::Code::InvalidData);

    auto noSeries = renderer.render("t", {0, 1}, {});
    ASSERT_FALSE(noSeries.has_value());
    EXPECT_EQ(noSeries.error().code, PlotError::Code::InvalidData);

    auto mismatch = renderer.render("t", {0, 1, 2}, {{"a", {1, 2}}});
    ASSERT_FALSE(mismatch.has_value());
    EXPECT_EQ(mismatch.error().code, PlotError::Code::InvalidData);
}

// ============================================================================
// Writing
// ============================================================================

TEST(SvgPlotRendererTest, WriteUniqueCreatesDirectoryAndFile) {
    test_utils::TempDirectory scratch("acr_qa_svg_plot_renderer_test");
    auto dir = scratch.path() / "plots" / "nested";

    SvgPlotRenderer renderer;
    auto name = renderer.writeUnique(dir, "ramp", "Ramp", {0, 1}, {{"a", {0, 1}}});
    ASSERT_TRUE(name.has_value()) << name.error().toString();
    EXPECT_TRUE(std::regex_match(*name, std::regex("ramp_[0-9a-f]{32}\\.svg")));

    auto written = test_utils::readText(dir / *name);
    auto rendered = renderer.render("Ramp", {0, 1}, {{"a", {0, 1}}});
    ASSERT_TRUE(rendered.has_value());
    EXPECT_EQ(written, *rendered);

    auto second = renderer.writeUnique(dir, "ramp", "Ramp", {0, 1}, {{"a", {0, 1}}});
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(*name, *second);
}

TEST(SvgPlotRendererTest, WriteUniqueIntoFileFails) {
    test_utils::TempDirectory scratch("acr_qa_svg_plot_renderer_file_test");
    auto blocker = scratch.path() / "blocker";
    test_utils::writeText(blocker, "not a directory");

    SvgPlotRenderer renderer;
    auto name = renderer.writeUnique(blocker / "plots", "slice", "S", {0, 1}, {{"a", {0, 1}}});
    ASSERT_FALSE(name.has_value());
    EXPECT_EQ(name.error().code, PlotError::Code::DirectoryCreationFailed);
}

TEST(SvgPlotRendererTest, WriteUniqueRejectsInvalidDataBeforeTouchingDisk) {
    test_utils::TempDirectory scratch("acr_qa_svg_plot_renderer_invalid_test");
    auto dir = scratch.path() / "never";

    SvgPlotRenderer renderer;
    auto name = renderer.writeUnique(dir, "x", "t", {}, {});
    ASSERT_FALSE(name.has_value());
    EXPECT_EQ(name.error().code, PlotError::Code::InvalidData);
    EXPECT_FALSE(std::filesystem::exists(dir));
}

} // namespace acr_qa::services::test
