#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <glm/gtc/type_ptr.hpp>
#include <iterator>
#include <limits>
#include <stdexcept>

#include "CoreErrors.hpp"
#include "TestMeshes.hpp"
#include "VertexColorUtils.hpp"

using namespace testmesh;

namespace
{
    const std::vector<glm::vec4> kSampleColors = {
        kRed,
        kGreen,
        kBlue,
        kWhite,
        glm::vec4(0.25f, 0.5f, 0.75f, 1.0f),
        glm::vec4(0.1f, 0.2f, 0.3f, 0.0f),
        glm::vec4(0.0f),
    };

    bool isSubset(const std::vector<int32_t>& a, const std::vector<int32_t>& b)
    {
        return std::includes(b.begin(), b.end(), a.begin(), a.end());
    }

    std::vector<int32_t> setUnion(const std::vector<int32_t>& a, const std::vector<int32_t>& b)
    {
        std::vector<int32_t> out;
        std::set_union(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(out));
        return out;
    }
} // namespace

// ------------------------------------------------------------
// Distance
// ------------------------------------------------------------

TEST(ColorDistance, SymmetricAndZeroOnSelf)
{
    for (ColorMetric metric : {ColorMetric::CHEBYSHEV_RGBA, ColorMetric::EUCLIDEAN_RGB})
    {
        for (const glm::vec4& a : kSampleColors)
        {
            EXPECT_EQ(vcol::color_distance(a, a, metric), 0.0f);

            for (const glm::vec4& b : kSampleColors)
                EXPECT_EQ(vcol::color_distance(a, b, metric), vcol::color_distance(b, a, metric));
        }
    }
}

TEST(ColorDistance, ChebyshevIsLargestChannelDifference)
{
    EXPECT_FLOAT_EQ(vcol::color_distance(kRed, kBlue), 1.0f);
    EXPECT_FLOAT_EQ(vcol::color_distance(glm::vec4(0.2f, 0.4f, 0.4f, 1.0f), glm::vec4(0.3f, 0.1f, 0.4f, 1.0f)), 0.3f);

    // Alpha counts.
    EXPECT_FLOAT_EQ(vcol::color_distance(glm::vec4(0.5f, 0.5f, 0.5f, 1.0f), glm::vec4(0.5f, 0.5f, 0.5f, 0.25f)), 0.75f);
}

TEST(ColorDistance, EuclideanIgnoresAlpha)
{
    const ColorMetric m = ColorMetric::EUCLIDEAN_RGB;

    EXPECT_FLOAT_EQ(vcol::color_distance(kRed, kBlue, m), std::sqrt(2.0f));
    EXPECT_FLOAT_EQ(vcol::color_distance(glm::vec4(0.0f, 0.0f, 0.0f, 1.0f), kWhite, m), std::sqrt(3.0f));
    EXPECT_EQ(vcol::color_distance(glm::vec4(0.5f, 0.5f, 0.5f, 1.0f), glm::vec4(0.5f, 0.5f, 0.5f, 0.0f), m), 0.0f);
}

// ------------------------------------------------------------
// Color map lookup
// ------------------------------------------------------------

TEST(ColorMap, MissingMapThrows)
{
    SysMesh mesh;
    addTriangle(mesh);

    EXPECT_FALSE(vcol::has_color_map(&mesh, kColorMapId));

    try
    {
        (void)vcol::find_color_map(&mesh, kColorMapId);
        FAIL() << "expected MissingColorData";
    }
    catch (const MissingColorData& e)
    {
        EXPECT_EQ(e.mapId(), kColorMapId);
    }
}

TEST(ColorMap, GenericMapIsNotAColorMap)
{
    SysMesh mesh;
    addTriangle(mesh);
    mesh.map_create(kColorMapId, SysMapType::GENERIC, 4);

    EXPECT_FALSE(vcol::has_color_map(&mesh, kColorMapId));
    EXPECT_THROW((void)vcol::find_color_map(&mesh, kColorMapId), MissingColorData);
}

TEST(ColorMap, TwoChannelMapIsNotAColorMap)
{
    SysMesh mesh;
    mesh.map_create(kColorMapId, SysMapType::COLOR, 2);

    EXPECT_FALSE(vcol::has_color_map(&mesh, kColorMapId));
}

TEST(ColorMap, RgbMapReadsOpaque)
{
    SysMesh mesh;
    const int32_t p   = addColoredTriangle(mesh, {kRed, kGreen, kBlue}, 3);
    const int32_t map = vcol::find_color_map(&mesh, kColorMapId);

    EXPECT_EQ(vcol::corner_color(&mesh, map, p, 1), kGreen);
    EXPECT_EQ(vcol::corner_color(&mesh, map, p, 2).a, 1.0f);
}

// ------------------------------------------------------------
// Sampler
// ------------------------------------------------------------

TEST(Sampler, ZeroSelectedThrows)
{
    SysMesh mesh;
    buildRedBlueMesh(mesh);

    try
    {
        (void)vcol::sample_selected_color(&mesh, kColorMapId);
        FAIL() << "expected InvalidSelectionCount";
    }
    catch (const InvalidSelectionCount& e)
    {
        EXPECT_EQ(e.required(), 1u);
        EXPECT_EQ(e.observed(), 0u);
        EXPECT_STREQ(e.what(), "Expected exactly 1 selected face, found 0.");
    }
}

TEST(Sampler, TwoSelectedThrows)
{
    SysMesh mesh;
    const auto f = buildRedBlueMesh(mesh);
    mesh.select_poly(f[0], true);
    mesh.select_poly(f[2], true);

    try
    {
        (void)vcol::sample_selected_color(&mesh, kColorMapId);
        FAIL() << "expected InvalidSelectionCount";
    }
    catch (const InvalidSelectionCount& e)
    {
        EXPECT_EQ(e.observed(), 2u);
    }

    // Sampling never touches the mesh.
    EXPECT_EQ(mesh.selected_polys(), (std::vector<int32_t>{f[0], f[2]}));
}

TEST(Sampler, FirstCornerOfSelectedFace)
{
    SysMesh mesh;
    addColoredTriangle(mesh, {kRed, kRed, kRed});
    const int32_t p = addColoredTriangle(mesh, {kBlue, kRed, kGreen});
    mesh.select_poly(p, true);
    mesh.history()->clear();

    EXPECT_EQ(vcol::sample_selected_color(&mesh, kColorMapId), kBlue);
    EXPECT_FALSE(mesh.history()->can_undo());
}

TEST(Sampler, AverageOfCorners)
{
    SysMesh mesh;
    const int32_t p = addColoredTriangle(mesh, {kRed, kGreen, glm::vec4(0.0f, 0.0f, 1.0f, 0.4f)});

    const glm::vec4 avg = vcol::sample_poly_color(&mesh, kColorMapId, p, ColorReduction::AVERAGE);
    EXPECT_FLOAT_EQ(avg.r, 1.0f / 3.0f);
    EXPECT_FLOAT_EQ(avg.g, 1.0f / 3.0f);
    EXPECT_FLOAT_EQ(avg.b, 1.0f / 3.0f);
    EXPECT_FLOAT_EQ(avg.a, 0.8f);
}

TEST(Sampler, UnmappedFaceThrows)
{
    SysMesh mesh;
    addColoredTriangle(mesh, {kRed, kRed, kRed});
    const int32_t bare = addTriangle(mesh);
    mesh.select_poly(bare, true);

    EXPECT_THROW((void)vcol::sample_selected_color(&mesh, kColorMapId), MissingColorData);
}

TEST(Sampler, NoColorMapThrows)
{
    SysMesh mesh;
    const int32_t p = addTriangle(mesh);
    mesh.select_poly(p, true);

    EXPECT_THROW((void)vcol::sample_selected_color(&mesh, kColorMapId), MissingColorData);
}

TEST(Sampler, SelectionCountIsCheckedFirst)
{
    SysMesh mesh;
    addTriangle(mesh);

    EXPECT_THROW((void)vcol::sample_selected_color(&mesh, kColorMapId), InvalidSelectionCount);
}

// ------------------------------------------------------------
// Matcher
// ------------------------------------------------------------

TEST(Matcher, ExactMatchAllVertices)
{
    SysMesh    mesh;
    const auto f = buildRedBlueMesh(mesh);

    EXPECT_EQ(vcol::match_polys(&mesh, kColorMapId, kRed, 0.0f, MatchPolicy::ALL_VERTICES),
              (std::vector<int32_t>{f[0]}));
}

TEST(Matcher, ExactMatchAnyVertex)
{
    SysMesh    mesh;
    const auto f = buildRedBlueMesh(mesh);

    EXPECT_EQ(vcol::match_polys(&mesh, kColorMapId, kRed, 0.0f, MatchPolicy::ANY_VERTEX),
              (std::vector<int32_t>{f[0], f[1]}));
}

TEST(Matcher, WideThresholdMatchesAll)
{
    SysMesh    mesh;
    const auto f = buildRedBlueMesh(mesh);

    // Chebyshev distance between red and blue is 1.
    EXPECT_EQ(vcol::match_polys(&mesh, kColorMapId, kRed, 1.0f, MatchPolicy::ALL_VERTICES), f);
    EXPECT_EQ(vcol::match_polys(&mesh, kColorMapId, kRed, 0.99f, MatchPolicy::ALL_VERTICES),
              (std::vector<int32_t>{f[0]}));
}

TEST(Matcher, EuclideanMetricNeedsWiderThreshold)
{
    SysMesh    mesh;
    const auto f = buildRedBlueMesh(mesh);

    const auto m = ColorMetric::EUCLIDEAN_RGB;
    EXPECT_EQ(vcol::match_polys(&mesh, kColorMapId, kRed, 1.0f, MatchPolicy::ALL_VERTICES, m),
              (std::vector<int32_t>{f[0]}));
    EXPECT_EQ(vcol::match_polys(&mesh, kColorMapId, kRed, 1.42f, MatchPolicy::ALL_VERTICES, m), f);
}

TEST(Matcher, MonotonicInThreshold)
{
    SysMesh mesh;
    buildRedBlueMesh(mesh);
    addColoredTriangle(mesh, {glm::vec4(0.9f, 0.1f, 0.0f, 1.0f), kRed, glm::vec4(0.5f, 0.0f, 0.5f, 1.0f)});
    addColoredTriangle(mesh, {glm::vec4(0.7f, 0.2f, 0.1f, 1.0f), glm::vec4(0.8f, 0.0f, 0.0f, 0.9f), kRed});

    const float thresholds[] = {0.0f, 0.05f, 0.1f, 0.2f, 0.3f, 0.5f, 0.75f, 1.0f, 1.5f};

    for (MatchPolicy policy : {MatchPolicy::ALL_VERTICES, MatchPolicy::ANY_VERTEX})
    {
        std::vector<int32_t> prev;
        for (float t : thresholds)
        {
            const auto cur = vcol::match_polys(&mesh, kColorMapId, kRed, t, policy);
            EXPECT_TRUE(std::is_sorted(cur.begin(), cur.end()));
            EXPECT_TRUE(isSubset(prev, cur)) << "threshold " << t;
            prev = cur;
        }
    }
}

TEST(Matcher, AllVerticesIsSubsetOfAnyVertex)
{
    SysMesh mesh;
    buildRedBlueMesh(mesh);
    addColoredTriangle(mesh, {kGreen, kRed, kWhite});
    addColoredTriangle(mesh, {glm::vec4(0.95f, 0.05f, 0.0f, 1.0f), kRed, kRed});

    for (const glm::vec4& ref : kSampleColors)
    {
        for (float t : {0.0f, 0.1f, 0.5f, 1.0f})
        {
            const auto all = vcol::match_polys(&mesh, kColorMapId, ref, t, MatchPolicy::ALL_VERTICES);
            const auto any = vcol::match_polys(&mesh, kColorMapId, ref, t, MatchPolicy::ANY_VERTEX);
            EXPECT_TRUE(isSubset(all, any));
        }
    }
}

TEST(Matcher, EmptyResultIsNotAnError)
{
    SysMesh mesh;
    buildRedBlueMesh(mesh);

    EXPECT_TRUE(vcol::match_polys(&mesh, kColorMapId, kGreen, 0.5f, MatchPolicy::ANY_VERTEX).empty());
}

TEST(Matcher, MissingColorMapThrows)
{
    SysMesh mesh;
    addTriangle(mesh);

    EXPECT_THROW((void)vcol::match_polys(&mesh, kColorMapId, kRed, 0.1f, MatchPolicy::ALL_VERTICES), MissingColorData);
}

TEST(Matcher, InvalidThresholdThrows)
{
    SysMesh mesh;
    buildRedBlueMesh(mesh);

    EXPECT_THROW((void)vcol::match_polys(&mesh, kColorMapId, kRed, -0.01f, MatchPolicy::ALL_VERTICES),
                 std::invalid_argument);
    EXPECT_THROW((void)vcol::match_polys(&mesh, kColorMapId, kRed, std::numeric_limits<float>::quiet_NaN(),
                                         MatchPolicy::ANY_VERTEX),
                 std::invalid_argument);
}

TEST(Matcher, UnmappedAndRemovedFacesNeverMatch)
{
    SysMesh    mesh;
    const auto f    = buildRedBlueMesh(mesh);
    const int32_t bare = addTriangle(mesh);

    mesh.remove_poly(f[0]);

    const auto all = vcol::match_polys(&mesh, kColorMapId, kRed, 2.0f, MatchPolicy::ANY_VERTEX);
    EXPECT_EQ(all, (std::vector<int32_t>{f[1], f[2]}));
    EXPECT_EQ(std::count(all.begin(), all.end(), bare), 0);
}

TEST(Matcher, IsPureRead)
{
    SysMesh    mesh;
    const auto f = buildRedBlueMesh(mesh);
    mesh.select_poly(f[2], true);
    mesh.history()->clear();

    SysMonitor mon{mesh.change_counter()};
    (void)vcol::match_polys(&mesh, kColorMapId, kRed, 0.0f, MatchPolicy::ANY_VERTEX);

    EXPECT_FALSE(mon.changed());
    EXPECT_FALSE(mesh.history()->can_undo());
    EXPECT_EQ(mesh.selected_polys(), (std::vector<int32_t>{f[2]}));
}

// ------------------------------------------------------------
// Combiner
// ------------------------------------------------------------

TEST(Combiner, ReplaceOverwritesSelection)
{
    SysMesh    mesh;
    const auto f = buildRedBlueMesh(mesh);
    mesh.select_poly(f[2], true);

    const uint32_t changed = vcol::apply_selection(&mesh, {f[0], f[1]}, SelectPolicy::REPLACE);

    EXPECT_EQ(changed, 3u);
    EXPECT_EQ(selectedSet(mesh), (std::vector<int32_t>{f[0], f[1]}));
}

TEST(Combiner, ReplaceIsIdempotent)
{
    SysMesh    mesh;
    const auto f = buildRedBlueMesh(mesh);
    mesh.select_poly(f[1], true);

    const std::vector<int32_t> matches = {f[0], f[2]};
    vcol::apply_selection(&mesh, matches, SelectPolicy::REPLACE);
    const auto once = selectedSet(mesh);

    EXPECT_EQ(vcol::apply_selection(&mesh, matches, SelectPolicy::REPLACE), 0u);
    EXPECT_EQ(selectedSet(mesh), once);
}

TEST(Combiner, ReplaceWithEmptyClears)
{
    SysMesh    mesh;
    const auto f = buildRedBlueMesh(mesh);
    mesh.select_poly(f[0], true);
    mesh.select_poly(f[1], true);

    EXPECT_EQ(vcol::apply_selection(&mesh, {}, SelectPolicy::REPLACE), 2u);
    EXPECT_TRUE(mesh.selected_polys().empty());
}

TEST(Combiner, AddKeepsPreviousSelection)
{
    SysMesh    mesh;
    const auto f = buildRedBlueMesh(mesh);
    mesh.select_poly(f[2], true);

    EXPECT_EQ(vcol::apply_selection(&mesh, {f[0]}, SelectPolicy::ADD), 1u);
    EXPECT_EQ(selectedSet(mesh), (std::vector<int32_t>{f[0], f[2]}));
}

TEST(Combiner, AddIsMonotoneUnion)
{
    SysMesh mesh;
    for (int i = 0; i < 6; ++i)
        addColoredTriangle(mesh, {kRed, kRed, kRed});

    mesh.select_poly(5, true);
    const std::vector<int32_t> before = selectedSet(mesh);

    const std::vector<int32_t> m1 = {0, 2};
    const std::vector<int32_t> m2 = {2, 3};
    vcol::apply_selection(&mesh, m1, SelectPolicy::ADD);
    vcol::apply_selection(&mesh, m2, SelectPolicy::ADD);

    EXPECT_EQ(selectedSet(mesh), setUnion(setUnion(m1, m2), before));
}

TEST(Combiner, ErrorsPropagateToCaller)
{
    static_assert(!noexcept(vcol::apply_selection(nullptr, std::vector<int32_t>{}, SelectPolicy::REPLACE)));

    EXPECT_EQ(vcol::apply_selection(nullptr, {0, 1}, SelectPolicy::ADD), 0u);
}

TEST(Combiner, IgnoresInvalidIndices)
{
    SysMesh    mesh;
    const auto f = buildRedBlueMesh(mesh);
    mesh.remove_poly(f[1]);

    EXPECT_EQ(vcol::apply_selection(&mesh, {f[0], f[1], 42, -1}, SelectPolicy::REPLACE), 1u);
    EXPECT_EQ(selectedSet(mesh), (std::vector<int32_t>{f[0]}));
}

TEST(Combiner, RecordedInHistory)
{
    SysMesh    mesh;
    const auto f = buildRedBlueMesh(mesh);
    mesh.select_poly(f[2], true);
    mesh.history()->clear();

    vcol::apply_selection(&mesh, {f[0]}, SelectPolicy::REPLACE);
    ASSERT_TRUE(mesh.history()->can_undo());

    mesh.history()->undo();
    EXPECT_EQ(selectedSet(mesh), (std::vector<int32_t>{f[2]}));
}

TEST(Combiner, SelectCounterOnlyOnFlip)
{
    SysMesh    mesh;
    const auto f = buildRedBlueMesh(mesh);
    mesh.select_poly(f[0], true);

    SysMonitor mon{mesh.select_counter()};
    vcol::apply_selection(&mesh, {f[0]}, SelectPolicy::ADD);
    EXPECT_FALSE(mon.changed());

    vcol::apply_selection(&mesh, {f[1]}, SelectPolicy::ADD);
    EXPECT_TRUE(mon.changed());
}

// ------------------------------------------------------------
// Whole pipeline
// ------------------------------------------------------------

TEST(SampleMatchApply, SampleThenSelectSimilar)
{
    SysMesh    mesh;
    const auto f = buildRedBlueMesh(mesh);
    mesh.select_poly(f[0], true);

    const glm::vec4 ref     = vcol::sample_selected_color(&mesh, kColorMapId);
    const auto      matches = vcol::match_polys(&mesh, kColorMapId, ref, 0.0f, MatchPolicy::ANY_VERTEX);
    vcol::apply_selection(&mesh, matches, SelectPolicy::REPLACE);

    EXPECT_EQ(ref, kRed);
    EXPECT_EQ(selectedSet(mesh), (std::vector<int32_t>{f[0], f[1]}));
}
