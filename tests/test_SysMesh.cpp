#include <gtest/gtest.h>

#include <glm/gtc/type_ptr.hpp>

#include "SysCounter.hpp"
#include "SysMesh.hpp"
#include "TestMeshes.hpp"

using namespace testmesh;

TEST(SysMesh, CreatesVertsAndPolys)
{
    SysMesh mesh;

    const int32_t p = addTriangle(mesh);

    EXPECT_EQ(mesh.num_verts(), 3u);
    EXPECT_EQ(mesh.num_polys(), 1u);
    EXPECT_TRUE(mesh.poly_valid(p));
    EXPECT_EQ(mesh.poly_verts(p).size(), 3);

    for (int32_t v : mesh.poly_verts(p))
    {
        ASSERT_EQ(mesh.vert_polys(v).size(), 1);
        EXPECT_EQ(mesh.vert_polys(v)[0], p);
    }
}

TEST(SysMesh, RemovedPolySlotIsReused)
{
    SysMesh mesh;

    const int32_t a = addTriangle(mesh);
    const int32_t b = addTriangle(mesh);
    const int32_t c = addTriangle(mesh);

    mesh.remove_poly(b);
    EXPECT_FALSE(mesh.poly_valid(b));
    EXPECT_EQ(mesh.num_polys(), 2u);
    EXPECT_EQ(mesh.all_polys(), (std::vector<int32_t>{a, c}));
    EXPECT_EQ(mesh.poly_buffer_size(), 3u);

    const int32_t d = addTriangle(mesh);
    EXPECT_EQ(d, b);
    EXPECT_EQ(mesh.all_polys(), (std::vector<int32_t>{a, b, c}));
}

TEST(SysMesh, ColorMapCornersFollowWinding)
{
    SysMesh mesh;

    const int32_t p   = addColoredTriangle(mesh, {kRed, kGreen, kBlue});
    const int32_t map = mesh.map_find(kColorMapId);

    ASSERT_NE(map, -1);
    EXPECT_EQ(mesh.map_type(map), SysMapType::COLOR);
    EXPECT_EQ(mesh.map_dim(map), 4);
    ASSERT_TRUE(mesh.map_poly_valid(map, p));

    const SysPolyVerts& mv = mesh.map_poly_verts(map, p);
    ASSERT_EQ(mv.size(), 3);
    EXPECT_EQ(glm::make_vec4(mesh.map_vert_position(map, mv[0])), kRed);
    EXPECT_EQ(glm::make_vec4(mesh.map_vert_position(map, mv[1])), kGreen);
    EXPECT_EQ(glm::make_vec4(mesh.map_vert_position(map, mv[2])), kBlue);
}

TEST(SysMesh, MapFindMissing)
{
    SysMesh mesh;
    addTriangle(mesh);

    EXPECT_EQ(mesh.map_find(kColorMapId), -1);
}

TEST(SysMesh, RemovedMapIsNotFound)
{
    SysMesh mesh;
    addColoredTriangle(mesh, {kRed, kRed, kRed});

    EXPECT_TRUE(mesh.map_remove(kColorMapId));
    EXPECT_EQ(mesh.map_find(kColorMapId), -1);
    EXPECT_FALSE(mesh.map_remove(kColorMapId));
}

TEST(SysMesh, UndoMapRemoveRestoresColors)
{
    SysMesh mesh;
    const int32_t p = addColoredTriangle(mesh, {kRed, kGreen, kBlue});
    mesh.history()->clear();

    ASSERT_TRUE(mesh.map_remove(kColorMapId));
    mesh.history()->undo();

    const int32_t map = mesh.map_find(kColorMapId);
    ASSERT_NE(map, -1);
    ASSERT_TRUE(mesh.map_poly_valid(map, p));
    EXPECT_EQ(glm::make_vec4(mesh.map_vert_position(map, mesh.map_poly_verts(map, p)[1])), kGreen);
}

TEST(SysMesh, RemovePolyRemovesMapPoly)
{
    SysMesh mesh;
    const int32_t p   = addColoredTriangle(mesh, {kRed, kRed, kRed});
    const int32_t map = mesh.map_find(kColorMapId);

    mesh.remove_poly(p);
    EXPECT_FALSE(mesh.map_poly_valid(map, p));

    // A plain triangle in the reused slot is not mapped.
    const int32_t q = addTriangle(mesh);
    EXPECT_EQ(q, p);
    EXPECT_FALSE(mesh.map_poly_valid(map, q));
}

TEST(SysMesh, SelectionKeepsOrderAndReportsChanges)
{
    SysMesh mesh;
    const int32_t a = addTriangle(mesh);
    const int32_t b = addTriangle(mesh);
    const int32_t c = addTriangle(mesh);

    EXPECT_TRUE(mesh.select_poly(c, true));
    EXPECT_TRUE(mesh.select_poly(a, true));
    EXPECT_FALSE(mesh.select_poly(a, true));

    EXPECT_EQ(mesh.selected_polys(), (std::vector<int32_t>{c, a}));
    EXPECT_TRUE(mesh.poly_selected(a));
    EXPECT_FALSE(mesh.poly_selected(b));

    EXPECT_TRUE(mesh.select_poly(c, false));
    EXPECT_FALSE(mesh.select_poly(b, false));
    EXPECT_EQ(mesh.selected_polys(), (std::vector<int32_t>{a}));

    mesh.clear_selected_polys();
    EXPECT_TRUE(mesh.selected_polys().empty());
    EXPECT_FALSE(mesh.poly_selected(a));
}

TEST(SysMesh, RemovingSelectedPolyDeselectsIt)
{
    SysMesh mesh;
    const int32_t a = addTriangle(mesh);
    mesh.select_poly(a, true);
    mesh.history()->clear();

    mesh.remove_poly(a);
    EXPECT_TRUE(mesh.selected_polys().empty());

    mesh.history()->undo();
    ASSERT_TRUE(mesh.poly_valid(a));
    EXPECT_TRUE(mesh.poly_selected(a));
}

TEST(SysMesh, SelectionUndoRedo)
{
    SysMesh mesh;
    const int32_t a = addTriangle(mesh);
    const int32_t b = addTriangle(mesh);
    mesh.history()->clear();

    mesh.select_poly(a, true);
    mesh.select_poly(b, true);
    mesh.clear_selected_polys();

    History* h = mesh.history();
    ASSERT_TRUE(h->undo_step());
    EXPECT_EQ(selectedSet(mesh), (std::vector<int32_t>{a, b}));

    h->undo();
    EXPECT_TRUE(mesh.selected_polys().empty());

    h->redo();
    EXPECT_TRUE(mesh.selected_polys().empty());
    ASSERT_TRUE(h->undo_step());
    EXPECT_EQ(selectedSet(mesh), (std::vector<int32_t>{a, b}));
}

TEST(SysMesh, ReplayIsNotRecorded)
{
    SysMesh mesh;
    const int32_t a = addTriangle(mesh);
    mesh.history()->clear();

    mesh.select_poly(a, true);
    ASSERT_EQ(mesh.history()->size(), 1u);

    mesh.history()->undo();
    mesh.history()->redo();
    EXPECT_EQ(mesh.history()->size(), 1u);
}

TEST(SysMesh, RecolorUndo)
{
    SysMesh mesh;
    const int32_t p   = addColoredTriangle(mesh, {kRed, kRed, kRed});
    const int32_t map = mesh.map_find(kColorMapId);
    const int32_t mv  = mesh.map_poly_verts(map, p)[0];
    mesh.history()->clear();

    mesh.map_vertex_move(map, mv, glm::value_ptr(kBlue));
    EXPECT_EQ(glm::make_vec4(mesh.map_vert_position(map, mv)), kBlue);

    mesh.history()->undo();
    EXPECT_EQ(glm::make_vec4(mesh.map_vert_position(map, mv)), kRed);

    mesh.history()->redo();
    EXPECT_EQ(glm::make_vec4(mesh.map_vert_position(map, mv)), kBlue);
}

TEST(SysMesh, ReleaseHistoryStartsFresh)
{
    SysMesh mesh;
    const int32_t a = addTriangle(mesh);

    std::unique_ptr<History> released = mesh.release_history();
    ASSERT_TRUE(released);
    EXPECT_TRUE(released->can_undo());
    EXPECT_FALSE(mesh.history()->can_undo());

    mesh.select_poly(a, true);
    EXPECT_EQ(mesh.history()->size(), 1u);
}

TEST(SysMesh, CountersTrackKindOfChange)
{
    SysMesh mesh;
    const int32_t p   = addColoredTriangle(mesh, {kRed, kRed, kRed});
    const int32_t map = mesh.map_find(kColorMapId);

    SysMonitor change{mesh.change_counter()};
    SysMonitor topo{mesh.topology_counter()};
    SysMonitor deform{mesh.deform_counter()};
    SysMonitor select{mesh.select_counter()};

    mesh.select_poly(p, true);
    EXPECT_TRUE(select.changed());
    EXPECT_TRUE(change.changed());
    EXPECT_FALSE(topo.changed());
    EXPECT_FALSE(deform.changed());

    // No flip, no change.
    mesh.select_poly(p, true);
    EXPECT_FALSE(select.changed());

    mesh.map_vertex_move(map, mesh.map_poly_verts(map, p)[0], glm::value_ptr(kGreen));
    EXPECT_TRUE(deform.changed());
    EXPECT_FALSE(select.changed());
    EXPECT_TRUE(change.changed());

    addTriangle(mesh);
    EXPECT_TRUE(topo.changed());
}

TEST(SysMesh, MonitorStartDirty)
{
    SysMesh    mesh;
    SysMonitor mon{mesh.change_counter(), true};

    EXPECT_TRUE(mon.changed());
    EXPECT_FALSE(mon.changed());
}

TEST(SysMesh, ClearEmptiesEverything)
{
    SysMesh mesh;
    buildRedBlueMesh(mesh);
    mesh.select_poly(0, true);

    mesh.clear();

    EXPECT_EQ(mesh.num_polys(), 0u);
    EXPECT_EQ(mesh.num_verts(), 0u);
    EXPECT_EQ(mesh.map_find(kColorMapId), -1);
    EXPECT_TRUE(mesh.selected_polys().empty());
    EXPECT_FALSE(mesh.history()->can_undo());
}

TEST(SysMesh, MoveKeepsHistoryWorking)
{
    SysMesh a;
    const int32_t p = addTriangle(a);
    a.history()->clear();

    SysMesh b = std::move(a);
    b.select_poly(p, true);
    b.history()->undo();

    EXPECT_FALSE(b.poly_selected(p));
}
