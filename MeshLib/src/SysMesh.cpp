//
//  SysMesh.cpp
//  Mesh
//

#include "SysMesh.hpp"

#include <algorithm>
#include <cstring>

#include "SysHistoryActions.hpp"
#include "SysMeshData.hpp"

SysMesh::SysMesh() : data{std::make_shared<SysMeshData>()}
{
    data->history_busy = false;
    data->history      = std::make_unique<History>(this, &data->history_busy);
}

SysMesh::SysMesh(SysMesh&& other) noexcept
    : data{std::move(other.data)}
{
    // Actions replay against the mesh they receive as context, so the
    // history has to follow the data to its new owner.
    if (data)
        data->history = std::make_unique<History>(this, &data->history_busy);
}

SysMesh& SysMesh::operator=(SysMesh&& other) noexcept
{
    if (this != &other)
    {
        data = std::move(other.data);
        if (data)
            data->history = std::make_unique<History>(this, &data->history_busy);
    }
    return *this;
}

SysMesh::~SysMesh() = default;

void SysMesh::clear()
{
    // Geometry and topology
    data->verts.clear();
    data->polys.clear();

    // Maps
    data->mesh_maps.clear();

    // Selections
    data->poly_selection.clear();

    // Recorded actions refer to indices that no longer exist.
    if (data->history)
        data->history->clear();

    // Invalidate counters
    data->topology_counter->change();
    data->deform_counter->change();
    data->select_counter->change();
}

History* SysMesh::history() const noexcept
{
    return data->history.get();
}

std::unique_ptr<History> SysMesh::release_history()
{
    // Move out the current history (transaction so far)
    std::unique_ptr<History> h = std::move(data->history);

    // Replace with a fresh one wired to the same busy guard
    data->history = std::make_unique<History>(this, &data->history_busy);

    return h;
}

/// -------------------------------------------------------
/// Vertices
/// -------------------------------------------------------

const std::vector<int32_t>& SysMesh::all_verts() const noexcept
{
    return data->verts.valid_indices();
}

uint32_t SysMesh::num_verts() const noexcept
{
    return static_cast<uint32_t>(data->verts.size());
}

int32_t SysMesh::create_vert(const glm::vec3& pos) noexcept
{
    SysVert new_vert{};
    new_vert.pos             = pos;
    const int32_t vert_index = data->verts.insert(new_vert);

    // Add undo entry.
    if (!data->history->is_busy())
    {
        auto* undo       = data->history->emplace<UndoCreateVertex>();
        undo->vert_index = vert_index;
        undo->vert_pos   = pos;
    }

    data->topology_counter->change();
    return vert_index;
}

void SysMesh::remove_vert(int32_t vert_index) noexcept
{
    assert(vert_valid(vert_index) && "Invalid vertex index!");
    assert(data->verts[vert_index].polys.empty() && "Vertex is still used by polygons!");

    if (!data->history->is_busy())
    {
        auto* undo       = data->history->emplace<UndoRemoveVertex>();
        undo->vert_index = vert_index;
        undo->vert_pos   = data->verts[vert_index].pos;
    }

    data->verts[vert_index].removed = true;
    data->verts.remove(vert_index);
    data->topology_counter->change();
}

const glm::vec3& SysMesh::vert_position(int32_t vert_index) const noexcept
{
    return data->verts[vert_index].pos;
}

const SysVertPolys& SysMesh::vert_polys(int32_t vert_index) const noexcept
{
    return data->verts[vert_index].polys;
}

bool SysMesh::vert_valid(int32_t vert_index) const noexcept
{
    return vert_index >= 0 && vert_index < data->verts.capacity() && !data->verts[vert_index].removed;
}

/// -------------------------------------------------------
/// Polys
/// -------------------------------------------------------

const std::vector<int32_t>& SysMesh::all_polys() const noexcept
{
    return data->polys.valid_indices();
}

uint32_t SysMesh::num_polys() const noexcept
{
    return static_cast<uint32_t>(data->polys.size());
}

uint32_t SysMesh::poly_buffer_size() const noexcept
{
    return static_cast<uint32_t>(data->polys.capacity());
}

int32_t SysMesh::create_poly(const SysPolyVerts& verts) noexcept
{
    assert(verts.size() >= 3 && "A polygon needs at least three corners!");

    SysPoly new_poly{};
    new_poly.verts           = verts;
    const int32_t poly_index = data->polys.insert(new_poly);

    // Keep every map's polygon table as large as the polygon buffer.
    if (poly_index == data->polys.capacity() - 1)
    {
        for (int32_t i = 0; i < data->mesh_maps.capacity(); ++i)
        {
            if (data->mesh_maps[i])
                data->mesh_maps[i]->polys.resize(data->polys.capacity());
        }
    }

    // Add undo entry.
    if (!data->history->is_busy())
    {
        auto* undo       = data->history->emplace<UndoCreatePoly>();
        undo->poly.index = poly_index;
        undo->poly.data  = new_poly;
    }

    // Add the new polygon to its vertices.
    for (int32_t vert_index : verts)
    {
        assert(vert_valid(vert_index) && "Polygon references an invalid vertex!");
        data->verts[vert_index].polys.insert_unique(poly_index);
    }

    data->topology_counter->change();
    return poly_index;
}

void SysMesh::remove_poly(int32_t poly_index) noexcept
{
    assert(poly_valid(poly_index) && "Polygon has already been removed!");

    // Deselect first so the history records the selection change.
    select_poly(poly_index, false);

    // Remove mapped polygons.
    for (int32_t map = 0; map < data->mesh_maps.capacity(); ++map)
    {
        if (data->mesh_maps[map] && map_poly_valid(map, poly_index))
            map_remove_poly(map, poly_index);
    }

    // Add undo entry.
    if (!data->history->is_busy())
    {
        auto* undo       = data->history->emplace<UndoRemovePoly>();
        undo->poly.index = poly_index;
        undo->poly.data  = data->polys[poly_index];
    }

    // Remove polygon from its vertices.
    for (int32_t vert_index : data->polys[poly_index].verts)
    {
        data->verts[vert_index].polys.erase_element(poly_index);
    }

    data->polys[poly_index].removed = true;
    data->polys.remove(poly_index);
    data->topology_counter->change();
}

const SysPolyVerts& SysMesh::poly_verts(int32_t poly_index) const noexcept
{
    assert(poly_valid(poly_index) && "nth polygon does not exist!");
    return data->polys[poly_index].verts;
}

bool SysMesh::poly_valid(int32_t poly_index) const noexcept
{
    return poly_index >= 0 && poly_index < data->polys.capacity() && !data->polys[poly_index].removed;
}

/// -------------------------------------------------------
/// Maps
/// -------------------------------------------------------

int32_t SysMesh::map_create(int32_t id, int32_t type, int32_t dim) noexcept
{
    assert(dim >= 1 && dim <= 4 && "Map vectors hold between 1 and 4 floats!");
    assert(map_find(id) == -1 && "A map with this ID already exists!");

    auto new_map  = std::make_shared<SysMeshMap>();
    new_map->id   = id;
    new_map->type = type;
    new_map->dim  = dim;

    // Make the number of polygons in the map match the mesh.
    new_map->polys.resize(data->polys.capacity(), SysMapPoly());

    const int32_t index = data->mesh_maps.insert(new_map);

    // Add undo entry.
    if (!data->history->is_busy())
    {
        auto* undo  = data->history->emplace<UndoMapCreate>();
        undo->index = index;
        undo->id    = id;
        undo->type  = type;
        undo->dim   = dim;
    }

    data->topology_counter->change();
    return index;
}

bool SysMesh::map_remove(int32_t id) noexcept
{
    const int32_t map = map_find(id);
    if (map == -1)
        return false;

    if (!data->history->is_busy())
    {
        // The undo entry takes over the map object so it can be put back as is.
        auto* undo      = data->history->emplace<UndoMapRemove>();
        undo->mesh_data = data.get();
        undo->mesh_map  = std::move(data->mesh_maps[map]);
        undo->index     = map;
    }
    else
    {
        data->mesh_maps[map].reset();
    }

    data->mesh_maps.remove(map);
    data->topology_counter->change();
    return true;
}

int32_t SysMesh::map_find(int32_t id) const noexcept
{
    for (int32_t i = 0; i < data->mesh_maps.capacity(); ++i)
    {
        if (data->mesh_maps[i] && data->mesh_maps[i]->id == id)
            return i;
    }
    return -1;
}

int32_t SysMesh::map_dim(int32_t map) const noexcept
{
    return data->mesh_maps[map]->dim;
}

int32_t SysMesh::map_type(int32_t map) const noexcept
{
    return data->mesh_maps[map]->type;
}

void SysMesh::map_create_poly(int32_t map, int32_t poly_index, const SysPolyVerts& pv) noexcept
{
    assert(poly_valid(poly_index) && "Mapping a polygon that does not exist!");
    assert(!map_poly_valid(map, poly_index) && "The polygon already exists!");
    assert(data->polys[poly_index].verts.size() == pv.size() &&
           "The number of vertices for the map polygon must match the mesh polygon!");

    data->mesh_maps[map]->polys[poly_index].verts = pv;

    // Add undo entry.
    if (!data->history->is_busy())
    {
        auto* undo       = data->history->emplace<UndoMapCreatePoly>();
        undo->poly.data  = data->mesh_maps[map]->polys[poly_index];
        undo->poly.index = poly_index;
        undo->poly.map   = map;
    }
    data->topology_counter->change();
}

int32_t SysMesh::map_create_vert(int32_t map, const float* vec) noexcept
{
    SysMeshMap& mesh_map = *data->mesh_maps[map];
    SysMapVert  new_vert{};

    std::memcpy(new_vert.vec, vec, mesh_map.dim * sizeof(float));

    // Reuse a freed slot if there is one, else append.
    int32_t index = static_cast<int32_t>(mesh_map.verts.size());
    if (mesh_map.free_verts.empty())
    {
        mesh_map.verts.push_back(new_vert);
    }
    else
    {
        index = mesh_map.free_verts.back();
        mesh_map.free_verts.pop_back();
        mesh_map.verts[index] = new_vert;
    }

    // Add undo entry.
    if (!data->history->is_busy())
    {
        auto* undo = data->history->emplace<UndoMapCreateVertex>();
        std::memcpy(undo->vert.data.vec, new_vert.vec, sizeof(new_vert.vec));
        undo->vert.index = index;
        undo->vert.map   = map;
    }

    data->topology_counter->change();
    return index;
}

void SysMesh::map_remove_vert(int32_t map, int32_t vert_index) noexcept
{
    SysMeshMap& mesh_map = *data->mesh_maps[map];
    assert(!mesh_map.verts[vert_index].removed && "Vertex does not exist!");

    // Add undo entry.
    if (!data->history->is_busy())
    {
        auto* undo = data->history->emplace<UndoMapRemoveVertex>();
        std::memcpy(undo->vert.data.vec, mesh_map.verts[vert_index].vec, sizeof(undo->vert.data.vec));
        undo->vert.index = vert_index;
        undo->vert.map   = map;
    }

    mesh_map.free_verts.push_back(vert_index);
    mesh_map.verts[vert_index].removed = true;

    data->topology_counter->change();
}

bool SysMesh::map_poly_valid(int32_t map, int32_t poly_index) const noexcept
{
    if (map < 0 || map >= data->mesh_maps.capacity())
        return false;

    const auto& mp = data->mesh_maps[map];
    if (!mp)
        return false;

    if (!poly_valid(poly_index))
        return false;

    if (poly_index >= static_cast<int32_t>(mp->polys.size()))
        return false;

    return !mp->polys[poly_index].verts.empty();
}

void SysMesh::map_remove_poly(int32_t map, int32_t poly_index) noexcept
{
    assert(map_poly_valid(map, poly_index) && "Trying to remove an invalid polygon!");

    // Add undo entry.
    if (!data->history->is_busy())
    {
        auto* undo       = data->history->emplace<UndoMapRemovePoly>();
        undo->poly.data  = data->mesh_maps[map]->polys[poly_index];
        undo->poly.index = poly_index;
        undo->poly.map   = map;
    }

    data->mesh_maps[map]->polys[poly_index].verts.clear();
    data->topology_counter->change();
}

void SysMesh::map_vertex_move(int32_t map, int32_t vert_index, const float* new_vec) noexcept
{
    SysMeshMap& mesh_map = *data->mesh_maps[map];
    assert(!mesh_map.verts[vert_index].removed && "Vertex does not exist!");

    if (!data->history->is_busy())
    {
        auto* undo = data->history->emplace<UndoMapMoveVertex>();
        std::memcpy(undo->vert.data.vec, mesh_map.verts[vert_index].vec, sizeof(undo->vert.data.vec));
        undo->vert.index = vert_index;
        undo->vert.map   = map;
    }

    std::memcpy(mesh_map.verts[vert_index].vec, new_vec, mesh_map.dim * sizeof(float));
    data->deform_counter->change();
}

const SysPolyVerts& SysMesh::map_poly_verts(int32_t map, int32_t poly_index) const noexcept
{
    assert(poly_valid(poly_index) && "nth polygon does not exist!");
    return data->mesh_maps[map]->polys[poly_index].verts;
}

const float* SysMesh::map_vert_position(int32_t map, int32_t vert_index) const noexcept
{
    return data->mesh_maps[map]->verts[vert_index].vec;
}

uint32_t SysMesh::map_buffer_size(int32_t map) const noexcept
{
    return static_cast<uint32_t>(data->mesh_maps[map]->verts.size());
}

/// -------------------------------------------------------
/// Selection
/// -------------------------------------------------------

bool SysMesh::select_poly(int32_t poly_index, bool select) noexcept
{
    assert(poly_valid(poly_index) && "Selecting a polygon that does not exist!");

    if (data->polys[poly_index].selected == select)
        return false;

    // Add undo entry.
    if (!data->history->is_busy())
    {
        auto* undo   = data->history->emplace<UndoSelectPoly>();
        undo->index  = poly_index;
        undo->select = select;
    }

    data->polys[poly_index].selected = select;

    if (select)
    {
        data->poly_selection.push_back(poly_index);
    }
    else
    {
        auto it = std::find(data->poly_selection.begin(), data->poly_selection.end(), poly_index);
        if (it != data->poly_selection.end())
            data->poly_selection.erase(it);
    }

    data->select_counter->change();
    return true;
}

const std::vector<int32_t>& SysMesh::selected_polys() const noexcept
{
    return data->poly_selection;
}

bool SysMesh::poly_selected(int32_t poly_index) const noexcept
{
    return data->polys[poly_index].selected;
}

void SysMesh::clear_selected_polys() noexcept
{
    if (data->poly_selection.empty())
        return;

    // Add undo entry.
    if (!data->history->is_busy())
    {
        auto* undo = data->history->emplace<UndoClearPolySel>();
        undo->sel  = data->poly_selection;
    }

    for (int32_t poly_index : data->poly_selection)
    {
        data->polys[poly_index].selected = false;
    }
    data->poly_selection.clear();
    data->select_counter->change();
}

// -------------------------------------------------------------------------------

const SysCounterPtr& SysMesh::change_counter() const noexcept
{
    return data->change_counter;
}

const SysCounterPtr& SysMesh::topology_counter() const noexcept
{
    return data->topology_counter;
}

const SysCounterPtr& SysMesh::deform_counter() const noexcept
{
    return data->deform_counter;
}

const SysCounterPtr& SysMesh::select_counter() const noexcept
{
    return data->select_counter;
}
