#ifndef SYS_HISTORY_ACTIONS_HPP_INCLUDED
#define SYS_HISTORY_ACTIONS_HPP_INCLUDED

#include <cstring>

#include "SysMesh.hpp"
#include "SysMeshData.hpp"

// Every action receives the owning SysMesh as its context pointer. Replays go
// through the public SysMesh API while the history is busy, so they are not
// recorded again.

struct UndoCreateVertex : public HistoryAction
{
    void undo(void* data) override
    {
        SysMesh* mesh = static_cast<SysMesh*>(data);
        mesh->remove_vert(vert_index);
    }

    void redo(void* data) override
    {
        SysMesh* mesh = static_cast<SysMesh*>(data);
        [[maybe_unused]] int32_t new_index = mesh->create_vert(vert_pos);
        assert(new_index == vert_index);
    }

    glm::vec3 vert_pos{0.0f};
    int32_t   vert_index{-1};
};

// -------------------------------------------------------------------------------

struct UndoRemoveVertex : public HistoryAction
{
    void undo(void* data) override
    {
        SysMesh* mesh = static_cast<SysMesh*>(data);
        [[maybe_unused]] int32_t new_index = mesh->create_vert(vert_pos);
        assert(new_index == vert_index && "UndoRemoveVertex::undo: vertex index drifted");
    }

    void redo(void* data) override
    {
        SysMesh* mesh = static_cast<SysMesh*>(data);
        mesh->remove_vert(vert_index);
    }

    glm::vec3 vert_pos{0.0f};
    int32_t   vert_index{-1};
};

// -------------------------------------------------------------------------------

struct UndoCreatePoly : public HistoryAction
{
    void undo(void* data) override
    {
        SysMesh* mesh = static_cast<SysMesh*>(data);
        mesh->remove_poly(poly.index);
    }

    void redo(void* data) override
    {
        SysMesh*                 mesh      = static_cast<SysMesh*>(data);
        [[maybe_unused]] int32_t new_index = mesh->create_poly(poly.data.verts);
        assert(new_index == poly.index);
    }

    SysFullPoly poly;
};

// -------------------------------------------------------------------------------

struct UndoRemovePoly : public HistoryAction
{
    void undo(void* data) override
    {
        SysMesh*                 mesh      = static_cast<SysMesh*>(data);
        [[maybe_unused]] int32_t new_index = mesh->create_poly(poly.data.verts);
        assert(new_index == poly.index);
    }

    void redo(void* data) override
    {
        SysMesh* mesh = static_cast<SysMesh*>(data);
        mesh->remove_poly(poly.index);
    }

    SysFullPoly poly;
};

// -------------------------------------------------------------------------------

struct UndoMapMoveVertex : public HistoryAction
{
    // Swaps the stored value with the current one, so undo and redo are the same.
    void undo(void* data) override
    {
        SysMesh*     mesh = static_cast<SysMesh*>(data);
        const size_t size = static_cast<size_t>(mesh->map_dim(vert.map)) * sizeof(float);

        float current[4];
        std::memcpy(current, mesh->map_vert_position(vert.map, vert.index), size);
        mesh->map_vertex_move(vert.map, vert.index, vert.data.vec);
        std::memcpy(vert.data.vec, current, size);
    }

    void redo(void* data) override
    {
        undo(data);
    }

    SysFullMapVert vert;
};

// -------------------------------------------------------------------------------

struct UndoMapCreatePoly : public HistoryAction
{
    void undo(void* data) override
    {
        SysMesh* mesh = static_cast<SysMesh*>(data);
        mesh->map_remove_poly(poly.map, poly.index);
    }

    void redo(void* data) override
    {
        SysMesh* mesh = static_cast<SysMesh*>(data);
        mesh->map_create_poly(poly.map, poly.index, poly.data.verts);
    }

    SysFullMapPoly poly;
};

// -------------------------------------------------------------------------------

struct UndoMapRemovePoly : public HistoryAction
{
    void undo(void* data) override
    {
        SysMesh* mesh = static_cast<SysMesh*>(data);
        mesh->map_create_poly(poly.map, poly.index, poly.data.verts);
    }

    void redo(void* data) override
    {
        SysMesh* mesh = static_cast<SysMesh*>(data);
        assert(mesh->map_poly_valid(poly.map, poly.index) && "Map poly no longer valid in UndoMapRemovePoly::redo");
        mesh->map_remove_poly(poly.map, poly.index);
    }

    SysFullMapPoly poly;
};

// -------------------------------------------------------------------------------

struct UndoMapCreateVertex : public HistoryAction
{
    void undo(void* data) override
    {
        SysMesh* mesh = static_cast<SysMesh*>(data);
        mesh->map_remove_vert(vert.map, vert.index);
    }

    void redo(void* data) override
    {
        SysMesh*                 mesh      = static_cast<SysMesh*>(data);
        [[maybe_unused]] int32_t new_index = mesh->map_create_vert(vert.map, vert.data.vec);
        assert(new_index == vert.index);
    }

    SysFullMapVert vert;
};

// -------------------------------------------------------------------------------

struct UndoMapRemoveVertex : public HistoryAction
{
    void undo(void* data) override
    {
        SysMesh*                 mesh      = static_cast<SysMesh*>(data);
        [[maybe_unused]] int32_t new_index = mesh->map_create_vert(vert.map, vert.data.vec);
        assert(new_index == vert.index);
    }

    void redo(void* data) override
    {
        SysMesh* mesh = static_cast<SysMesh*>(data);
        mesh->map_remove_vert(vert.map, vert.index);
    }

    SysFullMapVert vert;
};

// -------------------------------------------------------------------------------

struct UndoMapCreate : public HistoryAction
{
    void undo(void* data) override
    {
        SysMesh* mesh = static_cast<SysMesh*>(data);
        mesh->map_remove(id);
    }

    void redo(void* data) override
    {
        SysMesh*                 mesh      = static_cast<SysMesh*>(data);
        [[maybe_unused]] int32_t new_index = mesh->map_create(id, type, dim);
        assert(index == new_index);
    }

    int32_t index{-1};
    int32_t id{-1};
    int32_t type{-1};
    int32_t dim{0};
};

// -------------------------------------------------------------------------------

struct UndoMapRemove : public HistoryAction
{
    // Keeps the removed map object alive so undo can put back the same data.
    void undo(void* /*data*/) override
    {
        [[maybe_unused]] int32_t new_index = mesh_data->mesh_maps.insert(mesh_map);
        assert(new_index == index);
        mesh_map.reset();
    }

    void redo(void* /*data*/) override
    {
        assert(mesh_data->mesh_maps[index] && !mesh_map);
        std::swap(mesh_map, mesh_data->mesh_maps[index]);
        mesh_data->mesh_maps.remove(index);
    }

    SysMeshData*                mesh_data{nullptr};
    std::shared_ptr<SysMeshMap> mesh_map;
    int32_t                     index{-1};
};

// -------------------------------------------------------------------------------

struct UndoSelectPoly : public HistoryAction
{
    void undo(void* data) override
    {
        SysMesh* mesh = static_cast<SysMesh*>(data);
        mesh->select_poly(index, !select);
    }

    void redo(void* data) override
    {
        SysMesh* mesh = static_cast<SysMesh*>(data);
        mesh->select_poly(index, select);
    }

    int32_t index{-1};
    bool    select{false};
};

// -------------------------------------------------------------------------------

struct UndoClearPolySel : public HistoryAction
{
    void undo(void* data) override
    {
        SysMesh* mesh = static_cast<SysMesh*>(data);
        for (int32_t index : sel)
            mesh->select_poly(index, true);
    }

    void redo(void* data) override
    {
        SysMesh* mesh = static_cast<SysMesh*>(data);
        mesh->clear_selected_polys();
    }

    std::vector<int32_t> sel;
};

#endif // SYS_HISTORY_ACTIONS_HPP_INCLUDED
