#ifndef SYS_MESH_DATA_HPP_INCLUDED
#define SYS_MESH_DATA_HPP_INCLUDED

#include <HoleList.hpp>
#include <SmallList.hpp>
#include <SysCounter.hpp>
#include <cstdint>
#include <glm/vec3.hpp>
#include <memory>
#include <vector>

#include "History.hpp"
#include "SysMesh.hpp"

struct SysVert
{
    SysVert() : removed(false)
    {
    }
    SysVertPolys polys;
    glm::vec3    pos{0.0f};
    bool         removed;
};

struct SysPoly
{
    SysPoly() : removed(false), selected(false)
    {
    }
    SysPolyVerts verts;
    bool         removed;
    bool         selected;
};

struct SysFullPoly
{
    SysPoly data;
    int32_t index{-1};
};

struct SysMapVert
{
    SysMapVert() : vec{0.0f, 0.0f, 0.0f, 0.0f}, removed(false)
    {
    }
    float vec[4];
    bool  removed;
};

struct SysMapPoly
{
    SysPolyVerts verts;
};

struct SysFullMapVert
{
    SysFullMapVert() : map(-1), index(-1)
    {
    }
    SysMapVert data;
    int32_t    map;
    int32_t    index;
};

struct SysFullMapPoly
{
    SysFullMapPoly() : map(-1), index(-1)
    {
    }
    SysMapPoly data;
    int32_t    map;
    int32_t    index;
};

struct SysMeshMap
{
    SysMeshMap() : id(-1), type(-1), dim(0)
    {
    }
    int32_t                 id;
    int32_t                 type;
    int32_t                 dim;
    std::vector<SysMapVert> verts;
    std::vector<int32_t>    free_verts;
    std::vector<SysMapPoly> polys;
};

struct SysMeshData
{
    SysMeshData() :
        history{nullptr},
        history_busy{false},
        change_counter{std::make_shared<SysCounter>()},
        topology_counter{std::make_shared<SysCounter>()},
        deform_counter{std::make_shared<SysCounter>()},
        select_counter{std::make_shared<SysCounter>()}
    {
        // Set the general change counter as the parent.
        topology_counter->addParent(change_counter);
        deform_counter->addParent(change_counter);
        select_counter->addParent(change_counter);
    }

    /// List of verts, polys and maps
    HoleList<SysVert>                     verts;
    HoleList<SysPoly>                     polys;
    HoleList<std::shared_ptr<SysMeshMap>> mesh_maps;

    /// Selected polygons in selection order
    std::vector<int32_t> poly_selection;

    /// History
    std::unique_ptr<History> history;
    bool                     history_busy;

    /// Change counters
    SysCounterPtr change_counter;
    SysCounterPtr topology_counter;
    SysCounterPtr deform_counter;
    SysCounterPtr select_counter;
};

#endif
