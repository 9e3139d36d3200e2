//
//  SysMesh.hpp
//  Mesh
//
//  Polygon mesh document model: vertices, polygons, per-corner maps,
//  polygon selection, undo history and change counters.
//

#ifndef SYS_MESH_HPP_INCLUDED
#define SYS_MESH_HPP_INCLUDED

#include <glm/vec3.hpp>
#include <memory>
#include <vector>

#include "History.hpp"
#include "SmallList.hpp"
#include "SysCounter.hpp"

using SysVertPolys = SmallList<int32_t, 6>;
using SysPolyVerts = SmallList<int32_t, 4>;

/**
 * @brief Type tags stored on mesh maps (SysMesh::map_create()).
 *
 * By convention map id 0 holds normals and id 1 holds texture coordinates;
 * both are GENERIC maps. A COLOR map stores one RGB (dim 3) or RGBA (dim 4)
 * float color per polygon corner.
 */
struct SysMapType
{
    static constexpr int32_t GENERIC = 0;
    static constexpr int32_t COLOR   = 1;
};

class SysMesh
{
public:
    explicit SysMesh();
    SysMesh(const SysMesh&)            = delete;
    SysMesh& operator=(const SysMesh&) = delete;

    SysMesh(SysMesh&& other) noexcept;
    SysMesh& operator=(SysMesh&& other) noexcept;

    ~SysMesh();

    /// Empties the mesh, removing all geometry, maps and selection.
    /// The local history is discarded as well.
    void clear();

    History* history() const noexcept;

    /// Releases the current mesh history so that it can be inserted into a global
    /// history. This will clear out the mesh's local history so that it can begin
    /// recording new changes.
    std::unique_ptr<History> release_history();

    /// Vertices ------------------------------------------

    /// @return A list of all valid vertex indices in the mesh.
    [[nodiscard]] const std::vector<int32_t>& all_verts() const noexcept;

    /// @return The number of valid vertices in the mesh.
    [[nodiscard]] uint32_t num_verts() const noexcept;

    /// @return An index to a newly created vertex with the specified position.
    int32_t create_vert(const glm::vec3& pos) noexcept;

    /// Removes the specified vertex. The vertex must not be used by any polygon.
    void remove_vert(int32_t vert_index) noexcept;

    /// @return The position of the specified vertex.
    [[nodiscard]] const glm::vec3& vert_position(int32_t vert_index) const noexcept;

    /// @return The polygons connected to the specified vertex.
    [[nodiscard]] const SysVertPolys& vert_polys(int32_t vert_index) const noexcept;

    [[nodiscard]] bool vert_valid(int32_t vert_index) const noexcept;

    /// Polygons ------------------------------------------

    /// @return A list of all valid polygon indices in the mesh, ascending.
    [[nodiscard]] const std::vector<int32_t>& all_polys() const noexcept;

    /// @return The number of valid polygons in the mesh.
    [[nodiscard]] uint32_t num_polys() const noexcept;

    /// @return The size of the polygon buffer (the index range).
    [[nodiscard]] uint32_t poly_buffer_size() const noexcept;

    /// @return An index to a newly created polygon with the specified vertices
    /// (corners in winding order).
    int32_t create_poly(const SysPolyVerts& verts) noexcept;

    /// Removes the specified polygon together with its mapped polygons.
    void remove_poly(int32_t poly_index) noexcept;

    /// @return The vertices of the specified polygon.
    [[nodiscard]] const SysPolyVerts& poly_verts(int32_t poly_index) const noexcept;

    [[nodiscard]] bool poly_valid(int32_t poly_index) const noexcept;

    /// Maps ----------------------------------------------

    /// @return The index of a new map with the specified ID, type and dimensions (1..4).
    int32_t map_create(int32_t id, int32_t type, int32_t dim) noexcept;

    /// Removes the map with the specified ID.
    /// @return False if no such map exists.
    bool map_remove(int32_t id) noexcept;

    /// @return The index of a map with the specified ID, or -1 if no such map
    /// is found.
    [[nodiscard]] int32_t map_find(int32_t id) const noexcept;

    /// @return The dimensions of the vectors in the specified map.
    [[nodiscard]] int32_t map_dim(int32_t map) const noexcept;

    /// @return The type tag of the specified map (see SysMapType).
    [[nodiscard]] int32_t map_type(int32_t map) const noexcept;

    /// Creates (maps) the polygon corners onto the given map vertices, one per
    /// corner of the mesh polygon, in the same order.
    void map_create_poly(int32_t map, int32_t poly_index, const SysPolyVerts& pv) noexcept;

    /// Creates a vertex entry in the map, copying map_dim(map) floats from vec.
    int32_t map_create_vert(int32_t map, const float* vec) noexcept;

    /// Removes a vertex entry in the map.
    void map_remove_vert(int32_t map, int32_t vert_index) noexcept;

    /// @return True if the map has the specified polygon mapped.
    [[nodiscard]] bool map_poly_valid(int32_t map, int32_t poly_index) const noexcept;

    /// Removes the specified polygon from the map.
    void map_remove_poly(int32_t map, int32_t poly_index) noexcept;

    /// Overwrites the value of a map vertex (e.g. repaints a corner color).
    void map_vertex_move(int32_t map, int32_t vert_index, const float* new_vec) noexcept;

    /// @return The map vertices of the specified mapped polygon.
    [[nodiscard]] const SysPolyVerts& map_poly_verts(int32_t map, int32_t poly_index) const noexcept;

    /// @return The value of the specified map vertex (map_dim(map) floats).
    [[nodiscard]] const float* map_vert_position(int32_t map, int32_t vert_index) const noexcept;

    /// @return The size of the specified map vertex buffer (the index range).
    [[nodiscard]] uint32_t map_buffer_size(int32_t map) const noexcept;

    /// Selection -----------------------------------------

    /// Selects/deselects the specified polygon.
    /// @return True if the selection flag changed.
    bool select_poly(int32_t poly_index, bool select) noexcept;

    /// @return True if polygon is selected.
    [[nodiscard]] bool poly_selected(int32_t poly_index) const noexcept;

    /// @return A list of all the selected polygon indices, in selection order.
    [[nodiscard]] const std::vector<int32_t>& selected_polys() const noexcept;

    /// Clear all selected polygons.
    void clear_selected_polys() noexcept;

    /// Change Counters -----------------------------------

    /// Modified whenever the mesh has been modified in any way.
    [[nodiscard]] const SysCounterPtr& change_counter() const noexcept;
    /// Modified whenever the mesh topology (or map layout) has been modified.
    [[nodiscard]] const SysCounterPtr& topology_counter() const noexcept;
    /// Modified whenever map values have been overwritten.
    [[nodiscard]] const SysCounterPtr& deform_counter() const noexcept;
    /// Modified whenever the polygon selection has been modified.
    [[nodiscard]] const SysCounterPtr& select_counter() const noexcept;

private:
    std::shared_ptr<struct SysMeshData> data;
};

#endif
