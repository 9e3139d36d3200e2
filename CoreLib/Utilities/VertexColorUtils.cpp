#include "VertexColorUtils.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <glm/common.hpp>
#include <glm/geometric.hpp>
#include <glm/vec3.hpp>
#include <stdexcept>
#include <string>

#include "CoreErrors.hpp"

namespace
{
    bool valid_color_map(const SysMesh* mesh, int32_t map) noexcept
    {
        if (map < 0 || mesh->map_type(map) != SysMapType::COLOR)
            return false;

        const int32_t dim = mesh->map_dim(map);
        return dim == 3 || dim == 4;
    }
} // namespace

namespace vcol
{
    float color_distance(const glm::vec4& a, const glm::vec4& b, ColorMetric metric) noexcept
    {
        switch (metric)
        {
            case ColorMetric::EUCLIDEAN_RGB:
                return glm::length(glm::vec3(a) - glm::vec3(b));

            case ColorMetric::CHEBYSHEV_RGBA:
                break;
        }

        const glm::vec4 d = glm::abs(a - b);
        return std::max(std::max(d.r, d.g), std::max(d.b, d.a));
    }

    bool has_color_map(const SysMesh* mesh, int32_t mapId) noexcept
    {
        return mesh && valid_color_map(mesh, mesh->map_find(mapId));
    }

    int32_t find_color_map(const SysMesh* mesh, int32_t mapId)
    {
        if (!mesh)
            throw std::invalid_argument("vcol::find_color_map(): mesh is null.");

        const int32_t map = mesh->map_find(mapId);
        if (!valid_color_map(mesh, map))
            throw MissingColorData(mapId);

        return map;
    }

    glm::vec4 corner_color(const SysMesh* mesh, int32_t map, int32_t poly, int32_t corner) noexcept
    {
        const SysPolyVerts& mv = mesh->map_poly_verts(map, poly);
        assert(corner >= 0 && corner < mv.size());

        const float* vec = mesh->map_vert_position(map, mv[corner]);
        if (mesh->map_dim(map) == 3)
            return glm::vec4(vec[0], vec[1], vec[2], 1.0f);

        return glm::vec4(vec[0], vec[1], vec[2], vec[3]);
    }

    // ------------------------------------------------------------
    // Sampler
    // ------------------------------------------------------------

    glm::vec4 sample_poly_color(const SysMesh* mesh, int32_t mapId, int32_t poly, ColorReduction reduction)
    {
        const int32_t map = find_color_map(mesh, mapId);

        if (!mesh->poly_valid(poly))
            throw std::invalid_argument("vcol::sample_poly_color(): polygon " + std::to_string(poly) +
                                        " does not exist.");

        if (!mesh->map_poly_valid(map, poly))
            throw MissingColorData(mapId, poly);

        const int32_t corners = mesh->map_poly_verts(map, poly).size();
        assert(corners > 0);

        switch (reduction)
        {
            case ColorReduction::AVERAGE: {
                glm::vec4 sum(0.0f);
                for (int32_t i = 0; i < corners; ++i)
                    sum += corner_color(mesh, map, poly, i);
                return sum / static_cast<float>(corners);
            }

            case ColorReduction::FIRST_CORNER:
                break;
        }

        return corner_color(mesh, map, poly, 0);
    }

    glm::vec4 sample_selected_color(const SysMesh* mesh, int32_t mapId, ColorReduction reduction)
    {
        if (!mesh)
            throw std::invalid_argument("vcol::sample_selected_color(): mesh is null.");

        const std::vector<int32_t>& sel = mesh->selected_polys();
        if (sel.size() != 1)
            throw InvalidSelectionCount(1, static_cast<uint32_t>(sel.size()));

        return sample_poly_color(mesh, mapId, sel.front(), reduction);
    }

    // ------------------------------------------------------------
    // Matcher
    // ------------------------------------------------------------

    bool poly_matches(const SysMesh*   mesh,
                      int32_t          map,
                      int32_t          poly,
                      const glm::vec4& reference,
                      float            threshold,
                      MatchPolicy      policy,
                      ColorMetric      metric) noexcept
    {
        if (!mesh->map_poly_valid(map, poly))
            return false;

        const int32_t corners = mesh->map_poly_verts(map, poly).size();
        assert(corners > 0 && "Mapped polygon without corners");

        int32_t matched = 0;
        for (int32_t i = 0; i < corners; ++i)
        {
            if (color_distance(corner_color(mesh, map, poly, i), reference, metric) <= threshold)
            {
                ++matched;
                if (policy == MatchPolicy::ANY_VERTEX)
                    return true;
            }
            else if (policy == MatchPolicy::ALL_VERTICES)
            {
                return false;
            }
        }

        return policy == MatchPolicy::ALL_VERTICES && matched == corners;
    }

    std::vector<int32_t> match_polys(const SysMesh*   mesh,
                                     int32_t          mapId,
                                     const glm::vec4& reference,
                                     float            threshold,
                                     MatchPolicy      policy,
                                     ColorMetric      metric)
    {
        if (std::isnan(threshold) || threshold < 0.0f)
            throw std::invalid_argument("vcol::match_polys(): threshold must be a non-negative number.");

        const int32_t map = find_color_map(mesh, mapId);

        std::vector<int32_t> result = {};
        for (int32_t poly : mesh->all_polys())
        {
            if (poly_matches(mesh, map, poly, reference, threshold, policy, metric))
                result.push_back(poly);
        }
        return result;
    }

    // ------------------------------------------------------------
    // Combiner
    // ------------------------------------------------------------

    uint32_t apply_selection(SysMesh* mesh, const std::vector<int32_t>& matches, SelectPolicy policy)
    {
        if (!mesh)
            return 0;

        uint32_t changed = 0;

        if (policy == SelectPolicy::REPLACE)
        {
            std::vector<uint8_t> mark(mesh->poly_buffer_size(), 0);
            for (int32_t p : matches)
            {
                if (mesh->poly_valid(p))
                    mark[static_cast<uint32_t>(p)] = 1;
            }

            // Copy: deselecting edits the selection list.
            const std::vector<int32_t> before = mesh->selected_polys();
            for (int32_t p : before)
            {
                if (!mark[static_cast<uint32_t>(p)] && mesh->select_poly(p, false))
                    ++changed;
            }
        }

        for (int32_t p : matches)
        {
            if (mesh->poly_valid(p) && mesh->select_poly(p, true))
                ++changed;
        }

        return changed;
    }

} // namespace vcol
