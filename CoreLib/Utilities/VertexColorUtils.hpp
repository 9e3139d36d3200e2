#pragma once

#include <cstdint>
#include <glm/vec4.hpp>
#include <vector>

#include "CoreTypes.hpp"
#include "SysMesh.hpp"

/**
 * @file VertexColorUtils.hpp
 * @brief Face selection by per-corner (vertex) color.
 *
 * Three stages, evaluated leaf-first by the commands:
 *  - Sampler:  reduce the corner colors of one face to a reference color.
 *  - Matcher:  find every face whose corner colors are within a threshold of
 *              the reference color (pure read).
 *  - Combiner: merge the match set into the mesh's face selection.
 *
 * Corner colors live in a SysMesh map of type SysMapType::COLOR, identified
 * by map ID (see find_color_map()). Dim-3 maps hold RGB and read alpha as 1.
 *
 * Typical usage:
 * @code
 * const glm::vec4 ref = vcol::sample_selected_color(mesh, mapId);
 * const auto matches  = vcol::match_polys(mesh, mapId, ref, 0.05f, MatchPolicy::ALL_VERTICES);
 * vcol::apply_selection(mesh, matches, SelectPolicy::REPLACE);
 * @endcode
 *
 * Errors are thrown (CoreErrors.hpp). Every function that throws does so
 * before touching the mesh.
 */
namespace vcol
{
    /// Conventional map ID of the corner color map (0 = normals, 1 = UVs).
    inline constexpr int32_t kDefaultColorMapId = 2;

    /**
     * @brief Distance between two colors under the given metric.
     *
     * Symmetric, zero for identical colors.
     */
    [[nodiscard]] float color_distance(const glm::vec4& a,
                                       const glm::vec4& b,
                                       ColorMetric      metric = ColorMetric::CHEBYSHEV_RGBA) noexcept;

    /// @return True if the mesh has a usable color map with the given ID.
    [[nodiscard]] bool has_color_map(const SysMesh* mesh, int32_t mapId) noexcept;

    /**
     * @brief Resolve a color map ID to a map index.
     *
     * @throw MissingColorData if there is no map with that ID, or it is not a
     *        COLOR map of dimension 3 or 4.
     */
    [[nodiscard]] int32_t find_color_map(const SysMesh* mesh, int32_t mapId);

    /**
     * @brief Color stored at one corner of a mapped polygon.
     *
     * @param map    Map index (not ID), as returned by find_color_map().
     * @param corner Corner position in winding order.
     */
    [[nodiscard]] glm::vec4 corner_color(const SysMesh* mesh, int32_t map, int32_t poly, int32_t corner) noexcept;

    // ------------------------------------------------------------
    // Sampler
    // ------------------------------------------------------------

    /**
     * @brief Reference color of an explicitly given face.
     *
     * @throw MissingColorData      if the color map is missing or the face is not mapped in it.
     * @throw std::invalid_argument if the face does not exist.
     */
    [[nodiscard]] glm::vec4 sample_poly_color(const SysMesh* mesh,
                                              int32_t        mapId,
                                              int32_t        poly,
                                              ColorReduction reduction = ColorReduction::FIRST_CORNER);

    /**
     * @brief Reference color of the one selected face of the mesh.
     *
     * @throw InvalidSelectionCount unless exactly one face is selected.
     * @throw MissingColorData      as sample_poly_color().
     */
    [[nodiscard]] glm::vec4 sample_selected_color(const SysMesh* mesh,
                                                  int32_t        mapId,
                                                  ColorReduction reduction = ColorReduction::FIRST_CORNER);

    // ------------------------------------------------------------
    // Matcher
    // ------------------------------------------------------------

    /**
     * @brief Per-face match test against a resolved map index.
     *
     * A face that is not mapped has no corner colors and never matches.
     */
    [[nodiscard]] bool poly_matches(const SysMesh*   mesh,
                                    int32_t          map,
                                    int32_t          poly,
                                    const glm::vec4& reference,
                                    float            threshold,
                                    MatchPolicy      policy,
                                    ColorMetric      metric = ColorMetric::CHEBYSHEV_RGBA) noexcept;

    /**
     * @brief All faces whose corner colors match the reference color.
     *
     * A corner matches when color_distance(corner, reference, metric) <= threshold.
     * Threshold 0 demands exact equality; raising it never removes a face.
     *
     * @return Matching polygon indices, ascending. May be empty.
     * @throw MissingColorData       if the color map is missing.
     * @throw std::invalid_argument  if threshold is negative or NaN.
     */
    [[nodiscard]] std::vector<int32_t> match_polys(const SysMesh*   mesh,
                                                   int32_t          mapId,
                                                   const glm::vec4& reference,
                                                   float            threshold,
                                                   MatchPolicy      policy,
                                                   ColorMetric      metric = ColorMetric::CHEBYSHEV_RGBA);

    // ------------------------------------------------------------
    // Combiner
    // ------------------------------------------------------------

    /**
     * @brief Merge a match set into the mesh's face selection.
     *
     *  - REPLACE: selected == (face in matches), for every face.
     *  - ADD:     faces in matches become selected, all others are left alone.
     *
     * Changes are recorded in the mesh history. Invalid indices are ignored.
     *
     * @return The number of faces whose selection flag flipped.
     */
    uint32_t apply_selection(SysMesh* mesh, const std::vector<int32_t>& matches, SelectPolicy policy);

} // namespace vcol
