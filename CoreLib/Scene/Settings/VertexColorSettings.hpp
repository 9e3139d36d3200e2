//============================================================
// VertexColorSettings.hpp
//============================================================
#pragma once

#include <cstdint>
#include <glm/vec4.hpp>

#include "CoreTypes.hpp"

struct VertexColorSettings
{
    // --------------------------------------------------------
    // Sampling
    // --------------------------------------------------------
    glm::vec4      referenceColor = glm::vec4{1.0f, 1.0f, 1.0f, 1.0f}; // opaque white until sampled
    ColorReduction reduction      = ColorReduction::FIRST_CORNER;

    // --------------------------------------------------------
    // Matching
    // --------------------------------------------------------
    float       threshold   = 0.01f; // must be >= 0, checked at match time
    MatchPolicy matchPolicy = MatchPolicy::ALL_VERTICES;
    ColorMetric metric      = ColorMetric::CHEBYSHEV_RGBA;

    // --------------------------------------------------------
    // Combining
    // --------------------------------------------------------
    SelectPolicy selectPolicy = SelectPolicy::REPLACE;

    // --------------------------------------------------------
    // Source layer (0 = normals, 1 = UVs by convention)
    // --------------------------------------------------------
    int32_t colorMapId = 2;

    // --------------------------------------------------------
    // Result of the last SelectByColor (read only for the UI)
    // --------------------------------------------------------
    uint32_t lastMatchCount = 0;
};
