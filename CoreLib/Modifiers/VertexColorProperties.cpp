#include "VertexColorProperties.hpp"

#include <cassert>
#include <glm/vec4.hpp>

VertexColorProperties::VertexColorProperties(VertexColorSettings* settings) : m_settings{settings}
{
    assert(m_settings);

    addProperty("Reference Color", PropertyType::COLOR, &m_settings->referenceColor, glm::vec4(0.f), glm::vec4(1.f));
    addProperty("Threshold", PropertyType::FLOAT, &m_settings->threshold, 0.f, kThresholdSliderMax, 0.01, 3);

    addEnumProperty("Match", &m_settings->matchPolicy, {"All Vertices", "Any Vertex"});
    addEnumProperty("Mode", &m_settings->selectPolicy, {"Replace", "Add"});
    addEnumProperty("Sample", &m_settings->reduction, {"First Corner", "Average"});
    addEnumProperty("Distance", &m_settings->metric, {"Chebyshev RGBA", "Euclidean RGB"});

    addProperty("Color Map", PropertyType::INT, &m_settings->colorMapId, 0, 1024, 1.0, 0);
    addProperty("Matched Faces", PropertyType::INT_RO, &m_settings->lastMatchCount);
}
