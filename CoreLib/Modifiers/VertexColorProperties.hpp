#pragma once

#include "Property.hpp"
#include "VertexColorSettings.hpp"

/**
 * @class VertexColorProperties
 * @brief Exposes VertexColorSettings to the UI as a PropertyGroup.
 *
 * Every property points straight at a field of the bound settings, so edits
 * made through the UI are seen by the next SampleColor / SelectByColor run.
 * The settings must outlive this object.
 */
class VertexColorProperties : public PropertyGroup
{
public:
    explicit VertexColorProperties(VertexColorSettings* settings);

    /// Upper end of the threshold slider: the diagonal of the unit RGB cube.
    static constexpr float kThresholdSliderMax = 1.732f;

    [[nodiscard]] VertexColorSettings* settings() const noexcept
    {
        return m_settings;
    }

private:
    VertexColorSettings* m_settings = nullptr;
};
