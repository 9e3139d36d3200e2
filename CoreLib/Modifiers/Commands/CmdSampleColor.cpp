#include "CmdSampleColor.hpp"

#include <iostream>
#include <stdexcept>

#include "CoreErrors.hpp"
#include "Scene.hpp"
#include "SysMesh.hpp"
#include "VertexColorUtils.hpp"

bool CmdSampleColor::execute(Scene* scene)
{
    if (!scene)
        throw std::runtime_error("CmdSampleColor::execute(): scene is null.");

    VertexColorSettings& settings = scene->vertexColorSettings();

    SysMesh* source   = nullptr;
    uint32_t selected = 0;

    for (SysMesh* mesh : scene->activeMeshes())
    {
        const uint32_t count = static_cast<uint32_t>(mesh->selected_polys().size());
        if (count > 0)
            source = mesh;
        selected += count;
    }

    if (selected != 1)
        throw InvalidSelectionCount(1, selected);

    const glm::vec4 color = vcol::sample_selected_color(source, settings.colorMapId, settings.reduction);

    settings.referenceColor = color;
    scene->settingsChanged();

    std::cout << "CmdSampleColor: sampled color (" << color.r << ", " << color.g << ", " << color.b << ", "
              << color.a << ")" << std::endl;

    return true;
}
