#include "CmdSelectByColor.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

#include "CoreErrors.hpp"
#include "Scene.hpp"
#include "SysMesh.hpp"
#include "VertexColorUtils.hpp"

bool CmdSelectByColor::execute(Scene* scene)
{
    if (!scene)
        throw std::runtime_error("CmdSelectByColor::execute(): scene is null.");

    VertexColorSettings& settings = scene->vertexColorSettings();

    const std::vector<SysMesh*> meshes = scene->activeMeshes();

    // Validate every mesh before computing anything.
    for (const SysMesh* mesh : meshes)
    {
        if (!vcol::has_color_map(mesh, settings.colorMapId))
            throw MissingColorData(settings.colorMapId);
    }

    std::vector<std::pair<SysMesh*, std::vector<int32_t>>> results;
    results.reserve(meshes.size());

    uint32_t matched = 0;
    for (SysMesh* mesh : meshes)
    {
        std::vector<int32_t> polys = vcol::match_polys(mesh,
                                                       settings.colorMapId,
                                                       settings.referenceColor,
                                                       settings.threshold,
                                                       settings.matchPolicy,
                                                       settings.metric);
        matched += static_cast<uint32_t>(polys.size());
        results.emplace_back(mesh, std::move(polys));
    }

    // Nothing can fail past this point.
    uint32_t flipped = 0;
    for (const auto& [mesh, polys] : results)
    {
        flipped += vcol::apply_selection(mesh, polys, settings.selectPolicy);
    }

    settings.lastMatchCount = matched;
    scene->settingsChanged();

    std::cout << "CmdSelectByColor: " << matched << " matching face(s), " << flipped << " selection change(s)"
              << std::endl;

    return true;
}
