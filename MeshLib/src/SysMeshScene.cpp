#include "SysMeshScene.hpp"

#include <memory>

#include "History.hpp"
#include "SysMesh.hpp"

SysMeshScene::SysMeshScene() :
    m_sceneHistory{nullptr}
{
}

SysMeshScene::~SysMeshScene() = default;

bool SysMeshScene::commitMeshChanges(std::string_view label)
{
    // Collect per-mesh histories into a single atomic action.
    auto sceneTransaction = std::make_unique<History>(nullptr);
    sceneTransaction->label(label);

    for (SysMesh* mesh : activeMeshes())
    {
        if (!mesh)
            continue;

        History* h = mesh->history();
        if (h && h->can_undo())
            sceneTransaction->insert(mesh->release_history());
    }

    if (!sceneTransaction->can_undo())
        return false;

    m_sceneHistory.insert(std::move(sceneTransaction));
    return true;
}

void SysMeshScene::abortMeshChanges()
{
    for (SysMesh* mesh : activeMeshes())
    {
        if (!mesh)
            continue;

        History* h = mesh->history();
        if (!h)
            continue;

        h->undo();
        h->clear();
    }
}

bool SysMeshScene::hasPendingMeshChanges() const
{
    for (SysMesh* mesh : activeMeshes())
    {
        if (!mesh)
            continue;

        History* h = mesh->history();
        if (h && h->can_undo())
            return true;
    }
    return false;
}
