//=============================================================================
// Scene.cpp
//=============================================================================
#include "Scene.hpp"

#include "SceneObject.hpp"

Scene::Scene() = default;

Scene::~Scene()
{
    // Scene transactions reference the meshes; drop them first.
    history().clear();
    m_sceneObjects.clear();
}

void Scene::clear()
{
    history().clear();

    m_sceneObjects.clear();

    m_sceneChangeCounter->change();
}

SceneMesh* Scene::createSceneMesh(std::string_view name)
{
    auto sm = std::make_unique<SceneMesh>(name);
    sm->sysMesh()->change_counter()->addParent(m_sceneChangeCounter);
    sm->changeCounter()->addParent(m_sceneChangeCounter);

    SceneMesh* ptr = sm.get();
    m_sceneObjects.push_back(std::move(sm));

    m_sceneChangeCounter->change();
    return ptr;
}

std::vector<SceneMesh*> Scene::sceneMeshes()
{
    std::vector<SceneMesh*> result;
    result.reserve(m_sceneObjects.size());

    for (const auto& obj : m_sceneObjects)
    {
        if (auto* mesh = dynamic_cast<SceneMesh*>(obj.get()))
            result.push_back(mesh);
    }
    return result;
}

std::vector<const SceneMesh*> Scene::sceneMeshes() const
{
    std::vector<const SceneMesh*> result;
    result.reserve(m_sceneObjects.size());

    for (const auto& obj : m_sceneObjects)
    {
        if (const auto* mesh = dynamic_cast<const SceneMesh*>(obj.get()))
            result.push_back(mesh);
    }
    return result;
}

const std::vector<std::unique_ptr<SceneObject>>& Scene::sceneObjects() const
{
    return m_sceneObjects;
}

std::vector<SysMesh*> Scene::meshes() const
{
    std::vector<SysMesh*> result;
    result.reserve(m_sceneObjects.size());

    for (const auto& obj : m_sceneObjects)
    {
        if (auto* mesh = dynamic_cast<SceneMesh*>(obj.get()))
            result.push_back(mesh->sysMesh());
    }
    return result;
}

std::vector<SysMesh*> Scene::selectedMeshes() const
{
    std::vector<SysMesh*> result;

    for (const auto& obj : m_sceneObjects)
    {
        auto* mesh = dynamic_cast<SceneMesh*>(obj.get());
        if (mesh && mesh->selected())
            result.push_back(mesh->sysMesh());
    }
    return result;
}

std::vector<SysMesh*> Scene::visibleMeshes() const
{
    std::vector<SysMesh*> result;

    for (const auto& obj : m_sceneObjects)
    {
        auto* mesh = dynamic_cast<SceneMesh*>(obj.get());
        if (mesh && mesh->visible())
            result.push_back(mesh->sysMesh());
    }
    return result;
}

std::vector<SysMesh*> Scene::activeMeshes() const
{
    std::vector<SysMesh*> result;

    for (const auto& obj : m_sceneObjects)
    {
        auto* mesh = dynamic_cast<SceneMesh*>(obj.get());
        if (mesh && mesh->visible() && mesh->selected())
            result.push_back(mesh->sysMesh());
    }
    return result;
}

VertexColorSettings& Scene::vertexColorSettings() noexcept
{
    return m_vertexColorSettings;
}

const VertexColorSettings& Scene::vertexColorSettings() const noexcept
{
    return m_vertexColorSettings;
}

void Scene::settingsChanged() noexcept
{
    m_sceneChangeCounter->change();
}

SysCounterPtr Scene::changeCounter() const noexcept
{
    return m_sceneChangeCounter;
}
