//=============================================================================
// Scene.hpp
//=============================================================================
#pragma once

#include <SysCounter.hpp>
#include <SysMesh.hpp>
#include <SysMeshScene.hpp>
#include <memory>
#include <string_view>
#include <vector>

#include "SceneMesh.hpp"
#include "VertexColorSettings.hpp"

class SceneObject;

/**
 * @brief Scene-level container and coordinator.
 *
 * Scene owns all scene objects and the vertex color settings shared by the
 * color commands. It implements SysMeshScene to expose mesh-level access
 * and the scene undo stack to commands.
 *
 * Responsibilities:
 * - Own SceneObjects and SceneMeshes
 * - Decide which meshes are active (visible and selected)
 * - Own VertexColorSettings
 * - Track scene changes through a counter
 */
class Scene : public SysMeshScene
{
public:
    /** @brief Construct an empty scene. */
    Scene();

    /** @brief Destroy scene and all owned objects. */
    ~Scene();

    /** @brief Remove all objects and clear the undo stack. Settings are kept. */
    void clear();

    /**
     * @brief Create and add a new SceneMesh.
     * @param name Optional mesh name
     * @return Pointer to the created SceneMesh (owned by the scene)
     */
    [[nodiscard]] SceneMesh* createSceneMesh(std::string_view name = {});

    /**
     * @brief Retrieve all SceneMeshes.
     * @return Vector of SceneMesh pointers
     */
    [[nodiscard]] std::vector<SceneMesh*> sceneMeshes();

    /**
     * @brief Retrieve all SceneMeshes (const).
     * @return Vector of SceneMesh pointers
     */
    [[nodiscard]] std::vector<const SceneMesh*> sceneMeshes() const;

    /** @brief Access scene objects (const). */
    [[nodiscard]] const std::vector<std::unique_ptr<SceneObject>>& sceneObjects() const;

    // ------------------------------------------------------------
    // SysMeshScene interface
    // ------------------------------------------------------------

    /** @brief All meshes in the scene. */
    [[nodiscard]] std::vector<SysMesh*> meshes() const override;

    /** @brief Meshes whose SceneMesh is selected. */
    [[nodiscard]] std::vector<SysMesh*> selectedMeshes() const override;

    /** @brief Meshes whose SceneMesh is visible. */
    [[nodiscard]] std::vector<SysMesh*> visibleMeshes() const override;

    /** @brief Meshes that are both selected and visible. */
    [[nodiscard]] std::vector<SysMesh*> activeMeshes() const override;

    // ------------------------------------------------------------
    // Settings
    // ------------------------------------------------------------

    /** @brief Vertex color sampling/selection parameters. */
    [[nodiscard]] VertexColorSettings& vertexColorSettings() noexcept;

    /** @brief Vertex color sampling/selection parameters (const). */
    [[nodiscard]] const VertexColorSettings& vertexColorSettings() const noexcept;

    /** @brief Notify that the settings were written (bumps the change counter). */
    void settingsChanged() noexcept;

    // ------------------------------------------------------------
    // Change tracking
    // ------------------------------------------------------------

    /**
     * @brief Scene change counter.
     *
     * Parent of every mesh and SceneMesh counter, so it changes whenever
     * anything in the scene does.
     */
    [[nodiscard]] SysCounterPtr changeCounter() const noexcept;

private:
    std::vector<std::unique_ptr<SceneObject>> m_sceneObjects;

    VertexColorSettings m_vertexColorSettings = {};

    SysCounterPtr m_sceneChangeCounter = std::make_shared<SysCounter>();
};
