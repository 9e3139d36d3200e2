#pragma once

#include <SysCounter.hpp>
#include <SysMesh.hpp>
#include <memory>
#include <string>
#include <string_view>

#include "SceneObject.hpp"

class Scene;

/**
 * @brief Scene object that owns a SysMesh.
 *
 * Stores object-level state (name, visibility and selection) next to the
 * mesh data. Only meshes that are both visible and selected take part in
 * color sampling and selection (Scene::activeMeshes()).
 */
class SceneMesh final : public SceneObject
{
public:
    /** @brief Construct a SceneMesh with an empty name. */
    SceneMesh();

    /**
     * @brief Construct a SceneMesh with a name.
     * @param name Mesh display name
     */
    explicit SceneMesh(std::string_view name);

    ~SceneMesh();

    /**
     * @brief Get the mesh name.
     * @return Name view (lifetime owned by this object)
     */
    [[nodiscard]] std::string_view name() const noexcept;

    /** @copydoc SceneObject::visible */
    [[nodiscard]] bool visible() const noexcept override;

    /** @copydoc SceneObject::visible(bool) */
    void visible(bool value) noexcept override;

    /** @copydoc SceneObject::selected */
    [[nodiscard]] bool selected() const noexcept override;

    /** @copydoc SceneObject::selected(bool) */
    void selected(bool value) noexcept override;

    /** @brief Access the owned SysMesh. */
    [[nodiscard]] SysMesh* sysMesh();

    /** @brief Access the owned SysMesh (const). */
    [[nodiscard]] const SysMesh* sysMesh() const;

    /**
     * @brief Change counter for object-level changes (visibility, selection).
     *
     * Mesh data changes are reported by the SysMesh counters instead.
     */
    [[nodiscard]] SysCounterPtr changeCounter() const noexcept;

private:
    /** @brief Mesh data (authoritative). */
    std::unique_ptr<SysMesh> m_mesh;

    /** @brief Visibility flag. */
    bool m_visible = true;

    /** @brief Selection flag. */
    bool m_selected = true;

    /** @brief Mesh name storage. */
    std::string m_name;

    /** @brief Per-object change counter. */
    SysCounterPtr m_changeCounter = std::make_shared<SysCounter>();
};
