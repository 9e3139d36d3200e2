#pragma once

#include <string_view>
#include <vector>

#include "History.hpp"

class SysMesh;

/**
 * @brief Backend-agnostic scene interface operating directly on SysMesh objects.
 *
 * Provides the scene-level undo/redo stack and standardized access to the
 * collection of meshes in the scene. Commands record their edits in each
 * mesh's local history; the scene then either commits those edits as one
 * undo step or aborts them.
 */
class SysMeshScene
{
public:
    SysMeshScene();
    virtual ~SysMeshScene();

    /**
     * @brief Returns the global scene-level undo/redo stack.
     */
    History& history() { return m_sceneHistory; }

    /**
     * @brief Commits all pending mesh edits as a single undoable action.
     *
     * For each active mesh, this releases its current history and wraps them
     * all into one scene-wide History transaction named by label. Nothing is
     * recorded when no mesh changed.
     *
     * @return True if a transaction was recorded.
     */
    bool commitMeshChanges(std::string_view label = {});

    /**
     * @brief Aborts (undoes) all uncommitted changes on active meshes.
     */
    void abortMeshChanges();

    /**
     * @brief Returns true if there are uncommitted mesh edits that have not yet
     *        been wrapped into the scene history.
     */
    [[nodiscard]] bool hasPendingMeshChanges() const;

    /**
     * @return All SysMesh instances in the scene.
     */
    virtual std::vector<SysMesh*> meshes() const = 0;

    /**
     * @return Subset of meshes currently selected by the user.
     */
    virtual std::vector<SysMesh*> selectedMeshes() const = 0;

    /**
     * @return Subset of meshes that are currently visible in the viewport.
     */
    virtual std::vector<SysMesh*> visibleMeshes() const = 0;

    /**
     * @return Subset of meshes that are both selected and visible.
     *         Used by commands to operate only on user-targeted geometry.
     */
    virtual std::vector<SysMesh*> activeMeshes() const = 0;

private:
    History m_sceneHistory; ///< History stack that tracks scene-wide undo blocks
};
