//=============================================================================
// Core.hpp
//=============================================================================
#pragma once

#include <cstdint>
#include <glm/vec4.hpp>
#include <memory>
#include <string>
#include <vector>

#include "CoreTypes.hpp"
#include "ItemFactory.hpp"
#include "Scene.hpp"
#include "VertexColorProperties.hpp"

class Command;

/**
 * @brief Central application controller.
 *
 * Core is the coordination layer between the UI, the scene data and the
 * commands. UI layers call into Core in response to user interaction and
 * read results back from the scene settings.
 *
 * Every command run through Core is atomic: its mesh edits become one undo
 * step when it succeeds and are rolled back when it fails.
 *
 * Core is UI-agnostic.
 */
class Core
{
public:
    /** @brief Constructs a Core with an empty scene. */
    Core();

    ~Core();

    Core(const Core&)            = delete;
    Core& operator=(const Core&) = delete;

    // ------------------------------------------------------------
    // Scene
    // ------------------------------------------------------------

    /** @brief Access the scene. */
    [[nodiscard]] Scene* scene() noexcept;

    /** @brief Access the scene (const). */
    [[nodiscard]] const Scene* scene() const noexcept;

    /** @brief Scene change counter, for UI refresh. */
    [[nodiscard]] SysCounterPtr changeCounter() const noexcept;

    // ------------------------------------------------------------
    // Commands / actions
    // ------------------------------------------------------------

    /**
     * @brief Execute a registered command by name.
     *
     * Edits made outside of a command are committed first as their own
     * undo step. The command's own edits are committed under its name when
     * it returns true, and undone when it returns false or throws.
     *
     * @param name Registered command name (see config::registerCommands()).
     * @return The command's result.
     * @throw std::runtime_error if no command is registered under name.
     * @throw Whatever the command throws, after rolling back its edits.
     */
    bool runCommand(const std::string& name);

    /**
     * @brief Execute a named action that is not a command ("Undo", "Redo").
     *
     * @return True if the action changed anything.
     * @throw std::runtime_error for an unknown action name.
     */
    bool runAction(const std::string& name);

    /// @return All registered command names, sorted.
    [[nodiscard]] std::vector<std::string> commandNames() const;

    /// @return True if there is a scene step to undo (pending edits included).
    [[nodiscard]] bool canUndo() const;

    /// @return True if there is a scene step to redo.
    [[nodiscard]] bool canRedo() const;

    /// @return Name of the step the next undo reverts, or an empty string.
    [[nodiscard]] std::string undoLabel() const;

    // ------------------------------------------------------------
    // Vertex color selection
    // ------------------------------------------------------------

    /**
     * @brief Sample the reference color from the one selected face.
     *
     * Runs "SampleColor" and returns the new reference color, which is also
     * kept in VertexColorSettings::referenceColor.
     *
     * @throw InvalidSelectionCount, MissingColorData
     * @throw std::runtime_error if the command reports that it did not run.
     */
    glm::vec4 sampleColor();

    /**
     * @brief Select faces matching the current reference color.
     *
     * Stores the given parameters in the scene settings, then runs
     * "SelectByColor". On failure the previous parameters are restored.
     *
     * @return Number of faces that matched, over all active meshes.
     * @throw MissingColorData, std::invalid_argument (negative threshold)
     * @throw std::runtime_error if the command reports that it did not run.
     */
    uint32_t selectByColor(float threshold, MatchPolicy matchPolicy, SelectPolicy selectPolicy);

    /**
     * @brief UI view of the vertex color settings.
     *
     * The returned group is owned by Core and stays valid for its lifetime.
     */
    [[nodiscard]] VertexColorProperties* vertexColorProperties() noexcept;

private:
    std::unique_ptr<Scene> m_scene;

    ItemFactory<Command> m_commandFactory;

    std::unique_ptr<VertexColorProperties> m_vertexColorProperties;
};
