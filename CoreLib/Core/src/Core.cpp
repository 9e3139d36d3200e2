//=============================================================================
// Core.cpp
//=============================================================================
#include "Core.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>

#include "Command.hpp"
#include "Config.hpp"

namespace
{
    // Undo label of edits made directly on meshes, outside of any command.
    constexpr const char* kDirectEditLabel = "Edit";
} // namespace

Core::Core() :
    m_scene{std::make_unique<Scene>()},
    m_vertexColorProperties{std::make_unique<VertexColorProperties>(&m_scene->vertexColorSettings())}
{
    config::registerCommands(m_commandFactory);
}

Core::~Core() = default;

// ------------------------------------------------------------
// Scene
// ------------------------------------------------------------

Scene* Core::scene() noexcept
{
    return m_scene.get();
}

const Scene* Core::scene() const noexcept
{
    return m_scene.get();
}

SysCounterPtr Core::changeCounter() const noexcept
{
    return m_scene->changeCounter();
}

// ------------------------------------------------------------
// Commands / actions
// ------------------------------------------------------------

bool Core::runCommand(const std::string& name)
{
    if (!m_scene)
        return false;

    auto command = m_commandFactory.createItem(name);
    if (!command)
        throw std::runtime_error("Core::runCommand(): Command \"" + name + "\" not found.");

    // Keep a failing command from rolling back edits it did not make.
    m_scene->commitMeshChanges(kDirectEditLabel);

    try
    {
        const bool ok = command->execute(m_scene.get());
        if (ok)
            m_scene->commitMeshChanges(name);
        else
            m_scene->abortMeshChanges();

        return ok;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Core::runCommand(): " << name << " failed: " << e.what() << std::endl;
        m_scene->abortMeshChanges();
        throw;
    }
    catch (...)
    {
        m_scene->abortMeshChanges();
        throw;
    }
}

bool Core::runAction(const std::string& name)
{
    if (!m_scene)
        return false;

    if (name == "Undo")
    {
        m_scene->commitMeshChanges(kDirectEditLabel);
        return m_scene->history().undo_step();
    }

    if (name == "Redo")
    {
        // Pending edits start a new branch; there is nothing left to redo then.
        m_scene->commitMeshChanges(kDirectEditLabel);
        return m_scene->history().redo_step();
    }

    throw std::runtime_error("Core::runAction(): Action \"" + name + "\" not found.");
}

std::vector<std::string> Core::commandNames() const
{
    return m_commandFactory.names();
}

bool Core::canUndo() const
{
    return m_scene->hasPendingMeshChanges() || m_scene->history().can_undo();
}

bool Core::canRedo() const
{
    return !m_scene->hasPendingMeshChanges() && m_scene->history().can_redo();
}

std::string Core::undoLabel() const
{
    if (m_scene->hasPendingMeshChanges())
        return kDirectEditLabel;

    return m_scene->history().undo_label();
}

// ------------------------------------------------------------
// Vertex color selection
// ------------------------------------------------------------

glm::vec4 Core::sampleColor()
{
    if (!runCommand("SampleColor"))
        throw std::runtime_error("Core::sampleColor(): SampleColor did not complete.");

    return m_scene->vertexColorSettings().referenceColor;
}

uint32_t Core::selectByColor(float threshold, MatchPolicy matchPolicy, SelectPolicy selectPolicy)
{
    VertexColorSettings&      settings = m_scene->vertexColorSettings();
    const VertexColorSettings previous = settings;

    settings.threshold    = threshold;
    settings.matchPolicy  = matchPolicy;
    settings.selectPolicy = selectPolicy;

    bool ok = false;
    try
    {
        ok = runCommand("SelectByColor");
    }
    catch (const std::exception&)
    {
        settings = previous;
        throw;
    }

    if (!ok)
    {
        settings = previous;
        throw std::runtime_error("Core::selectByColor(): SelectByColor did not complete.");
    }

    return settings.lastMatchCount;
}

VertexColorProperties* Core::vertexColorProperties() noexcept
{
    return m_vertexColorProperties.get();
}
