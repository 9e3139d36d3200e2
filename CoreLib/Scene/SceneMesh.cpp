#include "SceneMesh.hpp"

SceneMesh::SceneMesh() : m_mesh{std::make_unique<SysMesh>()}
{
}

SceneMesh::SceneMesh(std::string_view name) : m_mesh{std::make_unique<SysMesh>()}, m_name{name}
{
}

SceneMesh::~SceneMesh()
{
}

std::string_view SceneMesh::name() const noexcept
{
    return m_name;
}

bool SceneMesh::visible() const noexcept
{
    return m_visible;
}

void SceneMesh::visible(bool value) noexcept
{
    if (m_visible == value)
        return;

    m_visible = value;
    m_changeCounter->change();
}

bool SceneMesh::selected() const noexcept
{
    return m_selected;
}

void SceneMesh::selected(bool value) noexcept
{
    if (m_selected == value)
        return;

    m_selected = value;
    m_changeCounter->change();
}

SysMesh* SceneMesh::sysMesh()
{
    return m_mesh.get();
}

const SysMesh* SceneMesh::sysMesh() const
{
    return m_mesh.get();
}

SysCounterPtr SceneMesh::changeCounter() const noexcept
{
    return m_changeCounter;
}
