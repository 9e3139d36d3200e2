#include "CmdSelect.hpp"

#include <stdexcept>

#include "Scene.hpp"
#include "SysMesh.hpp"

bool CmdSelectAll::execute(Scene* scene)
{
    if (!scene)
        throw std::runtime_error("CmdSelectAll::execute(): scene is null.");

    for (SysMesh* mesh : scene->activeMeshes())
    {
        for (int32_t pi : mesh->all_polys())
        {
            mesh->select_poly(pi, true);
        }
    }
    return true;
}

bool CmdSelectNone::execute(Scene* scene)
{
    if (!scene)
        throw std::runtime_error("CmdSelectNone::execute(): scene is null.");

    for (SysMesh* mesh : scene->activeMeshes())
    {
        mesh->clear_selected_polys();
    }
    return true;
}
