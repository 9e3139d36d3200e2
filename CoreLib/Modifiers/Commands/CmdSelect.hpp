#pragma once

#include "Command.hpp"

class Scene;

/**
 * @class CmdSelectAll
 * @brief Selects all polygons of every active SceneMesh.
 */
class CmdSelectAll : public Command
{
public:
    bool execute(Scene* scene) override;
};

/**
 * @class CmdSelectNone
 * @brief Clears the polygon selection of every active SceneMesh.
 */
class CmdSelectNone : public Command
{
public:
    bool execute(Scene* scene) override;
};
