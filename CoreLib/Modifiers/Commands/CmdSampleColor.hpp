#pragma once

#include "Command.hpp"

class Scene;

/**
 * @class CmdSampleColor
 * @brief Picks the reference color from the one selected face.
 *
 * Exactly one face must be selected over all active meshes. Its corner
 * colors are reduced with VertexColorSettings::reduction and the result is
 * stored in VertexColorSettings::referenceColor. Meshes are never modified.
 */
class CmdSampleColor : public Command
{
public:
    bool execute(Scene* scene) override;
};
