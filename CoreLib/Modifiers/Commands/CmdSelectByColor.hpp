#pragma once

#include "Command.hpp"

class Scene;

/**
 * @class CmdSelectByColor
 * @brief Selects the faces whose corner colors match the reference color.
 *
 * Runs on every active mesh with the parameters in VertexColorSettings
 * (reference color, threshold, match/select policy, metric, color map).
 *
 * All meshes are validated and all match sets are computed before any
 * selection is touched, so a failure leaves every mesh as it was. The total
 * number of matching faces is written back to
 * VertexColorSettings::lastMatchCount.
 */
class CmdSelectByColor : public Command
{
public:
    bool execute(Scene* scene) override;
};
