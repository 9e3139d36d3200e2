#pragma once

#include "ItemFactory.hpp"

class Command;

namespace config
{

    /**
     * @brief Register all available Command types into the given command factory.
     *
     * Names registered here are the ones accepted by Core::runCommand().
     */
    void registerCommands(ItemFactory<Command>& factory);

} // namespace config
