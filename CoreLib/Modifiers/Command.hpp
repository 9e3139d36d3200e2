#pragma once

/**
 * @class Command
 * @brief Base class for all executable scene commands.
 *
 * A command runs once against the Scene and records its mesh edits in the
 * meshes' local histories. Core then commits those edits as one undo step
 * when execute() returns true, and rolls them back when it returns false or
 * throws.
 *
 * Commands are created by name through ItemFactory<Command> (see
 * config::registerCommands()).
 */
class Command
{
public:
    virtual ~Command() = default;

    /**
     * @brief Execute the command.
     *
     * @param scene The scene on which the command will operate.
     * @return True if the command executed successfully, false otherwise.
     * @throw ColorSelectError (or std::exception) on failure; nothing is
     *        committed in that case.
     */
    virtual bool execute(class Scene* scene) = 0;
};
