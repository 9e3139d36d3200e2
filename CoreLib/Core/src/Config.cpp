#include "Config.hpp"

#include "CmdSampleColor.hpp"
#include "CmdSelect.hpp"
#include "CmdSelectByColor.hpp"

namespace config
{

    void registerCommands(ItemFactory<Command>& factory)
    {
        factory.registerItem("SelectAll", &ItemFactory<Command>::createItemType<CmdSelectAll>);
        factory.registerItem("SelectNone", &ItemFactory<Command>::createItemType<CmdSelectNone>);
        factory.registerItem("SampleColor", &ItemFactory<Command>::createItemType<CmdSampleColor>);
        factory.registerItem("SelectByColor", &ItemFactory<Command>::createItemType<CmdSelectByColor>);
    }

} // namespace config
