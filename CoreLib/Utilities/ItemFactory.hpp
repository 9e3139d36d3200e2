#pragma once

#include <algorithm>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @class ItemFactory
 * @brief Generic factory for constructing items by string key.
 *
 * Maps string identifiers to constructor functions so that pluggable
 * components can be created by name at runtime. Core uses it for commands
 * (`ItemFactory<Command>`), which lets the UI trigger an operation by name
 * ("SampleColor", "SelectByColor", ...).
 *
 * Usage example:
 * @code
 * ItemFactory<Command> factory;
 * factory.registerItem("SelectAll", &ItemFactory<Command>::createItemType<CmdSelectAll>);
 * auto cmd = factory.createItem("SelectAll");
 * @endcode
 *
 * @tparam T Base type of items created by the factory.
 */
template<typename T>
class ItemFactory
{
public:
    ItemFactory() = default;

    /// Function pointer / functor used to create new items.
    using CreateFunc = std::function<std::unique_ptr<T>()>;

    /**
     * @brief Register a new item type under a name.
     *
     * If the name already exists, the previous entry is replaced.
     */
    void registerItem(const std::string& name, CreateFunc createFunc)
    {
        registry[name] = std::move(createFunc);
    }

    /**
     * @brief Create an item instance by name.
     *
     * @param name Registered string key.
     * @return A newly constructed unique_ptr<T>, or nullptr if not found.
     */
    std::unique_ptr<T> createItem(const std::string& name) const
    {
        if (auto it = registry.find(name); it != registry.end())
        {
            return it->second();
        }
        return nullptr;
    }

    /// @return True if an item is registered under the name.
    [[nodiscard]] bool contains(const std::string& name) const
    {
        return registry.find(name) != registry.end();
    }

    /// @return All registered names, sorted.
    [[nodiscard]] std::vector<std::string> names() const
    {
        std::vector<std::string> result;
        result.reserve(registry.size());
        for (const auto& [name, func] : registry)
            result.push_back(name);

        std::sort(result.begin(), result.end());
        return result;
    }

    /**
     * @brief Helper function that constructs items of a specific derived type.
     *
     * @tparam Derived The concrete type to construct (must derive from T).
     */
    template<typename Derived>
    static std::unique_ptr<T> createItemType()
    {
        return std::make_unique<Derived>();
    }

private:
    /// Map of registered item names to constructor functions.
    std::unordered_map<std::string, CreateFunc> registry;
};
