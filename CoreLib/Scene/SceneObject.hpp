#pragma once

/**
 * @brief Base class for any object inside a Scene.
 */
class SceneObject
{
public:
    virtual ~SceneObject() noexcept = default;

    // Visibility
    [[nodiscard]]
    virtual bool visible() const noexcept     = 0;
    virtual void visible(bool value) noexcept = 0;

    // Selection
    [[nodiscard]]
    virtual bool selected() const noexcept     = 0;
    virtual void selected(bool value) noexcept = 0;
};
