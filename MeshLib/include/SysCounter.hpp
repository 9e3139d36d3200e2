#ifndef SYS_COUNTER_HPP_INCLUDED
#define SYS_COUNTER_HPP_INCLUDED

#include <cstdint>
#include <memory>
#include <vector>

class SysCounter;
using SysCounterPtr = std::shared_ptr<SysCounter>;

/**
 * @brief Version counter bumped on every change of the state it guards.
 *
 * Changes propagate to parent counters, so a mesh's general change counter
 * moves whenever its selection, topology or deform counter does.
 */
class SysCounter
{
public:
    SysCounter() = default;

    /// Increments this counter and every parent counter.
    void change();

    /// Registers a parent that receives this counter's changes. Duplicates are ignored.
    void addParent(const SysCounterPtr& parent);

    [[nodiscard]] uint64_t value() const noexcept;

private:
    std::vector<SysCounterPtr> m_parents;
    uint64_t                   m_value{0};
};

/**
 * @brief Watches a SysCounter and reports whether it moved since the last query.
 */
class SysMonitor
{
public:
    /**
     * @param counter    The counter to watch.
     * @param startDirty If true the first changed() call reports a change
     *                   even when the counter has not moved.
     */
    explicit SysMonitor(SysCounterPtr counter, bool startDirty = false);

    /// @return True if the counter changed since the previous call (or construction).
    [[nodiscard]] bool changed() noexcept;

private:
    SysCounterPtr m_counter;
    uint64_t      m_prevValue;
    bool          m_dirty;
};

#endif // SYS_COUNTER_HPP_INCLUDED
