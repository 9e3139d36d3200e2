#pragma once

#include <cmath>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "CoreTypes.hpp"

/**
 * @brief Type-erased view of a value exposed to the UI.
 *
 * A property does not own its value; it points at a field of a settings
 * struct. The UI reads and writes through value()/setValue() and uses the
 * editor hints to build its widget.
 */
class PropertyBase
{
public:
    virtual ~PropertyBase()
    {
    }

    virtual const std::string& name() const = 0;
    virtual PropertyType       type() const = 0;

    virtual bool changed() = 0;

    // raw pointers to underlying storage
    virtual void* value() = 0;
    virtual void* min()   = 0;
    virtual void* max()   = 0;

    virtual void setValue(void* val) = 0;

    // --- Editor hints (optional) ---
    virtual bool   hasStep() const  = 0; // true when step() is set
    virtual double step() const     = 0; // NaN if unset
    virtual int    decimals() const = 0; // -1 if unset

    /// Option labels of an enum property, indexed by the enum's integer value.
    virtual const std::vector<std::string>& options() const = 0;
};

template<typename T>
class Property : public PropertyBase
{
public:
    // Value-only (no min/max); optional step/decimals
    explicit Property(const std::string& name, PropertyType type, T* value, double step = std::numeric_limits<double>::quiet_NaN(), int decimals = -1) :
        m_name(name),
        m_type(type),
        m_currVal(value),
        m_prevVal(*value),
        m_min(std::numeric_limits<T>::lowest()),
        m_max(std::numeric_limits<T>::max()),
        m_step(step),
        m_decimals(decimals),
        m_changed(true)
    {
    }

    // Value with min/max; optional step/decimals
    explicit Property(const std::string& name, PropertyType type, T* value, T min, T max, double step = std::numeric_limits<double>::quiet_NaN(), int decimals = -1) :
        m_name(name),
        m_type(type),
        m_currVal(value),
        m_prevVal(*value),
        m_min(min),
        m_max(max),
        m_step(step),
        m_decimals(decimals),
        m_changed(true)
    {
    }

    const std::string& name() const override
    {
        return m_name;
    }

    PropertyType type() const override
    {
        return m_type;
    }

    void* value() override
    {
        return m_currVal;
    }

    void* min() override
    {
        return &m_min;
    }

    void* max() override
    {
        return &m_max;
    }

    bool changed() override
    {
        if (m_prevVal != *m_currVal)
        {
            m_prevVal = *m_currVal;
            return true;
        }
        if (m_changed)
        {
            m_changed = false;
            return true;
        }
        return false;
    }

    // min/max are hints for the widget, the value is stored as given.
    void setValue(void* val) override
    {
        m_prevVal = *m_currVal = *static_cast<T*>(val);
        m_changed              = true;
    }

    bool hasStep() const override
    {
        return !std::isnan(m_step);
    }

    double step() const override
    {
        return m_step; // NaN => unset
    }

    int decimals() const override
    {
        return m_decimals; // -1 => unset
    }

    const std::vector<std::string>& options() const override
    {
        return m_options;
    }

    void options(std::vector<std::string> labels)
    {
        m_options = std::move(labels);
    }

private:
    std::string  m_name;
    PropertyType m_type;

    T* m_currVal;
    T  m_prevVal{};
    T  m_min{};
    T  m_max{};

    double m_step;     // NaN = not specified
    int    m_decimals; // -1 = not specified

    std::vector<std::string> m_options;

    bool m_changed;
};

class PropertyGroup
{
public:
    PropertyGroup() :
        m_groupChanged{true}
    {
    }

    virtual ~PropertyGroup() = default;

    // Value-only property; optional step/decimals
    template<typename T>
    Property<T>* addProperty(const std::string& name, PropertyType ptType, T* value, double step = std::numeric_limits<double>::quiet_NaN(), int decimals = -1)
    {
        return add(std::make_unique<Property<T>>(name, ptType, value, step, decimals));
    }

    // Property with min/max; optional step/decimals
    template<typename T>
    Property<T>* addProperty(const std::string& name, PropertyType ptType, T* value, T min, T max, double step = std::numeric_limits<double>::quiet_NaN(), int decimals = -1)
    {
        return add(std::make_unique<Property<T>>(name, ptType, value, min, max, step, decimals));
    }

    // Enum stored as INT; labels are listed in enum value order.
    template<typename E>
    Property<E>* addEnumProperty(const std::string& name, E* value, std::vector<std::string> labels)
    {
        const E first = static_cast<E>(0);
        const E last  = static_cast<E>(static_cast<int>(labels.size()) - 1);

        Property<E>* prop = add(std::make_unique<Property<E>>(name, PropertyType::INT, value, first, last, 1.0, 0));
        prop->options(std::move(labels));
        return prop;
    }

    const std::vector<std::unique_ptr<PropertyBase>>& properties() const
    {
        return m_properties;
    }

    /// @return The property with the given name, or nullptr.
    PropertyBase* findProperty(std::string_view name) const
    {
        for (const auto& prop : m_properties)
        {
            if (prop->name() == name)
                return prop.get();
        }
        return nullptr;
    }

    bool propertyGroupChanged()
    {
        if (m_groupChanged)
        {
            m_groupChanged = false;
            return true;
        }
        return false;
    }

    bool propertyValuesChanged()
    {
        bool result = false;
        for (auto& prop : m_properties)
        {
            if (prop->changed())
            {
                result = true;
            }
        }
        return result;
    }

private:
    template<typename T>
    Property<T>* add(std::unique_ptr<Property<T>> prop)
    {
        Property<T>* raw = prop.get();
        m_properties.push_back(std::move(prop));
        m_groupChanged = true;
        return raw;
    }

private:
    std::vector<std::unique_ptr<PropertyBase>> m_properties;
    bool                                       m_groupChanged;
};
