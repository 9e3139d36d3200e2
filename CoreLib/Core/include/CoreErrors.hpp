//
//  CoreErrors.hpp
//  Core
//
// Errors reported by the color selection commands. They are thrown, reach the
// UI through Core, and are shown to the user as is (what()).

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

/**
 * @brief Base class for failures of a sample/select operation.
 *
 * A ColorSelectError always means the operation was aborted and no mesh was
 * modified.
 */
class ColorSelectError : public std::runtime_error
{
public:
    explicit ColorSelectError(const std::string& message) : std::runtime_error(message)
    {
    }
};

/**
 * @brief Sampling needs exactly one selected face.
 */
class InvalidSelectionCount final : public ColorSelectError
{
public:
    InvalidSelectionCount(uint32_t required, uint32_t observed) :
        ColorSelectError("Expected exactly " + std::to_string(required) + " selected face, found " +
                         std::to_string(observed) + "."),
        m_required(required),
        m_observed(observed)
    {
    }

    [[nodiscard]] uint32_t required() const noexcept
    {
        return m_required;
    }

    [[nodiscard]] uint32_t observed() const noexcept
    {
        return m_observed;
    }

private:
    uint32_t m_required;
    uint32_t m_observed;
};

/**
 * @brief The mesh has no per-corner color map with the requested ID, or the
 *        face being sampled is not mapped in it.
 */
class MissingColorData final : public ColorSelectError
{
public:
    explicit MissingColorData(int32_t mapId) :
        ColorSelectError("No vertex color map found (map id " + std::to_string(mapId) + ")."),
        m_mapId(mapId)
    {
    }

    MissingColorData(int32_t mapId, int32_t polyIndex) :
        ColorSelectError("Face " + std::to_string(polyIndex) + " has no vertex colors in map " +
                         std::to_string(mapId) + "."),
        m_mapId(mapId)
    {
    }

    [[nodiscard]] int32_t mapId() const noexcept
    {
        return m_mapId;
    }

private:
    int32_t m_mapId;
};
