//
//  CoreTypes.hpp
//  Core
//
// Public enums and types that
// are visible to both C++ and the UI Application

#pragma once

/// How per-corner color matches turn into a per-face decision.
enum class MatchPolicy : int
{
    ALL_VERTICES, ///< Every corner of the face must match.
    ANY_VERTEX,   ///< At least one corner of the face must match.
};

/// How a new match set is merged into the existing face selection.
enum class SelectPolicy : int
{
    REPLACE, ///< Selection becomes exactly the match set.
    ADD,     ///< Match set is added to the current selection.
};

/// How the corner colors of the sampled face reduce to one reference color.
enum class ColorReduction : int
{
    FIRST_CORNER, ///< Color of the first corner in winding order.
    AVERAGE,      ///< Per-channel mean over all corners.
};

/// Distance used to compare a corner color with the reference color.
enum class ColorMetric : int
{
    CHEBYSHEV_RGBA, ///< Largest absolute difference over R, G, B and A.
    EUCLIDEAN_RGB,  ///< Straight-line distance over R, G and B; alpha ignored.
};

/// Widget kind of a Property (see Property.hpp).
enum class PropertyType
{
    INT,
    FLOAT,
    COLOR,
    INT_RO // Read only
};
