//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Source location primitives shared by parsing, symbol extraction, and queries.
///
//===----------------------------------------------------------------------===//
#ifndef FABLS_FRONTEND_SOURCE_LOCATION_H
#define FABLS_FRONTEND_SOURCE_LOCATION_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <tuple>

namespace fabls
{

/// @file
/// @brief Source location primitives shared across the frontend and the index.

/// @brief Identifies a concrete position in an input source file for messages.
struct SourceLocation
{
    /// @brief Path to the source file.
    std::string file;

    /// @brief 1-based source line.
    std::uint32_t line{1};

    /// @brief 1-based source column.
    std::uint32_t column{1};

    /// @brief Formats this location as a human-readable string.
    /// @return Formatted location text.
    [[nodiscard]] std::string str() const;
};

/// @brief Zero-based row/column point. Columns count bytes.
struct SourcePoint
{
    std::uint32_t row{0};
    std::uint32_t column{0};

    friend bool operator==(const SourcePoint& lhs, const SourcePoint& rhs)
    {
        return lhs.row == rhs.row && lhs.column == rhs.column;
    }
    friend bool operator!=(const SourcePoint& lhs, const SourcePoint& rhs)
    {
        return !(lhs == rhs);
    }
    friend bool operator<(const SourcePoint& lhs, const SourcePoint& rhs)
    {
        return std::tie(lhs.row, lhs.column) < std::tie(rhs.row, rhs.column);
    }
    friend bool operator<=(const SourcePoint& lhs, const SourcePoint& rhs)
    {
        return !(rhs < lhs);
    }
};

/// @brief Half-open byte span plus the matching start/end points.
struct SourceRange
{
    /// @brief Offset of the first byte.
    std::size_t startByte{0};

    /// @brief Offset one past the last byte.
    std::size_t endByte{0};

    /// @brief Start point.
    SourcePoint start;

    /// @brief End point (exclusive column).
    SourcePoint end;

    /// @brief Returns whether `point` lies inside the span, end inclusive.
    [[nodiscard]] bool covers(const SourcePoint& point) const
    {
        return start <= point && point <= end;
    }

    friend bool operator==(const SourceRange& lhs, const SourceRange& rhs)
    {
        return lhs.startByte == rhs.startByte && lhs.endByte == rhs.endByte && lhs.start == rhs.start &&
               lhs.end == rhs.end;
    }
};

}  // namespace fabls

#endif  // FABLS_FRONTEND_SOURCE_LOCATION_H
