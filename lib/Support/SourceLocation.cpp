//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements source-location rendering helpers.
///
/// This file contains utility formatting logic for presenting file, line, and column coordinates.
///
//===----------------------------------------------------------------------===//

#include "fabls/Frontend/SourceLocation.h"

#include <sstream>

namespace fabls
{

std::string SourceLocation::str() const
{
    std::ostringstream out;
    out << file << ':' << line << ':' << column;
    return out.str();
}

}  // namespace fabls
