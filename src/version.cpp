//===----------------------------------------------------------------------===//
//
// Part of the SyndrQL project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/version.cpp
// Purpose: Provide the version query for the SyndrQL language service.
// Key invariants: Returned string remains valid for the process lifetime and
//                 matches the project version recorded in CMake metadata.
// Ownership/Lifetime: Returns a pointer to a string with static storage
//                     duration; callers must not attempt to free it.
//
//===----------------------------------------------------------------------===//

#include "syndrql/version.hpp"

namespace syndrql
{
/// @brief Report the semantic version string of the language service.
/// @return Pointer to a string containing the "major.minor.patch" version.
const char *syndrql_version() noexcept
{
    return "0.1.0";
}
} // namespace syndrql
