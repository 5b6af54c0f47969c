// include/syndrql/version.hpp
#pragma once

/// @brief Returns the SyndrQL language service version string.
/// @invariant The returned pointer is non-null and points to a null-terminated string.
/// @ownership The returned string has static storage duration and must not be freed.
namespace syndrql
{
const char *syndrql_version() noexcept;
} // namespace syndrql
