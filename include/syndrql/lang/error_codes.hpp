//===----------------------------------------------------------------------===//
//
// Part of the SyndrQL project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/syndrql/lang/error_codes.hpp
// Purpose: Centralized diagnostic codes for the SyndrQL language service.
// Key invariants: All codes are unique and follow the Q#### format.
// Ownership/Lifetime: Static constants with program lifetime.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string_view>

namespace syndrql::lang::diag
{

/// Lexical error codes (Q1000-Q1999)
constexpr std::string_view InvalidToken = "Q1001";
constexpr std::string_view UnterminatedString = "Q1002";
constexpr std::string_view InvalidNumberFormat = "Q1003";
constexpr std::string_view UnterminatedComment = "Q1004";

/// Statement structure error codes (Q2000-Q2999)
constexpr std::string_view EmptyStatement = "Q2001";
constexpr std::string_view UnrecognizedCommand = "Q2002";
constexpr std::string_view SelectMissingTarget = "Q2101";
constexpr std::string_view SelectMissingFrom = "Q2102";
constexpr std::string_view SelectInvalidKeywordSequence = "Q2103";
constexpr std::string_view InsertMissingInto = "Q2201";
constexpr std::string_view UpdateMissingSet = "Q2301";
constexpr std::string_view UpdateMissingBundle = "Q2302";
constexpr std::string_view DeleteMissingFrom = "Q2401";
constexpr std::string_view AddMissingTo = "Q2501";
constexpr std::string_view CreateMissingObject = "Q2601";

/// Grammar alignment error codes (Q3000-Q3999)
constexpr std::string_view UnexpectedToken = "Q3001";
constexpr std::string_view SyntaxError = "Q3002";
constexpr std::string_view IncompleteStatement = "Q3003";

} // namespace syndrql::lang::diag
