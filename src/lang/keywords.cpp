//===----------------------------------------------------------------------===//
//
// Part of the SyndrQL project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/lang/keywords.cpp
// Purpose: Keyword table and operator/punctuation classification.
// Key invariants: kKeywords is strictly sorted by lexeme (checked at compile
//                 time) so binary search is valid.
//
//===----------------------------------------------------------------------===//

#include "syndrql/lang/keywords.hpp"

#include "syndrql/support/char_utils.hpp"
#include "syndrql/support/keyword_table.hpp"

#include <array>
#include <string>

namespace syndrql::lang
{

namespace
{
using KC = KeywordCategory;
using support::keyword_table::isKeywordTableSorted;
using support::keyword_table::lookupKeywordBinary;

// Sorted alphabetically for binary search.
constexpr std::array<KeywordInfo, 81> kKeywords = {{
    {"ADD", KC::DML, "Adds data or properties"},
    {"ALTER", KC::DDL, "Alters database objects"},
    {"AND", KC::Logical, "Logical AND"},
    {"ARRAY", KC::Types, "Array data type"},
    {"ASC", KC::DQL, "Ascending sort order"},
    {"ATTACH", KC::Admin, "Attaches an external resource"},
    {"AVG", KC::Functions, "Calculates average"},
    {"BETWEEN", KC::Logical, "Range comparison"},
    {"BOOLEAN", KC::Types, "Boolean true/false type"},
    {"BTREE", KC::Objects, "B-tree index type"},
    {"BUNDLE", KC::Objects, "Data bundle/collection"},
    {"BUNDLES", KC::Objects, "Multiple bundles"},
    {"BY", KC::DQL, "Specifies ordering or grouping field"},
    {"CONCAT", KC::Functions, "Concatenates strings"},
    {"COUNT", KC::Functions, "Counts records"},
    {"CREATE", KC::DDL, "Creates database objects"},
    {"DATABASE", KC::Objects, "Database container"},
    {"DATABASES", KC::Objects, "Multiple databases"},
    {"DATE", KC::Types, "Date data type"},
    {"DELETE", KC::DDL, "Deletes database objects"},
    {"DESC", KC::DQL, "Descending sort order"},
    {"DOCUMENT", KC::DML, "References a document"},
    {"DOCUMENTS", KC::DML, "References multiple documents"},
    {"DROP", KC::DDL, "Drops database objects"},
    {"EXISTS", KC::Logical, "Existence check"},
    {"FALSE", KC::Literals, "Boolean false"},
    {"FIELD", KC::DML, "References a bundle field"},
    {"FIELDS", KC::DML, "Introduces a field list"},
    {"FLOAT", KC::Types, "Floating point type"},
    {"FOR", KC::Admin, "Scopes a listing to a database"},
    {"FROM", KC::DQL, "Specifies source bundle/table"},
    {"GRANT", KC::Admin, "Grants a permission"},
    {"GROUP", KC::DQL, "Groups result set"},
    {"HASH", KC::Objects, "Hash index type"},
    {"HAVING", KC::DQL, "Filters grouped results"},
    {"IN", KC::DML, "Specifies scope or container"},
    {"INDEX", KC::Objects, "Database index"},
    {"INNER", KC::DQL, "Inner join type"},
    {"INSERT", KC::DML, "Inserts new data"},
    {"INTEGER", KC::Types, "Integer number type"},
    {"INTO", KC::DML, "Specifies insertion target"},
    {"INVALIDATE", KC::Admin, "Invalidates a session"},
    {"IS", KC::Logical, "Identity comparison"},
    {"JOIN", KC::DQL, "Joins multiple bundles"},
    {"KEY", KC::Objects, "Key constraint"},
    {"LEFT", KC::DQL, "Left join type"},
    {"LENGTH", KC::Functions, "Gets string length"},
    {"LIKE", KC::Logical, "Pattern matching"},
    {"LIMIT", KC::DQL, "Limits result count"},
    {"LOWER", KC::Functions, "Converts to lowercase"},
    {"MAX", KC::Functions, "Finds maximum value"},
    {"MIN", KC::Functions, "Finds minimum value"},
    {"NOT", KC::Logical, "Logical NOT"},
    {"NULL", KC::Logical, "Null value"},
    {"OBJECT", KC::Types, "Object data type"},
    {"OFFSET", KC::DQL, "Skips initial results"},
    {"ON", KC::DQL, "Specifies join conditions"},
    {"OR", KC::Logical, "Logical OR"},
    {"ORDER", KC::DQL, "Orders result set"},
    {"OUTER", KC::DQL, "Outer join type"},
    {"PRIMARY", KC::Objects, "Primary key"},
    {"RATE", KC::Admin, "Rate limit settings"},
    {"RIGHT", KC::DQL, "Right join type"},
    {"SELECT", KC::DQL, "Retrieves data from bundles"},
    {"SESSION", KC::Admin, "Client session"},
    {"SET", KC::DML, "Sets field values"},
    {"SHOW", KC::Admin, "Lists server objects"},
    {"STRING", KC::Types, "Text data type"},
    {"SUBSTRING", KC::Functions, "Extracts substring"},
    {"SUM", KC::Functions, "Sums numeric values"},
    {"TIME", KC::Types, "Time data type"},
    {"TIMESTAMP", KC::Types, "Timestamp data type"},
    {"TO", KC::DML, "Specifies target"},
    {"TRUE", KC::Literals, "Boolean true"},
    {"UNIQUE", KC::Objects, "Unique constraint"},
    {"UPDATE", KC::DDL, "Updates existing data or structures"},
    {"UPPER", KC::Functions, "Converts to uppercase"},
    {"USE", KC::Admin, "Selects the active database"},
    {"VALUES", KC::DML, "Specifies literal values"},
    {"WHERE", KC::DQL, "Filters data based on conditions"},
    {"WITH", KC::DML, "Specifies additional parameters"},
}};

static_assert(isKeywordTableSorted(kKeywords), "keyword table must be sorted");

constexpr std::array<std::string_view, 15> kOperators = {
    "=", "==", "!=", "<>", "<", ">", "<=", ">=", "+", "-", "*", "/", "%", "!", "||"};

} // namespace

std::string_view keywordCategoryName(KeywordCategory category) noexcept
{
    switch (category)
    {
        case KeywordCategory::DDL:
            return "DDL";
        case KeywordCategory::DQL:
            return "DQL";
        case KeywordCategory::DML:
            return "DML";
        case KeywordCategory::Objects:
            return "Objects";
        case KeywordCategory::Logical:
            return "Logical";
        case KeywordCategory::Functions:
            return "Functions";
        case KeywordCategory::Types:
            return "Types";
        case KeywordCategory::Admin:
            return "Admin";
        case KeywordCategory::Literals:
            return "Literals";
    }
    return "";
}

const KeywordInfo *lookupKeyword(std::string_view word)
{
    // Longest keyword is INVALIDATE/TIMESTAMP/SUBSTRING; anything longer misses.
    if (word.empty() || word.size() > 10)
        return nullptr;
    const std::string upper = support::char_utils::toUppercase(word);
    return lookupKeywordBinary(kKeywords, upper);
}

std::span<const KeywordInfo> allKeywords() noexcept
{
    return kKeywords;
}

bool isOperator(std::string_view op) noexcept
{
    for (std::string_view candidate : kOperators)
    {
        if (candidate == op)
            return true;
    }
    return false;
}

bool isPunctuation(char c) noexcept
{
    switch (c)
    {
        case '(':
        case ')':
        case '{':
        case '}':
        case '[':
        case ']':
        case ',':
        case ';':
        case ':':
        case '.':
        case '?':
            return true;
        default:
            return false;
    }
}

} // namespace syndrql::lang
