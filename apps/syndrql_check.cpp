//===----------------------------------------------------------------------===//
//
// Part of the SyndrQL project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the `syndrql-check` utility. The program loads a SyndrQL script,
// validates every statement with the production language service, and prints
// one diagnostic per line in `<file>:<line>:<column>: error[<code>]: <message>`
// form using 1-based positions.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Entry point for the SyndrQL checker CLI.

#include "syndrql/config/config.hpp"
#include "syndrql/highlight/syntax_highlighter.hpp"
#include "syndrql/support/log.hpp"
#include "syndrql/version.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace
{
constexpr const char *kUsageMessage = "usage: syndrql-check <file.sql>\n"
                                      "       syndrql-check --version\n"
                                      "Reads settings from $SYNDRQL_CONFIG when set.\n";
} // namespace

/// @brief Entry point for the SyndrQL checker.
///
/// @details Loads optional configuration named by the SYNDRQL_CONFIG
///          environment variable, validates all statements in the input file
///          and prints their diagnostics to stdout.
///
/// @param argc Argument count supplied by the C runtime.
/// @param argv Argument vector supplied by the C runtime.
/// @return Zero when every statement is valid; one on usage errors, unreadable
///         input, or when any diagnostic was reported.
int main(int argc, char **argv)
{
    if (argc != 2)
    {
        std::cerr << kUsageMessage;
        return 1;
    }
    const std::string_view arg = argv[1];
    if (arg == "--version")
    {
        std::cout << "syndrql-check " << syndrql::syndrql_version() << "\n";
        return 0;
    }

    syndrql::config::Config cfg;
    if (const char *cfgPath = std::getenv("SYNDRQL_CONFIG"))
    {
        if (!syndrql::config::loadFromFile(cfgPath, cfg))
        {
            std::cerr << "cannot open config " << cfgPath << "\n";
            return 1;
        }
    }

    std::ifstream in(argv[1]);
    if (!in)
    {
        std::cerr << "cannot open " << argv[1] << "\n";
        return 1;
    }
    std::ostringstream ss;
    ss << in.rdbuf();

    syndrql::support::LogSink log(std::cerr, cfg.log);
    syndrql::highlight::SyntaxHighlighter highlighter(
        syndrql::config::highlighterOptions(cfg), syndrql::highlight::steadyClock(), &log);
    highlighter.updateDocumentContext(ss.str());
    highlighter.validateAll();

    const auto diags = highlighter.diagnostics();
    for (const auto &d : diags)
    {
        std::cout << argv[1] << ":" << d.line + 1 << ":" << d.column + 1 << ": error[" << d.code
                  << "]: " << d.message << "\n";
        if (d.suggestion)
            std::cout << "  note: " << *d.suggestion << "\n";
    }

    log.info("check",
             std::to_string(highlighter.statements().size()) + " statements, " +
                 std::to_string(diags.size()) + " diagnostics");
    return diags.empty() ? 0 : 1;
}
