#pragma once

#include "git_repo.hpp"
#include "nonce_search.hpp"
#include <iosfwd>
#include <string>

// =============================================================================
// GITNONCE RUN - HEAD -> search -> hash-object -> update-ref
// =============================================================================

struct GitNonceOptions {
    SearchConfig search;
    bool force = false;         // search even if HEAD already matches
    std::string repo = ".";
    std::string logDir;         // empty = no CSV run log
};

// Strict decimal parse; rejects signs, blanks and values past 64 bits
bool parseUnsigned(const std::string& text, unsigned long long& value);

// Fills opts from the command line. Returns 0 to continue, otherwise the
// process exit code (usage and errors are written to `err`).
int parseGitNonceArgs(int argc, char* argv[], GitNonceOptions& opts, std::ostream& err);

// Runs one search against an open repository. Progress goes to `out`,
// errors to `err`. Returns the process exit code; HEAD is only moved when a
// verified winner has been stored.
int runGitNonce(GitRepository& repo, const GitNonceOptions& opts,
                const std::string& reflogMessage,
                std::ostream& out, std::ostream& err);
