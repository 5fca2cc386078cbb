// =============================================================================
// GIT REPOSITORY TEST HARNESS
// =============================================================================
// Runs the full read HEAD -> search -> write -> update-ref cycle against a
// throw-away repository created with libgit2.
// =============================================================================

#include "git_nonce.hpp"
#include "git_repo.hpp"
#include "nonce_search.hpp"
#include "object_hash.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <git2.h>

namespace fs = std::filesystem;

const std::string EMPTY_TREE_ID = "4b825dc642cb6eb9a060e54bf8d69288fbee4904";

const std::string COMMIT_CONTENT =
    "tree 4b825dc642cb6eb9a060e54bf8d69288fbee4904\n"
    "author A U Thor <author@example.com> 1112911993 -0700\n"
    "committer C O Mitter <committer@example.com> 1112911993 -0700\n"
    "\n"
    "Initial commit\n";

fs::path uniqueDir(const std::string& prefix) {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    return fs::temp_directory_path() / (prefix + std::to_string(stamp));
}

// Fresh repository with one commit on refs/heads/work, HEAD attached to it
bool createRepository(const fs::path& dir, std::string& commitId) {
    git_repository* raw = nullptr;
    if (git_repository_init(&raw, dir.string().c_str(), 0) != 0) {
        std::cerr << "ERROR: git init failed\n";
        return false;
    }
    git_repository_free(raw);

    GitRepository repo;
    std::string error, treeId;
    if (!repo.open(dir.string(), error) ||
        !repo.writeObject(ObjectBuffer::fromContent("tree", ""), treeId, error) ||
        !repo.writeObject(ObjectBuffer::fromContent("commit", COMMIT_CONTENT), commitId, error)) {
        std::cerr << "ERROR: " << error << "\n";
        return false;
    }
    if (treeId != EMPTY_TREE_ID) {
        std::cerr << "ERROR: empty tree stored as " << treeId << "\n";
        return false;
    }

    if (git_repository_open(&raw, dir.string().c_str()) != 0) {
        return false;
    }
    git_oid oid;
    git_reference* ref = nullptr;
    bool ok = git_oid_fromstr(&oid, commitId.c_str()) == 0 &&
              git_reference_create(&ref, raw, "refs/heads/work", &oid, 1, "test: create") == 0 &&
              git_repository_set_head(raw, "refs/heads/work") == 0;
    git_reference_free(ref);
    git_repository_free(raw);
    return ok;
}

bool testOpenFailure() {
    std::cout << "=== Testing Open Failure ===\n";
    std::cout << "Testing non-repository directory... ";

    const fs::path dir = fs::temp_directory_path() / "gitnonce_not_a_repo";
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir, ec);

    GitRepository repo;
    std::string error;
    // The temp directory may itself sit inside a repository; only a missing
    // path is guaranteed to fail
    const bool ok = !repo.open((dir / "missing").string(), error) && !error.empty();
    fs::remove_all(dir, ec);

    if (ok) {
        std::cout << "PASSED (" << error << ")\n";
    } else {
        std::cout << "FAILED\n";
    }
    return ok;
}

bool testFullCycle() {
    std::cout << "\n=== Testing Full Cycle ===\n";
    bool allPassed = true;

    const fs::path dir = uniqueDir("gitnonce_test_");
    std::error_code ec;

    std::string initialId;
    std::cout << "Testing repository setup... ";
    if (!createRepository(dir, initialId)) {
        std::cout << "FAILED\n";
        fs::remove_all(dir, ec);
        return false;
    }
    std::cout << "PASSED\n";

    GitRepository repo;
    std::string error;
    repo.open(dir.string(), error);

    std::cout << "Testing read HEAD... ";
    std::string headId;
    ObjectBuffer head;
    if (repo.readHead(headId, head, error) && headId == initialId &&
        head.content() == COMMIT_CONTENT && sha1Hex(head.bytes()) == headId) {
        std::cout << "PASSED\n";
    } else {
        std::cout << "FAILED (" << error << ")\n";
        allPassed = false;
    }

    std::cout << "Testing search, write and update-ref... ";
    {
        SearchConfig config;
        config.pattern = "^00";
        config.workers = 2;

        SearchResult result = searchNonce(head, config);
        std::string newId, newHeadId;
        ObjectBuffer newHead;

        const bool ok =
            result.status == SearchStatus::Found &&
            repo.writeObject(result.winner, newId, error) &&
            newId == result.digest &&
            repo.updateHead(newId, "gitnonce test", error) &&
            repo.readHead(newHeadId, newHead, error) &&
            newHeadId == newId &&
            newHead.bytes() == result.winner.bytes() &&
            newHeadId.compare(0, 2, "00") == 0;

        if (ok) {
            std::cout << "PASSED (" << newHeadId << ")\n";
        } else {
            std::cout << "FAILED (" << error << ")\n";
            allPassed = false;
        }
    }

    std::cout << "Testing update-ref rejects bad id... ";
    {
        std::string badError;
        if (!repo.updateHead("not-a-hash", "gitnonce test", badError) && !badError.empty()) {
            std::cout << "PASSED (correctly rejected)\n";
        } else {
            std::cout << "FAILED\n";
            allPassed = false;
        }
    }

    fs::remove_all(dir, ec);
    return allPassed;
}

bool testAlreadyMatches() {
    std::cout << "\n=== Testing Already-Matching HEAD ===\n";
    const fs::path dir = uniqueDir("gitnonce_match_");
    std::error_code ec;
    bool ok = true;

    std::string initialId;
    std::cout << "Testing HEAD is left alone without --force... ";
    if (!createRepository(dir, initialId)) {
        std::cout << "FAILED (setup)\n";
        fs::remove_all(dir, ec);
        return false;
    }

    GitRepository repo;
    std::string error;
    repo.open(dir.string(), error);

    GitNonceOptions opts;
    opts.search.pattern = "^[0-9a-f]";
    opts.search.workers = 2;
    std::ostringstream out, err;
    const int rc = runGitNonce(repo, opts, "gitnonce test", out, err);

    std::string headId;
    ObjectBuffer head;
    repo.readHead(headId, head, error);

    if (rc == 0 && headId == initialId &&
        out.str() == "gitnonce: " + initialId + " (already matches)\n" &&
        err.str().empty()) {
        std::cout << "PASSED\n";
    } else {
        std::cout << "FAILED (rc=" << rc << ", " << out.str() << err.str() << ")\n";
        ok = false;
    }

    fs::remove_all(dir, ec);
    return ok;
}

bool testForceSearch() {
    std::cout << "\n=== Testing Forced Search ===\n";
    const fs::path dir = uniqueDir("gitnonce_force_");
    const fs::path logDir = dir / "logs";
    std::error_code ec;
    bool ok = true;

    std::string initialId;
    std::cout << "Testing --force moves HEAD and logs the run... ";
    if (!createRepository(dir, initialId)) {
        std::cout << "FAILED (setup)\n";
        fs::remove_all(dir, ec);
        return false;
    }

    GitRepository repo;
    std::string error;
    repo.open(dir.string(), error);

    GitNonceOptions opts;
    opts.search.pattern = "^[0-9a-f]";
    opts.search.workers = 2;
    opts.force = true;
    opts.logDir = logDir.string();
    std::ostringstream out, err;
    const int rc = runGitNonce(repo, opts, "gitnonce --force", out, err);

    std::string headId;
    ObjectBuffer head;
    repo.readHead(headId, head, error);

    std::ifstream log((logDir / "search_log.csv").string());
    std::string header, row, extra;
    std::getline(log, header);
    std::getline(log, row);
    const bool oneRow = !std::getline(log, extra);

    if (rc == 0 && headId != initialId &&
        head.content().find("\nnonce ") != std::string::npos &&
        out.str().find("gitnonce: " + headId + "\n") != std::string::npos &&
        header.compare(0, 15, "timestamp,date,") == 0 &&
        row.find("found") != std::string::npos &&
        row.find(headId) != std::string::npos && oneRow) {
        std::cout << "PASSED (" << headId << ")\n";
    } else {
        std::cout << "FAILED (rc=" << rc << ", " << err.str() << ")\n";
        ok = false;
    }

    fs::remove_all(dir, ec);
    return ok;
}

bool testArgumentParsing() {
    std::cout << "\n=== Testing Argument Parsing ===\n";
    bool allPassed = true;

    std::cout << "Testing full flag set... ";
    {
        const char* args[] = {"gitnonce", "--pattern", "^00", "--cpus", "3",
                              "--nonce-name", "salt", "--nonce-chars", "ab",
                              "--force", "--repo", "/tmp/r", "--max-candidate", "77",
                              "--log-dir", "logs"};
        GitNonceOptions opts;
        std::ostringstream err;
        const int rc = parseGitNonceArgs(16, const_cast<char**>(args), opts, err);
        if (rc == 0 && opts.search.pattern == "^00" && opts.search.workers == 3 &&
            opts.search.fieldName == "salt" && opts.search.alphabet == "ab" &&
            opts.force && opts.repo == "/tmp/r" && opts.search.maxCandidate == 77 &&
            opts.logDir == "logs") {
            std::cout << "PASSED\n";
        } else {
            std::cout << "FAILED (" << err.str() << ")\n";
            allPassed = false;
        }
    }

    std::cout << "Testing 64-bit overflow is rejected... ";
    {
        unsigned long long value = 0;
        const char* args[] = {"gitnonce", "--max-candidate", "99999999999999999999999"};
        GitNonceOptions opts;
        std::ostringstream err;
        if (!parseUnsigned("99999999999999999999999", value) &&
            !parseUnsigned("18446744073709551616", value) &&
            parseUnsigned("18446744073709551615", value) && value == 18446744073709551615ULL &&
            parseGitNonceArgs(3, const_cast<char**>(args), opts, err) != 0 &&
            opts.search.maxCandidate == 0) {
            std::cout << "PASSED (correctly rejected)\n";
        } else {
            std::cout << "FAILED\n";
            allPassed = false;
        }
    }

    std::cout << "Testing malformed numbers and unknown flags... ";
    {
        unsigned long long value = 0;
        const char* unknown[] = {"gitnonce", "--frobnicate", "1"};
        const char* missing[] = {"gitnonce", "--pattern"};
        const char* zeroCpus[] = {"gitnonce", "--cpus", "0"};
        GitNonceOptions opts;
        std::ostringstream err;
        if (!parseUnsigned("", value) && !parseUnsigned("-1", value) &&
            !parseUnsigned("12a", value) && !parseUnsigned(" 5", value) &&
            parseGitNonceArgs(3, const_cast<char**>(unknown), opts, err) != 0 &&
            parseGitNonceArgs(2, const_cast<char**>(missing), opts, err) != 0 &&
            parseGitNonceArgs(3, const_cast<char**>(zeroCpus), opts, err) != 0) {
            std::cout << "PASSED (correctly rejected)\n";
        } else {
            std::cout << "FAILED\n";
            allPassed = false;
        }
    }

    return allPassed;
}

int main() {
    std::cout << "============================================\n";
    std::cout << "  Git Repository Test Suite\n";
    std::cout << "============================================\n\n";

    // Keeps libgit2 initialised for the raw calls in createRepository
    GitRepository session;

    bool allPassed = true;

    allPassed &= testOpenFailure();
    allPassed &= testFullCycle();
    allPassed &= testAlreadyMatches();
    allPassed &= testForceSearch();
    allPassed &= testArgumentParsing();

    std::cout << "\n============================================\n";
    if (allPassed) {
        std::cout << "  ALL TESTS PASSED\n";
    } else {
        std::cout << "  SOME TESTS FAILED\n";
    }
    std::cout << "============================================\n";

    return allPassed ? 0 : 1;
}
