#include "git_nonce.hpp"
#include "search_log.hpp"
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <ostream>
#include <omp.h>

static void printUsage(const char* prog, std::ostream& err)
{
    err << "Usage: " << prog << " [options]\n";
    err << "  --pattern <re>        desired hash pattern (default: ^[01]{7})\n";
    err << "  --cpus <n>            worker threads (default: number of processors)\n";
    err << "  --nonce-name <name>   header field to add to the commit (default: nonce)\n";
    err << "  --nonce-chars <chars> symbols used in the nonce value (default: 0123456789)\n";
    err << "  --force               search even if HEAD already matches\n";
    err << "  --repo <path>         repository to work on (default: .)\n";
    err << "  --max-candidate <n>   give up after this many candidates (default: none)\n";
    err << "  --log-dir <dir>       append a CSV row per run to <dir>/search_log.csv\n";
}

bool parseUnsigned(const std::string& text, unsigned long long& value)
{
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    value = std::strtoull(text.c_str(), &end, 10);
    if (errno == ERANGE) {
        return false;
    }
    return end != nullptr && *end == '\0';
}

int parseGitNonceArgs(int argc, char* argv[], GitNonceOptions& opts, std::ostream& err)
{
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0], err);
            return 1;
        }
        if (arg == "--force") {
            opts.force = true;
            continue;
        }

        if (i + 1 >= argc) {
            err << "Error: missing value for " << arg << "\n";
            printUsage(argv[0], err);
            return 1;
        }
        const std::string value = argv[++i];
        unsigned long long number = 0;

        if (arg == "--pattern") {
            opts.search.pattern = value;
        } else if (arg == "--cpus") {
            if (!parseUnsigned(value, number) || number == 0 || number > 4096) {
                err << "Error: --cpus must be between 1 and 4096\n";
                return 1;
            }
            opts.search.workers = static_cast<int>(number);
        } else if (arg == "--nonce-name") {
            opts.search.fieldName = value;
        } else if (arg == "--nonce-chars") {
            opts.search.alphabet = value;
        } else if (arg == "--repo") {
            opts.repo = value;
        } else if (arg == "--max-candidate") {
            if (!parseUnsigned(value, number)) {
                err << "Error: --max-candidate must be a non-negative integer\n";
                return 1;
            }
            opts.search.maxCandidate = number;
        } else if (arg == "--log-dir") {
            opts.logDir = value;
        } else {
            err << "Error: unknown option " << arg << "\n";
            printUsage(argv[0], err);
            return 1;
        }
    }
    return 0;
}

int runGitNonce(GitRepository& repo, const GitNonceOptions& opts,
                const std::string& reflogMessage,
                std::ostream& out, std::ostream& err)
{
    std::string error;
    std::string headId;
    ObjectBuffer head;
    if (!repo.readHead(headId, head, error)) {
        err << "Error: " << error << std::endl;
        return 1;
    }

    if (!opts.force && matchesPattern(opts.search.pattern, headId)) {
        out << "gitnonce: " << headId << " (already matches)" << std::endl;
        return 0;
    }

    const int numWorkers = opts.search.workers > 0 ? opts.search.workers : omp_get_num_procs();

    out << "=============================================================\n";
    out << "       GIT COMMIT HASH SEARCH - OPENMP\n";
    out << "=============================================================\n";
    out << "HEAD       : " << headId << "\n";
    out << "Object     : " << head << "\n";
    out << "Pattern    : " << opts.search.pattern << "\n";
    out << "Threads    : " << numWorkers << "\n";
    out << "Field      : " << opts.search.fieldName << "\n";
    out << "Alphabet   : " << opts.search.alphabet << "\n";
    out << std::endl;

    auto start = std::chrono::high_resolution_clock::now();
    SearchResult result = searchNonce(head, opts.search);
    auto end = std::chrono::high_resolution_clock::now();

    double elapsed = std::chrono::duration<double>(end - start).count();
    long long attempts = getAttemptCount();

    out << "Status     : " << statusName(result.status) << "\n";
    out << std::fixed << std::setprecision(3);
    out << "Time       : " << elapsed << " s\n";
    out << "Attempts   : " << attempts << "\n";
    out << std::scientific << std::setprecision(2);
    out << "Hashes/sec : " << (elapsed > 0.0 ? attempts / elapsed : 0.0) << "\n";
    out << std::defaultfloat;

    std::string newId;
    int exitCode = 0;

    if (result.status != SearchStatus::Found) {
        err << "Error: search " << statusName(result.status) << ": " << result.error << std::endl;
        exitCode = 1;
    } else if (!repo.writeObject(result.winner, newId, error)) {
        err << "Error: " << error << std::endl;
        exitCode = 1;
    } else if (newId != result.digest) {
        err << "Error: stored object " << newId << " does not match searched digest "
            << result.digest << std::endl;
        exitCode = 1;
    } else if (!repo.updateHead(newId, reflogMessage, error)) {
        err << "Error: " << error << std::endl;
        exitCode = 1;
    }

    if (!opts.logDir.empty()) {
        SearchLog log(opts.logDir);
        if (!log.logSearch(opts.search.pattern, result.workers, opts.search.alphabet,
                           statusName(result.status), attempts, elapsed, newId)) {
            err << "Warning: could not write " << log.filename() << std::endl;
        }
    }

    if (exitCode == 0) {
        out << "Candidate  : " << result.candidate << "\n";
        out << "=============================================================\n";
        out << "gitnonce: " << newId << std::endl;
    }
    return exitCode;
}
