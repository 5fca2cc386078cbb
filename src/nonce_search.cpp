#include "nonce_search.hpp"
#include "candidate_queue.hpp"
#include "object_hash.hpp"
#include <atomic>
#include <regex>
#include <thread>
#include <utility>
#include <omp.h>

static std::atomic<long long> attemptCount{0};

const char* statusName(SearchStatus status)
{
    switch (status) {
    case SearchStatus::Found:           return "found";
    case SearchStatus::Exhausted:       return "exhausted";
    case SearchStatus::InvalidConfig:   return "invalid-config";
    case SearchStatus::MalformedObject: return "malformed-object";
    case SearchStatus::HashFailure:     return "hash-failure";
    }
    return "unknown";
}

static bool checkSettings(const SearchConfig& config, std::string& error)
{
    if (!isValidAlphabet(config.alphabet)) {
        error = "nonce alphabet needs at least 2 distinct characters, none of space, newline or NUL";
        return false;
    }
    if (!isValidFieldName(config.fieldName)) {
        error = "nonce field name must be non-empty and contain no space, newline or NUL";
        return false;
    }
    if (config.workers < 0) {
        error = "worker count must not be negative";
        return false;
    }
    if (config.queueCapacity == 0) {
        error = "candidate queue capacity must be positive";
        return false;
    }
    return true;
}

bool validateConfig(const SearchConfig& config, std::string& error)
{
    std::regex re;
    return checkSettings(config, error) && compilePattern(config.pattern, re, error);
}

bool compilePattern(const std::string& pattern, std::regex& re, std::string& error)
{
    try {
        re.assign(pattern, std::regex::ECMAScript | std::regex::optimize);
    } catch (const std::regex_error& e) {
        error = "pattern \"" + pattern + "\" is not a valid regexp: " + e.what();
        return false;
    }
    return true;
}

bool matchesPattern(const std::string& pattern, const std::string& text)
{
    std::regex re;
    std::string error;
    if (!compilePattern(pattern, re, error)) return false;
    return std::regex_search(text, re);
}

// =============================================================================
// WORKER - one per OpenMP thread
// =============================================================================
// Returns false only if the digest context failed. On a match the buffer
// holds the winning object and `candidate` the value rendered into it.
// =============================================================================
static bool runWorker(ObjectBuffer& obj, NonceField& field,
                      const std::string& alphabet,
                      const std::regex& re,
                      CandidateQueue& queue,
                      const std::atomic<bool>& done,
                      long long& localAttempts,
                      bool& matched,
                      uint64_t& candidate,
                      char* hex)
{
    ObjectHasher hasher;
    bool prefixValid = false;
    matched = false;

    while (queue.pop(candidate)) {
        if (done.load(std::memory_order_acquire)) {
            break;
        }

        // Width only grows, so this terminates
        while (!renderCandidate(obj, field, candidate, alphabet)) {
            growField(obj, field, alphabet[0]);
            prefixValid = false;
        }

        const size_t tail = obj.headerSize() + field.valueStart;
        if (!prefixValid) {
            if (!hasher.setPrefix(obj.data(), tail)) {
                return false;
            }
            prefixValid = true;
        }

        if (!hasher.digestHex(obj.data() + tail, obj.size() - tail, hex)) {
            return false;
        }
        ++localAttempts;

        if (std::regex_search(hex, hex + DIGEST_HEX_SIZE, re)) {
            matched = true;
            break;
        }
    }
    return true;
}

// =============================================================================
// MAIN SEARCH FUNCTION
// =============================================================================
SearchResult searchNonce(const ObjectBuffer& object, const SearchConfig& config)
{
    SearchResult result;
    attemptCount.store(0, std::memory_order_relaxed);

    std::regex re;
    if (!checkSettings(config, result.error) ||
        !compilePattern(config.pattern, re, result.error)) {
        result.status = SearchStatus::InvalidConfig;
        return result;
    }

    // Locate once on the template; every worker clones the located buffer
    ObjectBuffer templ = object;
    NonceField templField;
    if (!locateOrCreateField(templ, config.fieldName, config.alphabet[0],
                             templField, result.error)) {
        result.status = SearchStatus::MalformedObject;
        return result;
    }

    const int numWorkers = config.workers > 0 ? config.workers : omp_get_num_procs();
    result.workers = numWorkers;

    CandidateQueue queue(config.queueCapacity);
    std::atomic<bool> done{false};
    bool found = false;
    bool hashFailed = false;

    std::thread producer([&queue, &config] {
        enumerateCandidates(queue, 1, config.maxCandidate);
    });

    #pragma omp parallel num_threads(numWorkers) shared(queue, done, found, hashFailed, result)
    {
        ObjectBuffer obj = templ;
        NonceField field = templField;
        long long localAttempts = 0;
        bool matched = false;
        uint64_t candidate = 0;
        char hex[DIGEST_HEX_SIZE];

        const bool hashed = runWorker(obj, field, config.alphabet, re, queue, done,
                                      localAttempts, matched, candidate, hex);

        attemptCount.fetch_add(localAttempts, std::memory_order_relaxed);

        if (!hashed || matched) {
            #pragma omp critical(publish_winner)
            {
                if (!found && !hashFailed) {
                    if (hashed) {
                        found = true;
                        result.winner = std::move(obj);
                        result.field = field;
                        result.digest.assign(hex, DIGEST_HEX_SIZE);
                        result.candidate = candidate;
                    } else {
                        hashFailed = true;
                        result.error = "SHA-1 digest context failed";
                    }
                }
            }
            done.store(true, std::memory_order_release);
            queue.close();
        }
    }

    queue.close();
    producer.join();

    if (found) {
        result.status = SearchStatus::Found;
    } else if (hashFailed) {
        result.status = SearchStatus::HashFailure;
    } else {
        result.status = SearchStatus::Exhausted;
        result.error = "candidate space exhausted without a match";
    }
    return result;
}

long long getAttemptCount()
{
    return attemptCount.load(std::memory_order_relaxed);
}
