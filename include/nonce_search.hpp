#pragma once

#include "object_buffer.hpp"
#include <cstddef>
#include <cstdint>
#include <regex>
#include <string>

// =============================================================================
// NONCE SEARCH - OpenMP worker team fed by a bounded candidate queue
// =============================================================================
// Each worker owns a clone of the object, renders candidates into the nonce
// field, hashes the framed buffer and tests the hex digest against the
// pattern. The first match is published; the rest of the team stops at its
// next candidate.
// =============================================================================

constexpr size_t DEFAULT_QUEUE_CAPACITY = 512;

struct SearchConfig {
    std::string pattern = "^[01]{7}";   // ECMAScript regex over the hex digest
    int workers = 0;                    // 0 = number of processors
    std::string fieldName = "nonce";
    std::string alphabet = "0123456789";
    uint64_t maxCandidate = 0;          // 0 = until the counter wraps
    size_t queueCapacity = DEFAULT_QUEUE_CAPACITY;
};

enum class SearchStatus {
    Found,
    Exhausted,
    InvalidConfig,
    MalformedObject,
    HashFailure,
};

struct SearchResult {
    SearchStatus status = SearchStatus::Exhausted;
    ObjectBuffer winner;
    NonceField field;
    std::string digest;         // lowercase hex of the winner
    uint64_t candidate = 0;
    int workers = 0;
    std::string error;
};

const char* statusName(SearchStatus status);

bool validateConfig(const SearchConfig& config, std::string& error);

// Compile the pattern once; callers use it to fail before any I/O
bool compilePattern(const std::string& pattern, std::regex& re, std::string& error);

// Test a hex digest (or any text) against the pattern
bool matchesPattern(const std::string& pattern, const std::string& text);

SearchResult searchNonce(const ObjectBuffer& object, const SearchConfig& config);

long long getAttemptCount();
