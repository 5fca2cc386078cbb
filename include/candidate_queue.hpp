#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>

// =============================================================================
// CANDIDATE QUEUE - bounded single-producer / multi-consumer FIFO
// =============================================================================
// push() blocks while full, pop() blocks while empty. close() wakes everyone:
// further pushes fail, pops drain what is left and then fail.
// =============================================================================

class CandidateQueue {
public:
    explicit CandidateQueue(size_t capacity);

    CandidateQueue(const CandidateQueue&) = delete;
    CandidateQueue& operator=(const CandidateQueue&) = delete;

    bool push(uint64_t candidate);
    bool pop(uint64_t& candidate);
    void close();

    bool closed() const;
    size_t size() const;
    size_t capacity() const { return capacity_; }

private:
    mutable std::mutex mutex_;
    std::condition_variable notFull_;
    std::condition_variable notEmpty_;
    std::deque<uint64_t> items_;
    size_t capacity_;
    bool closed_ = false;
};

// Push first, first+1, ... until the counter wraps to zero, `last` has been
// pushed (last == 0 means no ceiling), or the queue is closed. Always closes
// the queue on return.
void enumerateCandidates(CandidateQueue& queue, uint64_t first, uint64_t last);
