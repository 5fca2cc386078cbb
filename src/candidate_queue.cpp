#include "candidate_queue.hpp"

CandidateQueue::CandidateQueue(size_t capacity)
    : capacity_(capacity > 0 ? capacity : 1)
{
}

bool CandidateQueue::push(uint64_t candidate)
{
    std::unique_lock<std::mutex> lock(mutex_);
    notFull_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
    if (closed_) {
        return false;
    }
    items_.push_back(candidate);
    lock.unlock();
    notEmpty_.notify_one();
    return true;
}

bool CandidateQueue::pop(uint64_t& candidate)
{
    std::unique_lock<std::mutex> lock(mutex_);
    notEmpty_.wait(lock, [this] { return closed_ || !items_.empty(); });
    if (items_.empty()) {
        return false;
    }
    candidate = items_.front();
    items_.pop_front();
    lock.unlock();
    notFull_.notify_one();
    return true;
}

void CandidateQueue::close()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    notFull_.notify_all();
    notEmpty_.notify_all();
}

bool CandidateQueue::closed() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t CandidateQueue::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

void enumerateCandidates(CandidateQueue& queue, uint64_t first, uint64_t last)
{
    uint64_t candidate = first;
    do {
        if (!queue.push(candidate)) {
            break;
        }
        if (candidate == last) {
            break;
        }
        ++candidate;
    } while (candidate != 0);

    queue.close();
}
