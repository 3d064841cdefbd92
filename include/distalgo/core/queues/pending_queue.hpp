#pragma once

#include <distalgo/core/events/message.hpp>
#include <distalgo/core/utils/random_source.hpp>
#include <cstddef>
#include <deque>
#include <optional>
#include <vector>

namespace DistAlgo {

/**
 * @class PendingQueue
 * @brief Messages awaiting delivery in one simulation run.
 *
 * Dequeue always pops the front; the discipline only decides where new
 * messages land. With NON_FIFO the insertion index is drawn uniformly from
 * [0, size()], so a message may become the next one delivered or the last.
 */
template<typename M>
class PendingQueue {
public:
    PendingQueue(ChannelDiscipline discipline, RandomSource& rng)
        : discipline_(discipline), rng_(rng) {}

    PendingQueue(const PendingQueue&) = delete;
    PendingQueue& operator=(const PendingQueue&) = delete;

    void enqueue(M msg) {
        if (discipline_ == ChannelDiscipline::FIFO || messages_.empty()) {
            messages_.push_back(std::move(msg));
            return;
        }
        size_t index = rng_.between(0, messages_.size());
        messages_.insert(messages_.begin() + static_cast<std::ptrdiff_t>(index), std::move(msg));
    }

    /**
     * @brief Enqueue a batch
     *
     * FIFO keeps the batch order. NON_FIFO places every message independently,
     * so the batch order is not preserved either.
     */
    void enqueueMany(std::vector<M> msgs) {
        for (auto& msg : msgs) {
            enqueue(std::move(msg));
        }
    }

    std::optional<M> pop() {
        if (messages_.empty()) {
            return std::nullopt;
        }
        M msg = std::move(messages_.front());
        messages_.pop_front();
        return msg;
    }

    bool empty() const { return messages_.empty(); }
    size_t size() const { return messages_.size(); }
    ChannelDiscipline discipline() const { return discipline_; }

    // Read-only view in delivery order
    typename std::deque<M>::const_iterator begin() const { return messages_.begin(); }
    typename std::deque<M>::const_iterator end() const { return messages_.end(); }

private:
    ChannelDiscipline discipline_;
    RandomSource& rng_;
    std::deque<M> messages_;
};

} // namespace DistAlgo
