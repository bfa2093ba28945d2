#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace core {

// Holds results that complete out of order until every lower sequence number
// has been released. Not thread-safe: the owner serializes insert()/skip().
//
// A sequence number is resolved either by a value (insert) or by skip(), which
// is used for chunks that were dropped or failed and will never produce a value.
template <typename T>
class ReorderBuffer {
public:
    explicit ReorderBuffer(uint64_t first_sequence = 0) : next_(first_sequence) {}

    // Store value for sequence and return every value now releasable, in order.
    // Values for already released sequence numbers are ignored.
    std::vector<T> insert(uint64_t sequence, T value) {
        if (sequence < next_) {
            return {};
        }
        pending_.emplace(sequence, std::optional<T>(std::move(value)));
        return release();
    }

    // Mark sequence as permanently missing; returns values unblocked by it.
    std::vector<T> skip(uint64_t sequence) {
        if (sequence < next_) {
            return {};
        }
        pending_.emplace(sequence, std::nullopt);
        return release();
    }

    uint64_t next_expected() const { return next_; }
    size_t pending() const { return pending_.size(); }

    void clear() { pending_.clear(); }

private:
    std::vector<T> release() {
        std::vector<T> ready;
        auto it = pending_.begin();
        while (it != pending_.end() && it->first == next_) {
            if (it->second) {
                ready.push_back(std::move(*it->second));
            }
            it = pending_.erase(it);
            ++next_;
        }
        return ready;
    }

    uint64_t next_;
    std::map<uint64_t, std::optional<T>> pending_;
};

} // namespace core
