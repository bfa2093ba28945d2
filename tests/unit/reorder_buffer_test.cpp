#include <cassert>
#include <string>
#include <vector>
#include "core/reorder_buffer.hpp"

int main() {
    core::ReorderBuffer<std::string> rb;

    // 1 and 2 complete before 0
    assert(rb.insert(1, "one").empty());
    assert(rb.insert(2, "two").empty());
    assert(rb.pending() == 2);
    auto ready = rb.insert(0, "zero");
    assert((ready == std::vector<std::string>{"zero", "one", "two"}));
    assert(rb.next_expected() == 3);
    assert(rb.pending() == 0);

    // A skipped sequence unblocks later values
    assert(rb.insert(4, "four").empty());
    ready = rb.skip(3);
    assert((ready == std::vector<std::string>{"four"}));
    assert(rb.next_expected() == 5);

    // Skip ahead of time, then fill the gap
    assert(rb.skip(6).empty());
    ready = rb.insert(5, "five");
    assert((ready == std::vector<std::string>{"five"}));
    assert(rb.next_expected() == 7);

    // Stale sequence numbers are ignored
    assert(rb.insert(2, "late").empty());
    assert(rb.skip(1).empty());
    assert(rb.next_expected() == 7);

    // Custom start and clear
    core::ReorderBuffer<int> from_ten(10);
    assert(from_ten.insert(11, 11).empty());
    from_ten.clear();
    assert(from_ten.pending() == 0);
    assert((from_ten.insert(10, 10) == std::vector<int>{10}));
    return 0;
}
