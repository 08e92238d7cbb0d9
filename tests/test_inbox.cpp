#include "include/inbox.hpp"
#include <thread>
#include <vector>
#include <iostream>
#include <atomic>
#include <cassert>

using namespace voxpipe;
using namespace std::chrono_literals;

int main() {
    Inbox<int> inbox;

    const int producers = 4;
    const int items_per_producer = 10000;

    std::vector<std::thread> prod_ts;
    for (int p = 0; p < producers; ++p) {
        prod_ts.emplace_back([&, p](){
            for (int i = 0; i < items_per_producer; ++i) {
                bool ok = inbox.post(p * items_per_producer + i);
                assert(ok);
            }
        });
    }

    // Single consumer sees every item, and each producer's items in order.
    std::vector<int> last(producers, -1);
    int consumed = 0;
    while (consumed < producers * items_per_producer) {
        for (int v : inbox.drain(50ms)) {
            int p = v / items_per_producer;
            assert(v > last[p]);
            last[p] = v;
            ++consumed;
        }
    }
    for (auto& t : prod_ts) t.join();
    assert(inbox.size() == 0);

    // Empty drain times out.
    auto t0 = std::chrono::steady_clock::now();
    assert(inbox.drain(20ms).empty());
    assert(std::chrono::steady_clock::now() - t0 >= 15ms);

    // Close wakes a blocked consumer and rejects further posts.
    std::thread waiter([&](){
        auto items = inbox.drain(10s);
        assert(items.empty());
    });
    std::this_thread::sleep_for(20ms);
    inbox.close();
    waiter.join();
    assert(inbox.closed());
    assert(!inbox.post(1));

    std::cout << "consumed=" << consumed << "\n";
    std::cout << "Inbox test PASSED\n";
    return 0;
}
