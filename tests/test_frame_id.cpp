#include <doctest/doctest.h>
#include "xbeelink/frame_id.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace xbeelink;

TEST_CASE("Frame IDs start at 1 and wrap from 255 back to 1") {
    FrameIdAllocator ids;
    CHECK(ids.next() == 1);
    CHECK(ids.next() == 2);

    for (int i = 3; i <= 255; ++i) ids.next();
    CHECK(ids.last() == 255);
    CHECK(ids.next() == 1);            // 0 is skipped
}

TEST_CASE("Frame ID allocation from several threads never yields 0") {
    FrameIdAllocator ids;
    std::atomic<int> zeros{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 1000; ++i)
                if (ids.next() == FrameIdAllocator::NO_RESPONSE) ++zeros;
        });
    }
    for (auto& th : threads) th.join();
    CHECK(zeros.load() == 0);
}
