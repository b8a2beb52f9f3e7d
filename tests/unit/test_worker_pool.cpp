#include <catch2/catch_test_macros.hpp>
#include "uabridge/bridge/worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace uabridge::bridge;
using namespace std::chrono_literals;

TEST_CASE("WorkerPool - Task execution", "[bridge][pool]") {
    SECTION("Every submitted task runs before shutdown returns") {
        WorkerPool pool(4);
        REQUIRE(pool.ThreadCount() == 4);
        std::atomic<int> ran{0};
        for (int i = 0; i < 200; ++i) {
            REQUIRE(pool.Submit([&] { ++ran; }));
        }
        pool.Shutdown();
        REQUIRE(ran.load() == 200);
    }

    SECTION("Submissions after shutdown are refused") {
        WorkerPool pool(1);
        pool.Shutdown();
        REQUIRE_FALSE(pool.Submit([] {}));
    }

    SECTION("A throwing task does not take a worker down") {
        WorkerPool pool(1);
        std::atomic<bool> after{false};
        REQUIRE(pool.Submit([] { throw std::runtime_error("boom"); }));
        REQUIRE(pool.Submit([&] { after = true; }));
        pool.Shutdown();
        REQUIRE(after.load());
    }

    SECTION("Zero threads still gives a working pool") {
        WorkerPool pool(0);
        REQUIRE(pool.ThreadCount() >= 1);
        std::atomic<bool> ran{false};
        REQUIRE(pool.Submit([&] { ran = true; }));
        pool.Shutdown();
        REQUIRE(ran.load());
    }
}

TEST_CASE("Strand - Serial ordered execution", "[bridge][pool][strand]") {
    WorkerPool pool(4);

    SECTION("Tasks on one strand run in order and never overlap") {
        auto strand = Strand::Create(pool, 8);
        std::vector<int> order;
        std::atomic<int> active{0};
        std::atomic<bool> overlapped{false};
        for (int i = 0; i < 500; ++i) {
            strand->Post([&, i] {
                if (active.fetch_add(1) != 0) {
                    overlapped = true;
                }
                order.push_back(i);
                active.fetch_sub(1);
            });
        }
        pool.Shutdown();
        REQUIRE_FALSE(overlapped.load());
        REQUIRE(order.size() == 500);
        for (int i = 0; i < 500; ++i) {
            REQUIRE(order[i] == i);
        }
        REQUIRE(strand->Pending() == 0);
    }

    SECTION("Separate strands make progress independently") {
        auto slow = Strand::Create(pool, 1);
        auto fast = Strand::Create(pool, 1);
        std::atomic<bool> release{false};
        std::atomic<bool> fast_ran{false};
        slow->Post([&] {
            while (!release.load()) {
                std::this_thread::sleep_for(1ms);
            }
        });
        fast->Post([&] { fast_ran = true; });

        const auto deadline = std::chrono::steady_clock::now() + 2s;
        while (!fast_ran.load() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(1ms);
        }
        REQUIRE(fast_ran.load());
        release = true;
        pool.Shutdown();
    }

    SECTION("Posting after shutdown still runs the task") {
        auto strand = Strand::Create(pool, 4);
        pool.Shutdown();
        bool ran = false;
        strand->Post([&] { ran = true; });
        REQUIRE(ran);
    }
}
