#include <catch2/catch_test_macros.hpp>

#include "core/scan/TargetGenerator.hpp"

#include <algorithm>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace devsweep::core;

namespace {

constexpr uint32_t BASE = 0x0A000001u; // 10.0.0.1

} // namespace

TEST_CASE("TargetGenerator ordering", "[TargetGenerator]") {
    SECTION("Address-major, ports in the given order") {
        TargetGenerator generator(BASE, BASE + 2, {22, 5555});

        std::vector<Target> targets;
        while (auto target = generator.next()) {
            targets.push_back(*target);
        }

        std::vector<Target> expected = {
            {BASE, 22},     {BASE, 5555},     {BASE + 1, 22},
            {BASE + 1, 5555}, {BASE + 2, 22}, {BASE + 2, 5555},
        };
        REQUIRE(targets == expected);
        REQUIRE(targets.front().toString() == "10.0.0.1:22");
        REQUIRE(targets.back().toString() == "10.0.0.3:5555");
    }

    SECTION("Single host, single port") {
        TargetGenerator generator(BASE, BASE, {23});

        auto first = generator.next();
        REQUIRE(first.has_value());
        REQUIRE(*first == Target{BASE, 23});
        REQUIRE_FALSE(generator.next().has_value());
    }

    SECTION("at() matches the sequence") {
        TargetGenerator generator(BASE, BASE + 9, {5037, 5555, 22, 23});
        REQUIRE(generator.at(0) == Target{BASE, 5037});
        REQUIRE(generator.at(5) == Target{BASE + 1, 5555});
        REQUIRE(generator.at(39) == Target{BASE + 9, 23});
    }
}

TEST_CASE("TargetGenerator size and exhaustion", "[TargetGenerator]") {
    SECTION("size is hosts times ports") {
        TargetGenerator generator(BASE, BASE + 254, {5037, 5555, 22, 23});
        REQUIRE(generator.size() == 255 * 4);
    }

    SECTION("Full address space does not overflow") {
        TargetGenerator generator(0, 0xFFFFFFFFu, {22, 23});
        REQUIRE(generator.size() == (1ull << 32) * 2);
        REQUIRE(generator.at(generator.size() - 1) == Target{0xFFFFFFFFu, 23});
    }

    SECTION("dispatched stops at size after exhaustion") {
        TargetGenerator generator(BASE, BASE + 1, {22});
        REQUIRE(generator.dispatched() == 0);
        REQUIRE_FALSE(generator.exhausted());

        REQUIRE(generator.next().has_value());
        REQUIRE(generator.next().has_value());
        REQUIRE(generator.exhausted());

        REQUIRE_FALSE(generator.next().has_value());
        REQUIRE_FALSE(generator.next().has_value());
        REQUIRE(generator.dispatched() == 2);
    }

    SECTION("No ports means no targets") {
        TargetGenerator generator(BASE, BASE + 10, {});
        REQUIRE(generator.size() == 0);
        REQUIRE_FALSE(generator.next().has_value());
    }

    SECTION("Constructed from a validated config") {
        ValidatedConfig config;
        config.startAddress = BASE;
        config.endAddress = BASE + 3;
        config.ports = {22, 23};

        TargetGenerator generator(config);
        REQUIRE(generator.size() == config.totalTargets());
    }
}

TEST_CASE("TargetGenerator concurrent consumption", "[TargetGenerator]") {
    TargetGenerator generator(BASE, BASE + 499, {22, 23, 5555});
    constexpr int THREADS = 8;

    std::mutex mutex;
    std::vector<Target> collected;
    std::vector<std::thread> threads;

    for (int i = 0; i < THREADS; ++i) {
        threads.emplace_back([&]() {
            std::vector<Target> local;
            while (auto target = generator.next()) {
                local.push_back(*target);
            }
            std::lock_guard lock(mutex);
            collected.insert(collected.end(), local.begin(), local.end());
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    // Every target exactly once
    REQUIRE(collected.size() == generator.size());

    std::set<std::pair<uint32_t, uint16_t>> unique;
    for (const auto& target : collected) {
        unique.emplace(target.address, target.port);
    }
    REQUIRE(unique.size() == generator.size());
}
