#include "puzzlemint/common.hpp"
#include "puzzlemint/error.hpp"
#include "puzzlemint/time_utils.hpp"
#include "core/entropy/entropy.hpp"
#include "crypto/blake3.hpp"
#include "utils/config.hpp"
#include "utils/logger.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace puzzlemint;

// Runs before anything else in this binary logs
TEST(LoggerTest, ConcurrentFirstUseBuildsOneLogger) {
    constexpr int kThreads = 8;
    std::vector<std::shared_ptr<spdlog::logger>> seen(kThreads);
    std::vector<std::thread> threads;

    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&seen, i]() {
            seen[i] = utils::Logger::get();
            seen[i]->debug("thread {} logging", i);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    ASSERT_NE(seen[0], nullptr);
    for (const auto& logger : seen) {
        EXPECT_EQ(logger, seen[0]);
    }
    EXPECT_EQ(seen[0]->level(), spdlog::level::info);
}

TEST(LoggerTest, InitWhileLogging) {
    std::thread writer([]() {
        for (int i = 0; i < 200; ++i) {
            PUZZLEMINT_LOG_DEBUG("write {}", i);
        }
    });
    for (int i = 0; i < 20; ++i) {
        utils::Logger::init(i % 2 == 0 ? "warn" : "info");
    }
    writer.join();
    EXPECT_EQ(utils::Logger::get()->level(), spdlog::level::info);
}

TEST(IdentityTest, HexRoundTrip) {
    Identity identity;
    for (size_t i = 0; i < identity.id.size(); ++i) {
        identity.id[i] = static_cast<byte>(i);
    }
    std::string hex = identity.to_string();
    EXPECT_EQ(hex.size(), 64u);
    EXPECT_EQ(hex.substr(0, 6), "000102");
    EXPECT_EQ(Identity::from_string(hex), identity);
}

TEST(IdentityTest, ParseRejectsGarbage) {
    EXPECT_FALSE(Identity::parse("").has_value());
    EXPECT_FALSE(Identity::parse(std::string(63, 'a')).has_value());
    EXPECT_FALSE(Identity::parse(std::string(64, 'g')).has_value());
    EXPECT_TRUE(Identity::parse(std::string(64, 'F')).has_value());
    EXPECT_THROW(Identity::from_string("zz"), std::runtime_error);
}

TEST(ErrorTest, Formatting) {
    Error error(ErrorCode::IncorrectSolution, "Candidate rejected", "candidate=5");
    EXPECT_EQ(error.code(), ErrorCode::IncorrectSolution);
    EXPECT_EQ(error.to_string(), "[The provided solution is incorrect] Candidate rejected (candidate=5)");

    Error bare(ErrorCode::AlreadySolved, "Done");
    EXPECT_EQ(bare.to_string(), "[Puzzle has already been solved] Done");
}

TEST(ErrorTest, ResultAccessors) {
    auto ok = Result<int>::Ok(7);
    EXPECT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), 7);
    EXPECT_EQ(ok.map([](int v) { return v * 2; }).value(), 14);

    auto err = Result<int>::Err(ErrorCode::NotNftOwner, "no");
    EXPECT_TRUE(err.is_err());
    EXPECT_EQ(err.value_or(3), 3);
    EXPECT_FALSE(err.ok().has_value());
    EXPECT_THROW(err.value(), std::runtime_error);

    auto void_err = Result<void>::Err(ErrorCode::LedgerConflict, "stale");
    EXPECT_EQ(void_err.error().code(), ErrorCode::LedgerConflict);
    EXPECT_THROW(void_err.expect("commit"), std::runtime_error);
}

TEST(ConfigTest, GetAndDefaults) {
    auto config = utils::Config::load_from_json(R"({"name": "puzzlemint", "count": 3})");
    EXPECT_EQ(config.get<std::string>("name").value(), "puzzlemint");
    EXPECT_EQ(config.get<int>("count").value(), 3);
    EXPECT_FALSE(config.get<int>("name").has_value());
    EXPECT_FALSE(config.get<int>("missing").has_value());
    EXPECT_EQ(config.get_or<int>("missing", 9), 9);
    EXPECT_TRUE(config.has("count"));
}

TEST(ConfigTest, InvalidJsonThrows) {
    EXPECT_THROW(utils::Config::load_from_json("{not json"), ConfigException);
    EXPECT_THROW(utils::Config::load_from_json("[1, 2]"), ConfigException);
    EXPECT_THROW(utils::Config::load_from_file("/nonexistent/puzzlemint.json"), ConfigException);
}

TEST(ConfigTest, FileRoundTrip) {
    std::string path = ::testing::TempDir() + "puzzlemint_config_test.json";
    utils::Config config;
    config.set("log_level", std::string("warn"));
    config.save_to_file(path);

    auto loaded = utils::Config::load_from_file(path);
    EXPECT_EQ(loaded.get<std::string>("log_level").value(), "warn");
    std::remove(path.c_str());
}

TEST(SlotClockTest, SlotArithmetic) {
    time::SlotClock clock(1000, 400);
    EXPECT_EQ(clock.slot_for_timestamp(0), 0u);
    EXPECT_EQ(clock.slot_for_timestamp(1000), 0u);
    EXPECT_EQ(clock.slot_for_timestamp(1399), 0u);
    EXPECT_EQ(clock.slot_for_timestamp(1400), 1u);
    EXPECT_EQ(clock.slot_for_timestamp(1000 + 400 * 42), 42u);
    EXPECT_EQ(clock.slot_start_time(42), 1000u + 400u * 42u);
}

TEST(SlotClockTest, CurrentSlotNeverDecreases) {
    time::SlotClock clock;
    uint64_t previous = clock.current_slot();
    EXPECT_GT(previous, 0u);
    for (int i = 0; i < 100; ++i) {
        uint64_t slot = clock.current_slot();
        EXPECT_GE(slot, previous);
        previous = slot;
    }
}

TEST(SlotClockTest, ZeroDurationRejected) {
    EXPECT_THROW(time::SlotClock(0, 0), std::invalid_argument);
}

TEST(EntropyTest, SystemSourceIsMonotonic) {
    core::SystemEntropySource source{time::SlotClock()};
    auto first = source.snapshot();
    auto second = source.snapshot();
    EXPECT_GE(second.slot, first.slot);
    EXPECT_GT(first.timestamp, 0);
}

TEST(EntropyTest, FixedSourceAdvances) {
    core::FixedEntropySource source(core::EntropySnapshot{10, 100});
    source.advance(5, 20);
    auto snap = source.snapshot();
    EXPECT_EQ(snap.slot, 15u);
    EXPECT_EQ(snap.timestamp, 120);
}

TEST(Blake3Test, KnownVector) {
    EXPECT_EQ(hash_to_hex(crypto::Blake3::hash(std::string())),
              "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}

TEST(Blake3Test, CounterIsLittleEndian) {
    Identity identity;
    identity.id.fill(0x5a);

    bytes message(identity.id.begin(), identity.id.end());
    bytes counter = {0x2a, 0, 0, 0, 0, 0, 0, 0};
    message.insert(message.end(), counter.begin(), counter.end());

    EXPECT_EQ(crypto::Blake3::hash_with_counter(identity, 42), crypto::Blake3::hash(message));
}

TEST(LoggerTest, InitAcceptsLevels) {
    utils::Logger::init("debug");
    ASSERT_NE(utils::Logger::get(), nullptr);
    EXPECT_EQ(utils::Logger::get()->level(), spdlog::level::debug);

    utils::Logger::init("not-a-level");
    EXPECT_EQ(utils::Logger::get()->level(), spdlog::level::info);
}
