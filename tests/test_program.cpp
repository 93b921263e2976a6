#include "program/puzzle_program.hpp"
#include "program/program_config.hpp"
#include "crypto/random.hpp"
#include "utils/config.hpp"
#include "utils/logger.hpp"
#include <gtest/gtest.h>

using namespace puzzlemint;
using namespace puzzlemint::program;
using namespace puzzlemint::metadata;

class PuzzleProgramTest : public ::testing::Test {
protected:
    ledger::InMemoryAssetLedger ledger;
    core::FixedEntropySource entropy{core::EntropySnapshot{42, 1700000000}};
    ProgramConfig config;
    Identity minter;
    Identity buyer;

    void SetUp() override {
        config.program_id = crypto::Random::generate_identity();
        config.update_authority = crypto::Random::generate_identity();
        config.hidden_trait = "???";
        minter = crypto::Random::generate_identity();
        buyer = crypto::Random::generate_identity();
    }

    MintRequest request(uint8_t selector = 0) const {
        return MintRequest{"Puzzle #1", "https://example.com/1.json", selector, 1};
    }

    std::string attribute(const Identity& asset, const std::string& key) const {
        auto record = ledger.get(asset);
        EXPECT_TRUE(record.has_value());
        return AttributeCodec::find(record->attributes, key).value_or("");
    }
};

TEST_F(PuzzleProgramTest, MintStoresAsset) {
    PuzzleProgram program(config, ledger, entropy);
    auto receipt = program.mint(minter, request());
    ASSERT_TRUE(receipt.is_ok());

    const auto& asset = receipt.value().asset_id;
    auto record = ledger.get(asset);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->owner, minter);
    EXPECT_EQ(record->update_authority, config.update_authority);
    EXPECT_EQ(record->name, "Puzzle #1");
    EXPECT_EQ(record->uri, "https://example.com/1.json");
    ASSERT_TRUE(record->holding.has_value());
    EXPECT_EQ(record->holding->holder, minter);
    EXPECT_EQ(record->holding->balance, 1u);

    EXPECT_EQ(attribute(asset, keys::PUZZLE_NUMBER), "186");
    EXPECT_EQ(attribute(asset, keys::SOLVED), "false");
    EXPECT_EQ(attribute(asset, keys::HIDDEN_TRAIT), "???");

    const auto& event = receipt.value().event;
    EXPECT_EQ(event.asset_id, asset);
    EXPECT_EQ(event.puzzle_number, 186u);
}

TEST_F(PuzzleProgramTest, MintRejectsBadSelectorWithoutWriting) {
    PuzzleProgram program(config, ledger, entropy);
    auto receipt = program.mint(minter, request(9));
    ASSERT_TRUE(receipt.is_err());
    EXPECT_EQ(receipt.error().code(), ErrorCode::InvalidPuzzleType);
    EXPECT_EQ(ledger.size(), 0u);
}

TEST_F(PuzzleProgramTest, SolveWithUriUpdate) {
    PuzzleProgram program(config, ledger, entropy);
    auto asset = program.mint(minter, request()).value().asset_id;

    entropy.set(core::EntropySnapshot{60, 1700000035});
    auto event = program.solve(asset, minter, 31, std::string("https://example.com/solved.json"));
    ASSERT_TRUE(event.is_ok());
    EXPECT_EQ(event.value().rarity, core::Rarity::Rare);
    EXPECT_EQ(event.value().solve_timestamp, 1700000035);

    auto record = ledger.get(asset);
    EXPECT_EQ(record->uri, "https://example.com/solved.json");
    EXPECT_EQ(attribute(asset, keys::SOLVED), "true");
    EXPECT_EQ(attribute(asset, keys::SOLUTION), "31");
    EXPECT_EQ(attribute(asset, keys::RARITY), "Rare");
    EXPECT_EQ(attribute(asset, keys::HIDDEN_TRAIT), "Rare Solver");
}

TEST_F(PuzzleProgramTest, FailedSolvePersistsNothing) {
    PuzzleProgram program(config, ledger, entropy);
    auto asset = program.mint(minter, request()).value().asset_id;
    auto before = ledger.get(asset);

    auto wrong = program.solve(asset, minter, 5, std::string("https://example.com/nope.json"));
    ASSERT_TRUE(wrong.is_err());
    EXPECT_EQ(wrong.error().code(), ErrorCode::IncorrectSolution);

    auto stranger = program.solve(asset, buyer, 2);
    ASSERT_TRUE(stranger.is_err());
    EXPECT_EQ(stranger.error().code(), ErrorCode::NotNftOwner);

    auto after = ledger.get(asset);
    EXPECT_EQ(after->version, before->version);
    EXPECT_EQ(after->uri, before->uri);
    EXPECT_EQ(after->attributes, before->attributes);
}

TEST_F(PuzzleProgramTest, OnlyOneSolveSucceeds) {
    PuzzleProgram program(config, ledger, entropy);
    auto asset = program.mint(minter, request()).value().asset_id;

    ASSERT_TRUE(program.solve(asset, minter, 2).is_ok());
    auto again = program.solve(asset, minter, 3);
    ASSERT_TRUE(again.is_err());
    EXPECT_EQ(again.error().code(), ErrorCode::AlreadySolved);
    EXPECT_EQ(attribute(asset, keys::SOLUTION), "2");
}

TEST_F(PuzzleProgramTest, TransferredAssetSolvableByNewOwner) {
    PuzzleProgram program(config, ledger, entropy);
    auto asset = program.mint(minter, request()).value().asset_id;

    ASSERT_TRUE(ledger.transfer(asset, minter, buyer).is_ok());

    auto old_owner = program.solve(asset, minter, 2);
    ASSERT_TRUE(old_owner.is_err());
    EXPECT_EQ(old_owner.error().code(), ErrorCode::NotNftOwner);

    auto new_owner = program.solve(asset, buyer, 2);
    ASSERT_TRUE(new_owner.is_ok());
    EXPECT_EQ(attribute(asset, keys::SOLVER), buyer.to_string());
}

TEST_F(PuzzleProgramTest, UnknownAsset) {
    PuzzleProgram program(config, ledger, entropy);
    auto result = program.solve(crypto::Random::generate_identity(), minter, 2);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidAssetData);
}

TEST_F(PuzzleProgramTest, UpdateUriNeedsAuthority) {
    PuzzleProgram program(config, ledger, entropy);
    auto asset = program.mint(minter, request()).value().asset_id;

    auto denied = program.update_uri(security::UpdateAuthority(minter), asset, "ipfs://evil");
    ASSERT_TRUE(denied.is_err());
    EXPECT_EQ(denied.error().code(), ErrorCode::UnauthorizedUpdate);

    auto allowed = program.update_uri(program.authority(), asset, "ipfs://new");
    ASSERT_TRUE(allowed.is_ok());
    EXPECT_EQ(allowed.value().uri, "ipfs://new");
    EXPECT_EQ(ledger.get(asset)->uri, "ipfs://new");
    EXPECT_EQ(attribute(asset, keys::SOLVED), "false");
}

TEST_F(PuzzleProgramTest, EventJson) {
    PuzzleProgram program(config, ledger, entropy);
    auto receipt = program.mint(minter, request()).value();

    auto minted = receipt.event.to_json();
    EXPECT_EQ(minted["event"].get<std::string>(), "puzzle_minted");
    EXPECT_EQ(minted["puzzle_type"].get<std::string>(), "math_factor");
    EXPECT_EQ(minted["puzzle_number"].get<uint64_t>(), 186u);
    EXPECT_EQ(minted["minter"].get<std::string>(), minter.to_string());

    entropy.advance(1, 5);  // 1700000005 -> Legendary
    auto solved = program.solve(receipt.asset_id, minter, 93).value().to_json();
    EXPECT_EQ(solved["event"].get<std::string>(), "puzzle_solved");
    EXPECT_EQ(solved["solution_time"].get<int64_t>(), 1700000005);
    EXPECT_EQ(solved["rarity"].get<std::string>(), "Legendary");
}

class ProgramConfigTest : public ::testing::Test {
protected:
    std::string program_hex = std::string(64, 'a');
    std::string authority_hex = std::string(64, 'b');

    utils::Config base() const {
        utils::Config config;
        config.set("program_id", program_hex);
        config.set("update_authority", authority_hex);
        return config;
    }
};

TEST_F(ProgramConfigTest, Defaults) {
    auto parsed = ProgramConfig::from_config(base());
    ASSERT_TRUE(parsed.is_ok());

    const auto& config = parsed.value();
    EXPECT_EQ(config.program_id.to_string(), program_hex);
    EXPECT_EQ(config.update_authority.to_string(), authority_hex);
    EXPECT_EQ(config.log_level, "info");
    EXPECT_FALSE(config.log_to_file);
    EXPECT_EQ(config.slot_duration_ms, 400u);
    EXPECT_EQ(config.genesis_timestamp_ms, 0u);
    EXPECT_FALSE(config.hidden_trait.has_value());
    EXPECT_TRUE(config.state_machine_options().mint_metadata.empty());
}

TEST_F(ProgramConfigTest, FromJson) {
    auto config = utils::Config::load_from_json(R"({
        "program_id": ")" + program_hex + R"(",
        "update_authority": ")" + authority_hex + R"(",
        "log_level": "debug",
        "slot_duration_ms": 250,
        "genesis_timestamp": 1600000000000,
        "hidden_trait": "???"
    })");

    auto parsed = ProgramConfig::from_config(config);
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().log_level, "debug");
    EXPECT_EQ(parsed.value().slot_duration_ms, 250u);
    EXPECT_EQ(parsed.value().genesis_timestamp_ms, 1600000000000u);
    ASSERT_EQ(parsed.value().state_machine_options().mint_metadata.size(), 1u);
    EXPECT_EQ(parsed.value().state_machine_options().mint_metadata[0].value, "???");
}

TEST_F(ProgramConfigTest, MissingIdentity) {
    utils::Config config;
    config.set("program_id", program_hex);
    auto parsed = ProgramConfig::from_config(config);
    ASSERT_TRUE(parsed.is_err());
    EXPECT_EQ(parsed.error().code(), ErrorCode::ConfigInvalid);
}

TEST_F(ProgramConfigTest, MalformedIdentity) {
    auto config = base();
    config.set("update_authority", std::string("xyz"));
    EXPECT_EQ(ProgramConfig::from_config(config).error().code(), ErrorCode::ConfigInvalid);
}

TEST_F(ProgramConfigTest, BadSlotDuration) {
    auto zero = base();
    zero.set("slot_duration_ms", 0);
    EXPECT_TRUE(ProgramConfig::from_config(zero).is_err());

    auto negative = base();
    negative.set("slot_duration_ms", -5);
    EXPECT_TRUE(ProgramConfig::from_config(negative).is_err());

    auto text = base();
    text.set("slot_duration_ms", std::string("fast"));
    EXPECT_TRUE(ProgramConfig::from_config(text).is_err());
}

TEST_F(ProgramConfigTest, HiddenTraitMustBeString) {
    auto config = base();
    config.set("hidden_trait", 5);
    EXPECT_TRUE(ProgramConfig::from_config(config).is_err());
}

TEST_F(ProgramConfigTest, SlotClockFromConfig) {
    auto config = base();
    config.set("slot_duration_ms", 250u);
    config.set("genesis_timestamp", 1000000u);
    auto parsed = ProgramConfig::from_config(config);
    ASSERT_TRUE(parsed.is_ok());

    auto clock = parsed.value().slot_clock();
    EXPECT_EQ(clock.genesis(), 1000000u);
    EXPECT_EQ(clock.slot_duration(), 250u);
    EXPECT_EQ(clock.slot_for_timestamp(999999), 0u);
    EXPECT_EQ(clock.slot_for_timestamp(1000000 + 250 * 8), 8u);
}

TEST_F(ProgramConfigTest, FutureGenesisYieldsSlotZero) {
    auto config = base();
    config.set("genesis_timestamp", time::timestamp_milliseconds() + 3600u * 1000u);
    auto parsed = ProgramConfig::from_config(config);
    ASSERT_TRUE(parsed.is_ok());

    EXPECT_EQ(parsed.value().slot_clock().current_slot(), 0u);

    auto entropy = parsed.value().make_entropy_source();
    ASSERT_NE(entropy, nullptr);
    auto snapshot = entropy->snapshot();
    EXPECT_EQ(snapshot.slot, 0u);
    EXPECT_GT(snapshot.timestamp, 0);
}

TEST_F(ProgramConfigTest, ProgramRunsOnConfiguredEntropy) {
    auto parsed = ProgramConfig::from_config(base());
    ASSERT_TRUE(parsed.is_ok());

    ledger::InMemoryAssetLedger ledger;
    auto entropy = parsed.value().make_entropy_source();
    PuzzleProgram program(parsed.value(), ledger, *entropy);

    Identity minter = crypto::Random::generate_identity();
    auto receipt = program.mint(minter, MintRequest{"Puzzle", "https://example.com/p.json", 0, 0});
    ASSERT_TRUE(receipt.is_ok());

    // Divisor 1 always solves a MathFactor puzzle
    EXPECT_TRUE(program.solve(receipt.value().asset_id, minter, 1).is_ok());
}

TEST_F(ProgramConfigTest, ApplyLoggingSetsLevel) {
    auto config = base();
    config.set("log_level", std::string("warn"));
    auto parsed = ProgramConfig::from_config(config);
    ASSERT_TRUE(parsed.is_ok());

    parsed.value().apply_logging();
    EXPECT_EQ(utils::Logger::get()->level(), spdlog::level::warn);

    utils::Logger::init("info");
    EXPECT_EQ(utils::Logger::get()->level(), spdlog::level::info);
}
