#include "program_config.hpp"
#include "metadata/attribute_codec.hpp"
#include "utils/logger.hpp"

namespace puzzlemint::program {

namespace {
    Result<Identity> read_identity(const utils::Config& config, const std::string& key) {
        auto text = config.get<std::string>(key);
        if (!text) {
            return Result<Identity>::Err(Error(ErrorCode::ConfigInvalid,
                                               "Missing identity", "key=" + key));
        }
        auto identity = Identity::parse(*text);
        if (!identity) {
            return Result<Identity>::Err(Error(ErrorCode::ConfigInvalid,
                                               "Identity must be 64 hex characters", "key=" + key));
        }
        return Result<Identity>::Ok(*identity);
    }
}

Result<ProgramConfig> ProgramConfig::from_config(const utils::Config& config) {
    using R = Result<ProgramConfig>;

    ProgramConfig result;
    PUZZLEMINT_TRY_UNWRAP(R, program_id, read_identity(config, "program_id"));
    PUZZLEMINT_TRY_UNWRAP(R, authority, read_identity(config, "update_authority"));
    result.program_id = program_id;
    result.update_authority = authority;

    result.log_level = config.get_or<std::string>("log_level", result.log_level);
    result.log_to_file = config.get_or<bool>("log_to_file", result.log_to_file);

    if (config.has("slot_duration_ms")) {
        auto duration = config.get<uint64_t>("slot_duration_ms");
        if (!config.data().at("slot_duration_ms").is_number_unsigned() || !duration || *duration == 0) {
            return R::Err(Error(ErrorCode::ConfigInvalid,
                                "slot_duration_ms must be a positive integer"));
        }
        result.slot_duration_ms = *duration;
    }

    if (config.has("genesis_timestamp")) {
        auto genesis = config.get<uint64_t>("genesis_timestamp");
        if (!config.data().at("genesis_timestamp").is_number_unsigned() || !genesis) {
            return R::Err(Error(ErrorCode::ConfigInvalid,
                                "genesis_timestamp must be a non-negative integer"));
        }
        result.genesis_timestamp_ms = *genesis;
    }

    if (config.has("hidden_trait")) {
        auto trait = config.get<std::string>("hidden_trait");
        if (!trait) {
            return R::Err(Error(ErrorCode::ConfigInvalid, "hidden_trait must be a string"));
        }
        result.hidden_trait = *trait;
    }

    return R::Ok(std::move(result));
}

core::StateMachineOptions ProgramConfig::state_machine_options() const {
    core::StateMachineOptions options;
    if (hidden_trait) {
        options.mint_metadata.push_back({metadata::keys::HIDDEN_TRAIT, *hidden_trait});
    }
    options.reveal_hidden_trait = true;
    return options;
}

time::SlotClock ProgramConfig::slot_clock() const {
    return time::SlotClock(genesis_timestamp_ms, slot_duration_ms);
}

std::unique_ptr<core::EntropySource> ProgramConfig::make_entropy_source() const {
    return std::make_unique<core::SystemEntropySource>(slot_clock());
}

void ProgramConfig::apply_logging() const {
    utils::Logger::init(log_level, log_to_file);
    PUZZLEMINT_LOG_INFO("puzzlemint {} program {} configured (authority {})",
                        PUZZLEMINT_VERSION_STRING, program_id.to_string(), update_authority.to_string());
}

} // namespace puzzlemint::program
