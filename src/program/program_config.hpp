#pragma once

#include "puzzlemint/common.hpp"
#include "puzzlemint/error.hpp"
#include "core/entropy/entropy.hpp"
#include "core/puzzle/state_machine.hpp"
#include "puzzlemint/time_utils.hpp"
#include "utils/config.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace puzzlemint::program {

/**
 * ProgramConfig - Startup constants for a PuzzleProgram.
 *
 * JSON keys:
 *   program_id         hex identity (required)
 *   update_authority   hex identity (required)
 *   log_level          spdlog level name, default "info"
 *   log_to_file        bool, default false
 *   slot_duration_ms   positive integer, default 400
 *   genesis_timestamp  Unix milliseconds, default 0
 *   hidden_trait       string placed under hidden_trait at mint (optional)
 */
struct ProgramConfig {
    Identity program_id;
    Identity update_authority;
    std::string log_level = "info";
    bool log_to_file = false;
    uint64_t slot_duration_ms = constants::DEFAULT_SLOT_DURATION_MS;
    uint64_t genesis_timestamp_ms = 0;
    std::optional<std::string> hidden_trait;

    static Result<ProgramConfig> from_config(const utils::Config& config);

    /**
     * Mint metadata and reveal behaviour derived from this config
     */
    core::StateMachineOptions state_machine_options() const;

    /**
     * Slot clock from genesis_timestamp / slot_duration_ms
     */
    time::SlotClock slot_clock() const;

    /**
     * Wall-clock entropy driven by slot_clock()
     */
    std::unique_ptr<core::EntropySource> make_entropy_source() const;

    /**
     * Initialize the global logger from log_level / log_to_file
     */
    void apply_logging() const;
};

} // namespace puzzlemint::program
