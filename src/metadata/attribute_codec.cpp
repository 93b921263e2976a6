#include "attribute_codec.hpp"
#include <algorithm>
#include <charconv>
#include <set>

namespace puzzlemint::metadata {

using core::PuzzleInstance;

namespace {

    Error missing(ErrorCode code, const std::string& key) {
        return Error(code, "Required attribute missing", "key=" + key);
    }

    Error malformed(const std::string& key, const std::string& value) {
        return Error(ErrorCode::FailedToParsePuzzleData,
                     "Attribute value does not parse", key + "=" + value);
    }

    // Decimal digits only (a '-' only for signed T), no '+' sign, no whitespace, no overflow
    template<typename T>
    std::optional<T> parse_integer(const std::string& text) {
        if (text.empty()) {
            return std::nullopt;
        }
        T value{};
        const char* first = text.data();
        const char* last = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(first, last, value, 10);
        if (ec != std::errc() || ptr != last) {
            return std::nullopt;
        }
        return value;
    }

    std::optional<bool> parse_bool(const std::string& text) {
        if (text == "true") return true;
        if (text == "false") return false;
        return std::nullopt;
    }

} // namespace

AttributeList AttributeCodec::encode(const PuzzleInstance& puzzle) {
    AttributeList attributes = {
        {keys::PUZZLE_TYPE, core::puzzle_type_to_string(puzzle.puzzle_type)},
        {keys::DIFFICULTY, std::to_string(puzzle.difficulty)},
        {keys::PUZZLE_NUMBER, std::to_string(puzzle.puzzle_number)},
        {keys::SOLUTION_HASH, puzzle.solution_hash},
        {keys::SOLVED, puzzle.solved ? "true" : "false"},
        {keys::MINT_SLOT, std::to_string(puzzle.mint_slot)},
    };
    if (puzzle.seed) {
        attributes.push_back({keys::SEED, hash_to_hex(*puzzle.seed)});
    }

    if (puzzle.solved) {
        if (puzzle.solver) {
            attributes.push_back({keys::SOLVER, puzzle.solver->to_string()});
        }
        if (puzzle.solution) {
            attributes.push_back({keys::SOLUTION, std::to_string(*puzzle.solution)});
        }
        if (puzzle.solved_at) {
            attributes.push_back({keys::SOLVE_TIMESTAMP, std::to_string(*puzzle.solved_at)});
        }
        if (puzzle.rarity) {
            attributes.push_back({keys::RARITY, core::rarity_to_string(*puzzle.rarity)});
        }
    }

    return attributes;
}

Result<PuzzleInstance> AttributeCodec::decode(const AttributeList& attributes) {
    using R = Result<PuzzleInstance>;

    std::set<std::string> seen;
    for (const auto& attr : attributes) {
        if (!seen.insert(attr.key).second) {
            return R::Err(Error(ErrorCode::FailedToParsePuzzleData,
                                "Duplicate attribute key", "key=" + attr.key));
        }
    }

    // The puzzle itself
    auto type_name = find(attributes, keys::PUZZLE_TYPE);
    if (!type_name) return R::Err(missing(ErrorCode::PuzzleNotFound, keys::PUZZLE_TYPE));
    auto number_text = find(attributes, keys::PUZZLE_NUMBER);
    if (!number_text) return R::Err(missing(ErrorCode::PuzzleNotFound, keys::PUZZLE_NUMBER));
    auto solution_hash = find(attributes, keys::SOLUTION_HASH);
    if (!solution_hash) return R::Err(missing(ErrorCode::PuzzleNotFound, keys::SOLUTION_HASH));

    PuzzleInstance puzzle;

    auto type = core::puzzle_type_from_string(*type_name);
    if (!type) {
        return R::Err(Error(ErrorCode::InvalidPuzzleType,
                            "Unrecognized puzzle type name", "puzzle_type=" + *type_name));
    }
    puzzle.puzzle_type = *type;

    auto number = parse_integer<uint64_t>(*number_text);
    if (!number) return R::Err(malformed(keys::PUZZLE_NUMBER, *number_text));
    puzzle.puzzle_number = *number;

    if (solution_hash->empty()) return R::Err(malformed(keys::SOLUTION_HASH, *solution_hash));
    puzzle.solution_hash = *solution_hash;

    // Remaining required keys
    auto difficulty_text = find(attributes, keys::DIFFICULTY);
    if (!difficulty_text) return R::Err(missing(ErrorCode::AttributeNotFound, keys::DIFFICULTY));
    auto difficulty = parse_integer<uint8_t>(*difficulty_text);
    if (!difficulty) return R::Err(malformed(keys::DIFFICULTY, *difficulty_text));
    puzzle.difficulty = *difficulty;

    auto solved_text = find(attributes, keys::SOLVED);
    if (!solved_text) return R::Err(missing(ErrorCode::AttributeNotFound, keys::SOLVED));
    auto solved = parse_bool(*solved_text);
    if (!solved) return R::Err(malformed(keys::SOLVED, *solved_text));
    puzzle.solved = *solved;

    auto slot_text = find(attributes, keys::MINT_SLOT);
    if (!slot_text) return R::Err(missing(ErrorCode::AttributeNotFound, keys::MINT_SLOT));
    auto slot = parse_integer<uint64_t>(*slot_text);
    if (!slot) return R::Err(malformed(keys::MINT_SLOT, *slot_text));
    puzzle.mint_slot = *slot;

    // Optional: assets minted without a seed still decode
    if (auto seed_text = find(attributes, keys::SEED)) {
        auto seed = try_hex_to_hash(*seed_text);
        if (!seed) return R::Err(malformed(keys::SEED, *seed_text));
        puzzle.seed = *seed;
    }

    // Post-solve keys: all present when solved, none when not
    auto solver_text = find(attributes, keys::SOLVER);
    auto solution_text = find(attributes, keys::SOLUTION);
    auto timestamp_text = find(attributes, keys::SOLVE_TIMESTAMP);
    auto rarity_text = find(attributes, keys::RARITY);

    if (!puzzle.solved) {
        if (solver_text || solution_text || timestamp_text || rarity_text) {
            return R::Err(Error(ErrorCode::FailedToParsePuzzleData,
                                "Post-solve attributes present on unsolved puzzle"));
        }
        return R::Ok(std::move(puzzle));
    }

    if (!solver_text) return R::Err(missing(ErrorCode::AttributeNotFound, keys::SOLVER));
    if (!solution_text) return R::Err(missing(ErrorCode::AttributeNotFound, keys::SOLUTION));
    if (!timestamp_text) return R::Err(missing(ErrorCode::AttributeNotFound, keys::SOLVE_TIMESTAMP));
    if (!rarity_text) return R::Err(missing(ErrorCode::AttributeNotFound, keys::RARITY));

    auto solver = Identity::parse(*solver_text);
    if (!solver) return R::Err(malformed(keys::SOLVER, *solver_text));
    auto solution = parse_integer<uint64_t>(*solution_text);
    if (!solution) return R::Err(malformed(keys::SOLUTION, *solution_text));
    auto solved_at = parse_integer<int64_t>(*timestamp_text);
    if (!solved_at) return R::Err(malformed(keys::SOLVE_TIMESTAMP, *timestamp_text));
    auto rarity = core::rarity_from_string(*rarity_text);
    if (!rarity) return R::Err(malformed(keys::RARITY, *rarity_text));

    puzzle.solver = *solver;
    puzzle.solution = *solution;
    puzzle.solved_at = *solved_at;
    puzzle.rarity = *rarity;

    return R::Ok(std::move(puzzle));
}

AttributeList AttributeCodec::merge_update(const AttributeList& attributes,
                                           const AttributeUpdates& updates) {
    AttributeList merged = attributes;

    for (const auto& update : updates) {
        auto it = std::find_if(merged.begin(), merged.end(),
                               [&update](const Attribute& attr) { return attr.key == update.first; });
        if (it != merged.end()) {
            it->value = update.second;
        } else {
            merged.push_back({update.first, update.second});
        }
    }

    return merged;
}

std::optional<std::string> AttributeCodec::find(const AttributeList& attributes,
                                                const std::string& key) {
    for (const auto& attr : attributes) {
        if (attr.key == key) {
            return attr.value;
        }
    }
    return std::nullopt;
}

bool AttributeCodec::is_schema_key(const std::string& key) {
    static const std::set<std::string> schema = {
        keys::PUZZLE_TYPE, keys::DIFFICULTY, keys::PUZZLE_NUMBER,
        keys::SOLUTION_HASH, keys::SOLVED, keys::MINT_SLOT, keys::SEED,
        keys::SOLVER, keys::SOLUTION, keys::SOLVE_TIMESTAMP, keys::RARITY,
    };
    return schema.count(key) > 0;
}

} // namespace puzzlemint::metadata
