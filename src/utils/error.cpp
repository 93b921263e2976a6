#include "puzzlemint/error.hpp"
#include <sstream>

namespace puzzlemint {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";

        case ErrorCode::IncorrectSolution: return "The provided solution is incorrect";
        case ErrorCode::PuzzleNotFound: return "Puzzle not found in asset attributes";
        case ErrorCode::AttributeNotFound: return "Attribute not found";
        case ErrorCode::NotNftOwner: return "Only the asset owner can attempt to solve the puzzle";
        case ErrorCode::AlreadySolved: return "Puzzle has already been solved";
        case ErrorCode::InvalidPuzzleType: return "Invalid puzzle type";
        case ErrorCode::FailedToParsePuzzleData: return "Failed to parse puzzle data";

        case ErrorCode::InvalidAssetData: return "Invalid asset data";
        case ErrorCode::UnauthorizedUpdate: return "Unauthorized update attempt";

        case ErrorCode::LedgerConflict: return "Ledger conflict";

        case ErrorCode::ConfigInvalid: return "Invalid configuration";

        default: return "Unknown error code";
    }
}

std::string Error::to_string() const {
    std::ostringstream oss;
    oss << "[" << error_code_to_string(code_) << "] " << message_;
    if (!details_.empty()) {
        oss << " (" << details_ << ")";
    }
    return oss.str();
}

} // namespace puzzlemint
