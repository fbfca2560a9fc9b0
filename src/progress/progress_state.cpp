#include "cliutil/progress/progress_state.hpp"

namespace cliutil {
namespace progress {

std::string to_string(SessionPhase phase) {
    switch (phase) {
        case SessionPhase::UNINITIALIZED: return "UNINITIALIZED";
        case SessionPhase::RESET: return "RESET";
        case SessionPhase::ACTIVE: return "ACTIVE";
        case SessionPhase::ENDED: return "ENDED";
    }
    return "UNKNOWN";
}

}}
