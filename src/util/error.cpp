#include <stash/error.hpp>

namespace stash {

const char* StashError::code_name(Code c) {
    switch (c) {
        case IO:                    return "IO";
        case Parse:                 return "Parse";
        case Config:                return "Config";
        case NotFound:              return "NotFound";
        case InvalidArg:            return "InvalidArg";
        case CorruptLocalState:     return "CorruptLocalState";
        case CorruptRemoteState:    return "CorruptRemoteState";
        case AuthenticationFailed:  return "AuthenticationFailed";
        case RateLimited:           return "RateLimited";
        case Transport:             return "Transport";
        case RemoteNotFound:        return "RemoteNotFound";
        case RevisionMismatch:      return "RevisionMismatch";
        case NoMappingFound:        return "NoMappingFound";
        case AmbiguousMapping:      return "AmbiguousMapping";
        case SyncConflict:          return "SyncConflict";
        case SyncAlreadyInProgress: return "SyncAlreadyInProgress";
        case Cancelled:             return "Cancelled";
    }
    return "Unknown";
}

bool StashError::is_retryable() const {
    return code == Transport || code == RateLimited;
}

std::string StashError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

} // namespace stash
