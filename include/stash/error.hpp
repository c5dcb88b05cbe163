#pragma once

#include <string>

namespace stash {

struct StashError {
    enum Code {
        IO,
        Parse,
        Config,
        NotFound,
        InvalidArg,
        CorruptLocalState,
        CorruptRemoteState,
        AuthenticationFailed,
        RateLimited,
        Transport,
        RemoteNotFound,
        RevisionMismatch,
        NoMappingFound,
        AmbiguousMapping,
        SyncConflict,
        SyncAlreadyInProgress,
        Cancelled
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    StashError() = default;
    StashError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    StashError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    StashError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);

    // Transport failures and rate limiting may succeed on a later attempt
    bool is_retryable() const;
};

} // namespace stash
