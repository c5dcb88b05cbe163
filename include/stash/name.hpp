#pragma once

#include <stash/result.hpp>
#include <string>

namespace stash {

// Script name: non-empty, case-sensitive, valid UTF-8, no path separators.
// Names double as cache file stems, so "." and ".." are rejected too.
struct ScriptName {
    static Result<ScriptName> parse(const std::string& raw);
    static bool is_valid(const std::string& raw);

    const std::string& str() const;

    bool operator==(const ScriptName& o) const;
    bool operator!=(const ScriptName& o) const;

private:
    std::string raw_;
};

// Well-formed UTF-8: no overlong forms, surrogates or code points past
// U+10FFFF. Every string that ends up in a JSON document must pass.
bool is_valid_utf8(const std::string& s);

// InvalidArg naming `what` when s is not valid UTF-8
Status check_utf8(const std::string& s, const std::string& what);

} // namespace stash
