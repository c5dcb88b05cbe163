#include <stash/name.hpp>
#include <cctype>
#include <cstdint>

namespace stash {

Result<ScriptName> ScriptName::parse(const std::string& raw) {
    if (raw.empty()) {
        return StashError{StashError::InvalidArg, "empty script name"};
    }

    if (raw == "." || raw == "..") {
        return StashError{StashError::InvalidArg,
            "invalid script name '" + raw + "'",
            "'.' and '..' are reserved"};
    }

    if (!is_valid_utf8(raw)) {
        return StashError{StashError::InvalidArg,
            "script name is not valid UTF-8",
            "rename the script using UTF-8 characters only"};
    }

    for (char c : raw) {
        if (c == '/' || c == '\\') {
            return StashError{StashError::InvalidArg,
                "invalid character '" + std::string(1, c) +
                "' in script name '" + raw + "'",
                "script names cannot contain path separators"};
        }
        if (std::iscntrl(static_cast<unsigned char>(c))) {
            return StashError{StashError::InvalidArg,
                "control character in script name '" + raw + "'"};
        }
    }

    ScriptName name;
    name.raw_ = raw;
    return Result<ScriptName>::ok(std::move(name));
}

bool ScriptName::is_valid(const std::string& raw) {
    return parse(raw).is_ok();
}

const std::string& ScriptName::str() const { return raw_; }

bool ScriptName::operator==(const ScriptName& o) const {
    return raw_ == o.raw_;
}

bool ScriptName::operator!=(const ScriptName& o) const {
    return !(*this == o);
}

bool is_valid_utf8(const std::string& s) {
    size_t i = 0;
    const size_t n = s.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t len;
        uint32_t cp;
        if (c >= 0xC2 && c <= 0xDF) {
            len = 2; cp = c & 0x1F;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 3; cp = c & 0x0F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4; cp = c & 0x07;
        } else {
            return false;
        }
        if (i + len > n) return false;

        for (size_t k = 1; k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        if ((len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;
        if (cp > 0x10FFFF) return false;
        i += len;
    }
    return true;
}

Status check_utf8(const std::string& s, const std::string& what) {
    if (is_valid_utf8(s)) return ok_status();
    return StashError{StashError::InvalidArg,
        what + " is not valid UTF-8",
        "convert it to UTF-8 first, e.g. with iconv"};
}

} // namespace stash
