#pragma once

#include <stash/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace stash {

// Inline metadata block at the top of a script:
//
//   # /// script
//   # description = "Rename photos by EXIF date"
//   # requires-python = ">=3.9"
//   # dependencies = [
//   #     "pillow>=10",
//   # ]
//   # ///
//
// Field values are TOML. Unknown fields (and known fields whose value has
// an unexpected type) are carried verbatim in `extra`.

inline constexpr const char* kHeaderOpen = "# /// script";
inline constexpr const char* kHeaderClose = "# ///";

// A field kept verbatim: key plus its source lines without the "# " prefix
struct HeaderField {
    std::string key;
    std::vector<std::string> lines;

    bool operator==(const HeaderField& o) const {
        return key == o.key && lines == o.lines;
    }
};

struct DependencyHeader {
    std::optional<std::string> description;
    std::optional<std::vector<std::string>> dependencies;
    std::optional<std::string> requires_python;
    std::optional<std::vector<std::string>> authors;
    std::optional<std::string> date;
    std::optional<std::vector<std::string>> tags;
    std::vector<HeaderField> extra;

    // Keys in source order; encode() follows it so re-encoding keeps layout
    std::vector<std::string> order;

    const HeaderField* find_extra(const std::string& key) const;

    bool operator==(const DependencyHeader& o) const;
    bool operator!=(const DependencyHeader& o) const { return !(*this == o); }
};

struct HeaderDecode {
    std::optional<DependencyHeader> header;
    std::string body;
    std::string problem;  // set when a block was present but malformed

    bool malformed() const { return !problem.empty(); }
};

// Never fails: a malformed block yields no header, the whole text as body,
// and a description of the problem for the caller to log.
HeaderDecode decode_header(const std::string& text);

// Just the delimited block, ending with the closing marker line
std::string render_header_block(const DependencyHeader& header);

// Block, one blank line, body
std::string encode_header(const DependencyHeader& header, const std::string& body);

struct HeaderDefaults {
    std::string description;
    std::vector<std::string> authors;
    std::string requires_python = ">=3.9";
    std::vector<std::string> tags;
};

// Returns text unchanged if it already carries a well-formed header,
// otherwise prepends one built from defaults (dated today, no dependencies).
// A malformed block is left in place below the new header.
std::string ensure_header(const std::string& text, const HeaderDefaults& defaults);

} // namespace stash
