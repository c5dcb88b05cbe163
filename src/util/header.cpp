#include <stash/header.hpp>
#include <stash/clock.hpp>
#include <stash/log.hpp>
#include <toml++/toml.hpp>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <sstream>

namespace stash {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static std::string rtrim(const std::string& s) {
    auto end = s.find_last_not_of(" \t\r");
    if (end == std::string::npos) return "";
    return s.substr(0, end + 1);
}

static std::string ltrim(const std::string& s) {
    auto start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    return s.substr(start);
}

// Split keeping track of where each line starts in the source text
struct SourceLine {
    std::string text;     // without the newline, '\r' stripped
    size_t next = 0;      // offset just past this line's newline
};

static std::vector<SourceLine> split_lines(const std::string& text) {
    std::vector<SourceLine> lines;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t nl = text.find('\n', pos);
        size_t end = (nl == std::string::npos) ? text.size() : nl;
        std::string line = text.substr(pos, end - pos);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        pos = (nl == std::string::npos) ? text.size() : nl + 1;
        lines.push_back(SourceLine{std::move(line), pos});
    }
    return lines;
}

// Bracket depth after scanning a TOML line, ignoring strings and comments
static int bracket_delta(const std::string& line) {
    int delta = 0;
    bool in_basic = false;
    bool in_literal = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (in_basic) {
            if (c == '\\') { ++i; continue; }
            if (c == '"') in_basic = false;
            continue;
        }
        if (in_literal) {
            if (c == '\'') in_literal = false;
            continue;
        }
        if (c == '"') in_basic = true;
        else if (c == '\'') in_literal = true;
        else if (c == '#') break;
        else if (c == '[') ++delta;
        else if (c == ']') --delta;
    }
    return delta;
}

// Bare key at the start of `line` followed by '='; empty if none
static std::string leading_key(const std::string& line) {
    std::string s = ltrim(line);
    size_t i = 0;
    while (i < s.size() &&
           (std::isalnum(static_cast<unsigned char>(s[i])) ||
            s[i] == '_' || s[i] == '-' || s[i] == '.')) {
        ++i;
    }
    if (i == 0) return "";
    size_t j = i;
    while (j < s.size() && (s[j] == ' ' || s[j] == '\t')) ++j;
    if (j >= s.size() || s[j] != '=') return "";
    return s.substr(0, i);
}

static bool is_table_header(const std::string& line) {
    std::string s = ltrim(line);
    return !s.empty() && s[0] == '[';
}

static std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (const auto& l : lines) {
        out += l;
        out += '\n';
    }
    return out;
}

static std::string quote(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
    return out;
}

static std::string inline_array(const std::vector<std::string>& values) {
    std::string out = "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ", ";
        out += quote(values[i]);
    }
    out += "]";
    return out;
}

static std::optional<std::vector<std::string>> string_array(const toml::node& node) {
    auto arr = node.as_array();
    if (!arr) return std::nullopt;
    std::vector<std::string> out;
    for (const auto& elem : *arr) {
        if (!elem.is_string()) return std::nullopt;
        out.push_back(std::string(*elem.value<std::string>()));
    }
    return out;
}

static bool is_known_key(const std::string& key) {
    return key == "description" || key == "dependencies" ||
           key == "requires-python" || key == "authors" ||
           key == "date" || key == "tags";
}

// Assign a parsed value to its typed slot. False means the value has an
// unexpected type and the field should be kept verbatim instead.
static bool assign_known(DependencyHeader& h, const std::string& key, const toml::node& node) {
    if (key == "description" || key == "requires-python" || key == "date") {
        if (!node.is_string()) return false;
        std::string v(*node.value<std::string>());
        if (key == "description") h.description = std::move(v);
        else if (key == "requires-python") h.requires_python = std::move(v);
        else h.date = std::move(v);
        return true;
    }

    auto list = string_array(node);
    if (!list) return false;
    if (key == "dependencies") h.dependencies = std::move(*list);
    else if (key == "authors") h.authors = std::move(*list);
    else h.tags = std::move(*list);
    return true;
}

// ---------------------------------------------------------------------------
// DependencyHeader
// ---------------------------------------------------------------------------

const HeaderField* DependencyHeader::find_extra(const std::string& key) const {
    for (const auto& f : extra) {
        if (f.key == key) return &f;
    }
    return nullptr;
}

bool DependencyHeader::operator==(const DependencyHeader& o) const {
    return description == o.description &&
           dependencies == o.dependencies &&
           requires_python == o.requires_python &&
           authors == o.authors &&
           date == o.date &&
           tags == o.tags &&
           extra == o.extra;
}

// ---------------------------------------------------------------------------
// decode_header
// ---------------------------------------------------------------------------

HeaderDecode decode_header(const std::string& text) {
    HeaderDecode out;
    out.body = text;

    auto lines = split_lines(text);
    if (lines.empty() || rtrim(lines[0].text) != kHeaderOpen) {
        return out;
    }

    // Collect the content lines up to the closing marker
    std::vector<std::string> content;
    size_t close_index = 0;
    bool closed = false;
    for (size_t i = 1; i < lines.size(); ++i) {
        std::string line = rtrim(lines[i].text);
        if (line == kHeaderClose) {
            close_index = i;
            closed = true;
            break;
        }
        if (line.empty() || line[0] != '#') {
            out.problem = "line " + std::to_string(i + 1) +
                " inside the metadata block is not a comment";
            return out;
        }
        if (line.size() > 1 && line[1] != ' ') {
            out.problem = "line " + std::to_string(i + 1) +
                " inside the metadata block must start with '# '";
            return out;
        }
        content.push_back(line.size() > 2 ? line.substr(2) : "");
    }
    if (!closed) {
        out.problem = "metadata block is missing its closing '# ///' line";
        return out;
    }

    // Group content lines into fields
    DependencyHeader header;
    std::vector<HeaderField> fields;
    int depth = 0;
    for (size_t i = 0; i < content.size(); ++i) {
        const std::string& line = content[i];

        if (depth > 0) {
            fields.back().lines.push_back(line);
            depth += bracket_delta(line);
            continue;
        }

        std::string trimmed = ltrim(line);
        if (trimmed.empty() || trimmed[0] == '#') continue;

        if (is_table_header(trimmed)) {
            // A table runs to the end of the block; keep the rest as one field
            HeaderField table{trimmed, {}};
            for (size_t j = i; j < content.size(); ++j) {
                table.lines.push_back(j == i ? trimmed : content[j]);
            }
            while (!table.lines.empty() && ltrim(table.lines.back()).empty()) {
                table.lines.pop_back();
            }
            fields.push_back(std::move(table));
            depth = 0;
            break;
        }

        std::string key = leading_key(trimmed);
        if (key.empty()) {
            out.problem = "unexpected metadata line '" + trimmed + "'";
            return out;
        }
        fields.push_back(HeaderField{key, {trimmed}});
        depth = bracket_delta(trimmed);
    }
    if (depth != 0) {
        out.problem = "unbalanced brackets in field '" + fields.back().key + "'";
        return out;
    }

    for (auto& field : fields) {
        for (const auto& seen : header.order) {
            if (seen == field.key) {
                out.problem = "duplicate metadata field '" + field.key + "'";
                return out;
            }
        }

        toml::table parsed;
        try {
            parsed = toml::parse(join_lines(field.lines));
        } catch (const toml::parse_error& e) {
            out.problem = "metadata field '" + field.key + "' is not valid TOML: " +
                std::string(e.description());
            return out;
        }

        header.order.push_back(field.key);
        auto node = parsed.get(field.key);
        if (node && is_known_key(field.key) && assign_known(header, field.key, *node)) {
            continue;
        }
        header.extra.push_back(std::move(field));
    }

    // Body: after the closing line and at most one blank separator line
    size_t body_start = lines[close_index].next;
    if (close_index + 1 < lines.size() && lines[close_index + 1].text.empty()) {
        body_start = lines[close_index + 1].next;
    }
    out.header = std::move(header);
    out.body = text.substr(std::min(body_start, text.size()));
    return out;
}

// ---------------------------------------------------------------------------
// encode_header
// ---------------------------------------------------------------------------

static void emit(std::ostringstream& ss, const std::string& line) {
    if (line.empty()) ss << "#\n";
    else ss << "# " << line << "\n";
}

static bool emit_known(std::ostringstream& ss, const DependencyHeader& h,
                       const std::string& key) {
    if (key == "description" && h.description) {
        emit(ss, "description = " + quote(*h.description));
    } else if (key == "authors" && h.authors) {
        emit(ss, "authors = " + inline_array(*h.authors));
    } else if (key == "date" && h.date) {
        emit(ss, "date = " + quote(*h.date));
    } else if (key == "requires-python" && h.requires_python) {
        emit(ss, "requires-python = " + quote(*h.requires_python));
    } else if (key == "dependencies" && h.dependencies) {
        if (h.dependencies->empty()) {
            emit(ss, "dependencies = []");
        } else {
            emit(ss, "dependencies = [");
            for (const auto& dep : *h.dependencies) {
                emit(ss, "    " + quote(dep) + ",");
            }
            emit(ss, "]");
        }
    } else if (key == "tags" && h.tags) {
        emit(ss, "tags = " + inline_array(*h.tags));
    } else {
        return false;
    }
    return true;
}

std::string render_header_block(const DependencyHeader& header) {
    static const char* const canonical[] = {
        "description", "authors", "date", "requires-python", "dependencies", "tags"
    };

    std::ostringstream ss;
    ss << kHeaderOpen << "\n";

    std::vector<std::string> written;
    auto already = [&](const std::string& key) {
        for (const auto& w : written) if (w == key) return true;
        return false;
    };

    for (const auto& key : header.order) {
        if (already(key)) continue;
        if (emit_known(ss, header, key)) {
            written.push_back(key);
        } else if (auto f = header.find_extra(key)) {
            for (const auto& line : f->lines) emit(ss, line);
            written.push_back(key);
        }
    }
    for (const char* key : canonical) {
        if (!already(key) && emit_known(ss, header, key)) written.push_back(key);
    }
    for (const auto& f : header.extra) {
        if (already(f.key)) continue;
        for (const auto& line : f.lines) emit(ss, line);
        written.push_back(f.key);
    }

    ss << kHeaderClose << "\n";
    return ss.str();
}

std::string encode_header(const DependencyHeader& header, const std::string& body) {
    return render_header_block(header) + "\n" + body;
}

std::string ensure_header(const std::string& text, const HeaderDefaults& defaults) {
    auto decoded = decode_header(text);
    if (decoded.header) return text;
    if (decoded.malformed()) {
        log::warn("script metadata is malformed (%s), prepending a fresh header",
                  decoded.problem.c_str());
    }

    DependencyHeader h;
    h.description = defaults.description;
    h.authors = defaults.authors;
    h.date = today_utc();
    h.requires_python = defaults.requires_python;
    h.dependencies = std::vector<std::string>{};
    h.tags = defaults.tags;
    return encode_header(h, text);
}

} // namespace stash
