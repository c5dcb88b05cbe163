#include <catch2/catch.hpp>
#include <stash/mapping.hpp>

using namespace stash;

static ScriptEntry make_entry(const std::string& name, const std::string& id,
                              Timestamp updated, std::set<std::string> tags = {}) {
    ScriptEntry e;
    e.script_name = name;
    e.document_id = id;
    e.created_at = 1700000000;
    e.updated_at = updated;
    e.tags = std::move(tags);
    return e;
}

TEST_CASE("sentinel and script descriptions never collide", "[mapping]") {
    REQUIRE(script_document_description("stash:mapping-record:v1") != kMappingSentinel);
    REQUIRE(script_document_description("backup") == "[stash] backup");
}

TEST_CASE("script file names get a .py suffix once", "[mapping]") {
    REQUIRE(script_file_name("backup") == "backup.py");
    REQUIRE(script_file_name("backup.py") == "backup.py");
    REQUIRE(script_file_name(".py") == ".py.py");
}

TEST_CASE("upsert keys by script name and validates it", "[mapping]") {
    MappingRecord r;
    REQUIRE(r.upsert(make_entry("a", "", 1)).is_ok());
    REQUIRE(r.upsert(make_entry("a", "g1", 2)).is_ok());
    REQUIRE(r.entries.size() == 1);
    REQUIRE(r.find("a")->document_id == "g1");
    REQUIRE(r.upsert(make_entry("bad/name", "", 1)).is_err(StashError::InvalidArg));
    REQUIRE(r.erase("a"));
    REQUIRE_FALSE(r.erase("a"));
    REQUIRE(r.find("a") == nullptr);
}

TEST_CASE("document JSON has schema and entries only", "[mapping]") {
    MappingRecord r;
    r.upsert(make_entry("backup", "g1", 1700000100, {"ops"}));
    r.revision = "rev-9";
    r.pending_removals.insert("old");
    r.last_synced = 1700000200;

    auto text = r.to_document_json();
    REQUIRE(text.find("\"schema\": 1") != std::string::npos);
    REQUIRE(text.find("\"updated_at\": \"2023-11-14T22:15:00Z\"") != std::string::npos);
    REQUIRE(text.find("rev-9") == std::string::npos);
    REQUIRE(text.find("pending_removals") == std::string::npos);
    REQUIRE(text.find("last_synced") == std::string::npos);

    auto back = MappingRecord::from_document_json(text);
    REQUIRE(back.is_ok());
    REQUIRE(back.value().entries == r.entries);
    REQUIRE_FALSE(back.value().revision.has_value());
}

TEST_CASE("local JSON keeps revision and bookkeeping", "[mapping]") {
    MappingRecord r;
    r.upsert(make_entry("backup", "", 1700000100));
    r.revision = "rev-9";
    r.pending_removals.insert("old");
    r.modified.insert("backup");
    r.last_synced = 1700000200;

    auto back = MappingRecord::from_local_json(r.to_local_json());
    REQUIRE(back.is_ok());
    REQUIRE(back.value().entries == r.entries);
    REQUIRE(back.value().revision == std::string("rev-9"));
    REQUIRE(back.value().last_synced == Timestamp(1700000200));
    REQUIRE(back.value().pending_removals == std::set<std::string>{"old"});
    REQUIRE(back.value().modified == std::set<std::string>{"backup"});
    REQUIRE(r.to_document_json().find("modified") == std::string::npos);
}

TEST_CASE("upsert rejects text that is not UTF-8", "[mapping]") {
    MappingRecord r;
    REQUIRE(r.upsert(make_entry("caf\xe9", "", 1)).is_err(StashError::InvalidArg));

    ScriptEntry described = make_entry("tool", "", 1);
    described.description = "r\xe9sum\xe9";
    REQUIRE(r.upsert(described).is_err(StashError::InvalidArg));

    REQUIRE(r.upsert(make_entry("tool", "", 1, {"\xff"})).is_err(StashError::InvalidArg));
    REQUIRE(r.entries.empty());
}

TEST_CASE("minimal document without schema parses", "[mapping]") {
    auto r = MappingRecord::from_document_json(R"({"entries":{}})");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().entries.empty());
}

TEST_CASE("entries with missing optional fields parse", "[mapping]") {
    auto r = MappingRecord::from_document_json(
        R"({"entries":{"hello":{"document_id":"g7","updated_at":"2024-01-01T00:00:00Z"}}})");
    REQUIRE(r.is_ok());
    const auto* e = r.value().find("hello");
    REQUIRE(e != nullptr);
    REQUIRE(e->document_id == "g7");
    REQUIRE(e->created_at == 0);
    REQUIRE(e->tags.empty());
}

TEST_CASE("malformed documents are Parse errors", "[mapping]") {
    REQUIRE(MappingRecord::from_document_json("not json").is_err(StashError::Parse));
    REQUIRE(MappingRecord::from_document_json("[]").is_err(StashError::Parse));
    REQUIRE(MappingRecord::from_document_json(R"({"schema":1})").is_err(StashError::Parse));
    REQUIRE(MappingRecord::from_document_json(
        R"({"entries":{"a":{"script_name":"b"}}})").is_err(StashError::Parse));
    REQUIRE(MappingRecord::from_document_json(
        R"({"entries":{"a":{"tags":"x"}}})").is_err(StashError::Parse));
    REQUIRE(MappingRecord::from_document_json(
        R"({"entries":{"a":{"updated_at":"last week"}}})").is_err(StashError::Parse));
    REQUIRE(MappingRecord::from_document_json(
        R"({"entries":{"a/b":{}}})").is_err(StashError::Parse));
}

TEST_CASE("newer schema versions are refused", "[mapping]") {
    auto r = MappingRecord::from_document_json(R"({"schema":2,"entries":{}})");
    REQUIRE(r.is_err(StashError::Parse));
    REQUIRE(r.error().message.find("schema") != std::string::npos);
}
