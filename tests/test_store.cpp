#include <catch2/catch.hpp>
#include <stash/store.hpp>
#include "support/temp_dir.hpp"
#include <filesystem>

using namespace stash;
using stash::testing::TempDir;
namespace fs = std::filesystem;

static ScriptEntry entry(const std::string& name, const std::string& id = "") {
    ScriptEntry e;
    e.script_name = name;
    e.document_id = id;
    e.created_at = 1700000000;
    e.updated_at = 1700000000;
    return e;
}

TEST_CASE("missing mapping file loads as empty record", "[store]") {
    TempDir td;
    LocalStore store(td.str());
    auto r = store.load();
    REQUIRE(r.is_ok());
    REQUIRE(r.value().entries.empty());
    REQUIRE_FALSE(r.value().revision.has_value());
}

TEST_CASE("save then load returns the same record", "[store]") {
    TempDir td;
    LocalStore store(td.str() + "/nested/root");

    MappingRecord rec;
    rec.upsert(entry("backup", "g1"));
    rec.upsert(entry("draft"));
    rec.revision = "rev3";
    rec.pending_removals.insert("gone");

    REQUIRE(store.save(rec).is_ok());
    auto back = store.load();
    REQUIRE(back.is_ok());
    REQUIRE(back.value().entries == rec.entries);
    REQUIRE(back.value().revision == std::string("rev3"));
    REQUIRE(back.value().pending_removals.count("gone") == 1);
}

TEST_CASE("save leaves no temp files behind", "[store]") {
    TempDir td;
    LocalStore store(td.str());
    REQUIRE(store.save(MappingRecord{}).is_ok());
    REQUIRE(store.save(MappingRecord{}).is_ok());

    int files = 0;
    for (const auto& e : fs::directory_iterator(td.path)) {
        REQUIRE(e.path().filename().string().find(".tmp") == std::string::npos);
        ++files;
    }
    REQUIRE(files == 1);
}

TEST_CASE("corrupt mapping file is CorruptLocalState and is kept", "[store]") {
    TempDir td;
    td.write_file("mapping.json", "{ this is not json");
    LocalStore store(td.str());

    auto r = store.load();
    REQUIRE(r.is_err(StashError::CorruptLocalState));
    REQUIRE(r.error().file == store.mapping_path());
    // Never reset behind the operator's back
    REQUIRE(td.read_file("mapping.json") == "{ this is not json");
}

TEST_CASE("structurally wrong mapping file is CorruptLocalState", "[store]") {
    TempDir td;
    td.write_file("mapping.json", R"({"entries": {"a": {"tags": 3}}})");
    REQUIRE(LocalStore(td.str()).load().is_err(StashError::CorruptLocalState));
}

TEST_CASE("script cache round trip", "[store]") {
    TempDir td;
    LocalStore store(td.str());

    REQUIRE_FALSE(store.has_cached_script("hello"));
    REQUIRE(store.read_cached_script("hello").is_err(StashError::NotFound));

    REQUIRE(store.cache_script("hello", "print('hi')\n").is_ok());
    REQUIRE(store.has_cached_script("hello"));
    REQUIRE(store.read_cached_script("hello").value() == "print('hi')\n");
    REQUIRE(td.exists("scripts/hello.py"));

    REQUIRE(store.remove_cached_script("hello").is_ok());
    REQUIRE_FALSE(store.has_cached_script("hello"));
    // Removing twice is fine
    REQUIRE(store.remove_cached_script("hello").is_ok());
}

TEST_CASE("cache rejects names that would escape the root", "[store]") {
    TempDir td;
    LocalStore store(td.str());
    REQUIRE(store.cache_script("../evil", "x").is_err(StashError::InvalidArg));
    REQUIRE(store.read_cached_script("..").is_err(StashError::InvalidArg));
}

TEST_CASE("pointer round trip", "[store]") {
    TempDir td;
    LocalStore store(td.str());
    REQUIRE_FALSE(store.load_pointer().value().has_value());

    RemoteDocumentPointer p{"abc123", "octocat", 1700000000};
    REQUIRE(store.save_pointer(p).is_ok());
    auto back = store.load_pointer();
    REQUIRE(back.is_ok());
    REQUIRE(back.value().has_value());
    REQUIRE(*back.value() == p);
}

TEST_CASE("corrupt pointer file is CorruptLocalState", "[store]") {
    TempDir td;
    LocalStore store(td.str());

    td.write_file("pointer.json", "[");
    REQUIRE(store.load_pointer().is_err(StashError::CorruptLocalState));

    td.write_file("pointer.json", R"({"owner": "me"})");
    REQUIRE(store.load_pointer().is_err(StashError::CorruptLocalState));

    td.write_file("pointer.json", R"({"document_id": ""})");
    REQUIRE(store.load_pointer().is_err(StashError::CorruptLocalState));
}

TEST_CASE("paths live under the root", "[store]") {
    LocalStore store("/data/stash");
    REQUIRE(store.mapping_path() == "/data/stash/mapping.json");
    REQUIRE(store.pointer_path() == "/data/stash/pointer.json");
    REQUIRE(store.lock_path() == "/data/stash/sync.lock");
    REQUIRE(store.script_path("tool") == "/data/stash/scripts/tool.py");
}

TEST_CASE("atomic writes replace the whole file", "[store]") {
    TempDir td;
    std::string path = td.str() + "/deep/er/file.txt";
    REQUIRE(write_file_atomic(path, "first version, longer\n").is_ok());
    REQUIRE(write_file_atomic(path, "second\n").is_ok());
    REQUIRE(td.read_file("deep/er/file.txt") == "second\n");

    int files = 0;
    for (const auto& e : fs::directory_iterator(td.path / "deep" / "er")) {
        REQUIRE(e.path().filename().string().find(".tmp") == std::string::npos);
        ++files;
    }
    REQUIRE(files == 1);
}

TEST_CASE("atomic write into an unwritable spot is an IO error", "[store]") {
    TempDir td;
    td.write_file("plain", "x");
    // A regular file cannot hold children
    auto r = write_file_atomic(td.str() + "/plain/child", "y");
    REQUIRE(r.is_err());
    REQUIRE(td.read_file("plain") == "x");
}

TEST_CASE("records that cannot be encoded are reported, not thrown", "[store]") {
    TempDir td;
    LocalStore store(td.str());
    REQUIRE(store.save(MappingRecord{}).is_ok());
    std::string before = td.read_file("mapping.json");

    MappingRecord rec;
    ScriptEntry bad = entry("tool");
    bad.description = "caf\xe9";
    // Bypasses upsert, which would refuse it
    rec.entries.emplace("tool", bad);

    Status saved = ok_status();
    REQUIRE_NOTHROW(saved = store.save(rec));
    REQUIRE(saved.is_err(StashError::InvalidArg));
    REQUIRE(td.read_file("mapping.json") == before);

    MappingRecord named;
    named.entries.emplace("caf\xe9", entry("caf\xe9"));
    REQUIRE_NOTHROW(saved = store.save(named));
    REQUIRE(saved.is_err(StashError::InvalidArg));
}
