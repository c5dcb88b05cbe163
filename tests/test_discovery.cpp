#include <catch2/catch.hpp>
#include <stash/discovery.hpp>
#include "support/fake_document_store.hpp"
#include "support/temp_dir.hpp"

using namespace stash;
using stash::testing::FakeDocumentStore;
using stash::testing::TempDir;

static std::string record_with(std::initializer_list<std::string> names) {
    MappingRecord rec;
    for (const auto& n : names) {
        ScriptEntry e;
        e.script_name = n;
        e.created_at = 1700000000;
        e.updated_at = 1700000000;
        REQUIRE(rec.upsert(e).is_ok());
    }
    return rec.to_document_json();
}

TEST_CASE("fresh remote with an empty mapping record is found", "[discovery]") {
    TempDir td;
    LocalStore local(td.str());
    FakeDocumentStore remote;
    std::string id = remote.add_document(kMappingFileName, R"({"entries":{}})", kMappingSentinel);

    InventoryDiscovery discovery(remote, local, RetryPolicy::none(), "me");
    auto r = discovery.discover();
    REQUIRE(r.is_ok());
    REQUIRE(r.value().kind == DiscoveryResult::Found);
    REQUIRE(r.value().document_id == id);
    REQUIRE(r.value().record.entries.empty());
    REQUIRE(r.value().record.revision == remote.docs[id].revision);

    auto ptr = local.load_pointer();
    REQUIRE(ptr.is_ok());
    REQUIRE(ptr.value().has_value());
    REQUIRE(ptr.value()->document_id == id);
    REQUIRE(ptr.value()->owner == "me");
}

TEST_CASE("documents without the sentinel are never candidates", "[discovery]") {
    TempDir td;
    LocalStore local(td.str());
    FakeDocumentStore remote;
    // Parses as a mapping record but is described like an ordinary script
    remote.add_document(kMappingFileName, record_with({"a"}), "[stash] a");
    remote.add_document("notes.md", "hello", "my notes");
    remote.add_document(kMappingFileName, record_with({"a"}), std::string(kMappingSentinel) + " ");

    InventoryDiscovery discovery(remote, local, RetryPolicy::none(), "me");
    auto r = discovery.discover();
    REQUIRE(r.is_ok());
    REQUIRE(r.value().kind == DiscoveryResult::NoMapping);
    REQUIRE(r.value().candidates.empty());
    // Non-candidates are not even downloaded
    REQUIRE(remote.gets == 0);

    auto err = r.value().to_error();
    REQUIRE(err.code == StashError::NoMappingFound);
    REQUIRE_FALSE(local.load_pointer().value().has_value());
}

TEST_CASE("two sentinel documents are ambiguous and listed newest first", "[discovery]") {
    TempDir td;
    LocalStore local(td.str());
    FakeDocumentStore remote;
    std::string older = remote.add_document(kMappingFileName, record_with({"a"}), kMappingSentinel);
    std::string newer = remote.add_document(kMappingFileName, record_with({"a", "b"}), kMappingSentinel);

    InventoryDiscovery discovery(remote, local, RetryPolicy::none(), "me");
    auto r = discovery.discover();
    REQUIRE(r.is_ok());
    REQUIRE(r.value().kind == DiscoveryResult::Ambiguous);
    REQUIRE(r.value().candidates.size() == 2);
    REQUIRE(r.value().candidates[0].document_id == newer);
    REQUIRE(r.value().candidates[0].entry_count == 2);
    REQUIRE(r.value().candidates[1].document_id == older);

    auto err = r.value().to_error();
    REQUIRE(err.code == StashError::AmbiguousMapping);
    REQUIRE(err.message.find(newer) != std::string::npos);
    REQUIRE(err.message.find(older) != std::string::npos);
    REQUIRE(err.hint.find("adopt") != std::string::npos);

    // No choice is made on the operator's behalf
    REQUIRE_FALSE(local.load_pointer().value().has_value());
}

TEST_CASE("malformed sentinel documents are skipped", "[discovery]") {
    TempDir td;
    LocalStore local(td.str());
    FakeDocumentStore remote;
    remote.add_document(kMappingFileName, "not json at all", kMappingSentinel);
    std::string good = remote.add_document(kMappingFileName, record_with({"x"}), kMappingSentinel);

    InventoryDiscovery discovery(remote, local, RetryPolicy::none(), "me");
    auto r = discovery.discover();
    REQUIRE(r.is_ok());
    REQUIRE(r.value().kind == DiscoveryResult::Found);
    REQUIRE(r.value().document_id == good);
    REQUIRE(r.value().record.find("x") != nullptr);
}

TEST_CASE("a candidate deleted mid-discovery is skipped", "[discovery]") {
    TempDir td;
    LocalStore local(td.str());
    FakeDocumentStore remote;
    remote.add_document(kMappingFileName, record_with({}), kMappingSentinel);
    remote.add_document(kMappingFileName, record_with({}), kMappingSentinel);
    remote.fail_get.push_back(StashError{StashError::RemoteNotFound, "gone"});

    InventoryDiscovery discovery(remote, local, RetryPolicy::none(), "me");
    auto r = discovery.discover();
    REQUIRE(r.is_ok());
    REQUIRE(r.value().kind == DiscoveryResult::Found);
    REQUIRE(r.value().document_id == "doc2");
}

TEST_CASE("discover can leave the pointer alone", "[discovery]") {
    TempDir td;
    LocalStore local(td.str());
    FakeDocumentStore remote;
    remote.add_document(kMappingFileName, record_with({}), kMappingSentinel);

    InventoryDiscovery discovery(remote, local, RetryPolicy::none(), "me");
    auto r = discovery.discover(false);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().kind == DiscoveryResult::Found);
    REQUIRE_FALSE(local.load_pointer().value().has_value());
}

TEST_CASE("listing failures propagate after retries", "[discovery]") {
    TempDir td;
    LocalStore local(td.str());
    FakeDocumentStore remote;
    remote.fail_list.push_back(StashError{StashError::Transport, "reset"});
    remote.fail_list.push_back(StashError{StashError::Transport, "reset"});

    RetryPolicy policy;
    policy.max_attempts = 2;
    policy.sleeper = [](std::chrono::milliseconds) {};

    InventoryDiscovery discovery(remote, local, policy, "me");
    auto r = discovery.discover();
    REQUIRE(r.is_err(StashError::Transport));
    REQUIRE(remote.lists == 2);

    FakeDocumentStore denied;
    denied.fail_list.push_back(StashError{StashError::AuthenticationFailed, "bad token"});
    InventoryDiscovery d2(denied, local, policy, "me");
    REQUIRE(d2.discover().is_err(StashError::AuthenticationFailed));
    REQUIRE(denied.lists == 1);
}

TEST_CASE("adopt resolves an ambiguity", "[discovery]") {
    TempDir td;
    LocalStore local(td.str());
    FakeDocumentStore remote;
    remote.add_document(kMappingFileName, record_with({"a"}), kMappingSentinel);
    std::string chosen = remote.add_document(kMappingFileName, record_with({"b"}), kMappingSentinel);

    InventoryDiscovery discovery(remote, local, RetryPolicy::none(), "me");
    auto r = discovery.adopt(chosen);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().document_id == chosen);
    REQUIRE(r.value().record.find("b") != nullptr);
    REQUIRE(local.load_pointer().value()->document_id == chosen);
}

TEST_CASE("adopt rejects documents that are not mapping records", "[discovery]") {
    TempDir td;
    LocalStore local(td.str());
    FakeDocumentStore remote;
    std::string id = remote.add_document("a.py", "print('hi')", "[stash] a");

    InventoryDiscovery discovery(remote, local, RetryPolicy::none(), "me");
    REQUIRE(discovery.adopt(id).is_err(StashError::CorruptRemoteState));
    REQUIRE(discovery.adopt("missing").is_err(StashError::RemoteNotFound));
    REQUIRE_FALSE(local.load_pointer().value().has_value());
}
