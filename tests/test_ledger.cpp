#include <catch2/catch_test_macros.hpp>
#include "attest/ledger.hpp"
#include "attest/timestamp.hpp"

using namespace attest;

namespace
{
    LedgerConfig memory_config()
    {
        LedgerConfig cfg;
        cfg.storage.backend = "memory";
        cfg.signing.private_key_b64 = KeyCustodian::generate_private_key_b64().value();
        return cfg;
    }

    AppendRequest request(std::string subject, std::string signer, std::string email)
    {
        AppendRequest req;
        req.fact.subject_id = std::move(subject);
        req.fact.signer_id = std::move(signer);
        req.fact.signer_email = std::move(email);
        req.fact.signed_at = parse_rfc3339("2024-05-01T12:00:00.5Z").value();
        return req;
    }
} // namespace

TEST_CASE("Ledger opens from config with the configured key", "[ledger]")
{
    auto cfg = memory_config();
    auto ledger = Ledger::open(cfg);
    REQUIRE(ledger.has_value());
    REQUIRE_FALSE(ledger->uses_ephemeral_key());

    auto custodian = KeyCustodian::load(cfg.signing).value();
    REQUIRE(ledger->public_key_b64() == custodian.public_key_b64());
    REQUIRE(ledger->public_key() == custodian.public_key());
}

TEST_CASE("Invalid key material stops the ledger from opening", "[ledger]")
{
    auto cfg = memory_config();
    cfg.signing.private_key_b64 = "AAAA";
    auto ledger = Ledger::open(cfg);
    REQUIRE_FALSE(ledger.has_value());
    REQUIRE(ledger.error().code == ErrorCode::InvalidKeyMaterial);
}

TEST_CASE("Status reports whether and when a signer acknowledged", "[ledger]")
{
    auto ledger = Ledger::open(memory_config()).value();
    REQUIRE(ledger.append(request("doc-1", "alice", "Alice@Example.com")).has_value());

    auto signed_status = ledger.status("doc-1", "alice");
    REQUIRE(signed_status.has_value());
    REQUIRE(signed_status->is_signed);
    REQUIRE(signed_status->signed_at.has_value());
    REQUIRE(format_rfc3339_nano(*signed_status->signed_at) == "2024-05-01T12:00:00.5Z");

    auto unsigned_status = ledger.status("doc-1", "bob");
    REQUIRE(unsigned_status.has_value());
    REQUIRE_FALSE(unsigned_status->is_signed);
    REQUIRE_FALSE(unsigned_status->signed_at.has_value());
}

TEST_CASE("Acknowledgment lookup matches signer id or email", "[ledger]")
{
    auto ledger = Ledger::open(memory_config()).value();
    REQUIRE(ledger.append(request("doc-1", "u-123", "Alice@Example.com")).has_value());

    REQUIRE(ledger.has_acknowledged("doc-1", "u-123").value());
    REQUIRE(ledger.has_acknowledged("doc-1", "alice@example.com").value());
    REQUIRE(ledger.has_acknowledged("doc-1", "ALICE@EXAMPLE.COM").value());
    REQUIRE_FALSE(ledger.has_acknowledged("doc-2", "u-123").value());
    REQUIRE_FALSE(ledger.has_acknowledged("doc-1", "bob@example.com").value());
    REQUIRE_FALSE(ledger.has_acknowledged("doc-1", "").value());
}

TEST_CASE("Listings are ordered by id", "[ledger]")
{
    auto ledger = Ledger::open(memory_config()).value();
    REQUIRE(ledger.append(request("doc-1", "alice", "a@x.io")).has_value());
    REQUIRE(ledger.append(request("doc-2", "alice", "a@x.io")).has_value());
    REQUIRE(ledger.append(request("doc-1", "bob", "b@x.io")).has_value());

    auto by_subject = ledger.signatures_for_subject("doc-1").value();
    REQUIRE(by_subject.size() == 2);
    REQUIRE(by_subject[0].fact.signer_id == "alice");
    REQUIRE(by_subject[1].fact.signer_id == "bob");

    auto by_signer = ledger.signatures_for_signer("alice").value();
    REQUIRE(by_signer.size() == 2);
    REQUIRE(by_signer[0].id < by_signer[1].id);

    REQUIRE(ledger.records().value().size() == 3);
    REQUIRE(ledger.records(2).value().front().id == 2);
    REQUIRE(ledger.last_id().value() == 3);

    auto found = ledger.find("doc-2", "alice").value();
    REQUIRE(found.has_value());
    REQUIRE(found->id == 2);

    REQUIRE(ledger.verify_chain().value().is_valid());
}

TEST_CASE("Exported record JSON restores an equivalent record", "[ledger]")
{
    auto ledger = Ledger::open(memory_config()).value();
    auto req = request("doc-1", "alice", "a@x.io");
    req.fact.subject_checksum = "sha256:00ff";
    req.signer_name = "Alice";
    REQUIRE(ledger.append(req).has_value());
    auto record = ledger.append(request("doc-2", "alice", "a@x.io")).value();

    auto restored = SignatureRecord::from_json(record.to_json());
    REQUIRE(restored.has_value());
    REQUIRE(restored->id == record.id);
    REQUIRE(restored->payload_hash == record.payload_hash);
    REQUIRE(restored->prev_hash == record.prev_hash);
    REQUIRE(restored->created_at == record.created_at);
    REQUIRE(verify_record(*restored, ledger.public_key()).empty());

    auto first = ledger.find("doc-1", "alice").value().value();
    auto j = first.to_json();
    REQUIRE(j["prev_hash"].is_null());
    REQUIRE(j["subject_checksum"] == "sha256:00ff");
    REQUIRE(j["signer_name"] == "Alice");
}

TEST_CASE("Record JSON with missing fields is rejected", "[ledger]")
{
    nlohmann::json j = {{"id", 1}, {"subject_id", "doc-1"}};
    auto parsed = SignatureRecord::from_json(j);
    REQUIRE_FALSE(parsed.has_value());
    REQUIRE(parsed.error().code == ErrorCode::ParsingError);
}
