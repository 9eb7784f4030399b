#include "attest/signature_record.hpp"
#include "attest/timestamp.hpp"
#include <fmt/format.h>

namespace attest
{

    using Json = nlohmann::json;

    crypto::SHA256Hash SignatureRecord::compute_hash() const
    {
        return attest::payload_hash(fact);
    }

    bool SignatureRecord::verify_signature(const crypto::Ed25519PublicKey &public_key) const
    {
        auto hash = compute_hash();
        return crypto::Ed25519KeyPair::verify(crypto::Bytes(hash.begin(), hash.end()), signature, public_key);
    }

    Json SignatureRecord::to_json() const
    {
        Json j = {
            {"id", id},
            {"subject_id", fact.subject_id},
            {"signer_id", fact.signer_id},
            {"signer_email", fact.signer_email},
            {"signer_name", signer_name},
            {"signed_at", format_rfc3339_nano(fact.signed_at)},
            {"nonce", fact.nonce},
            {"payload_hash", crypto::to_base64(payload_hash)},
            {"signature", crypto::to_base64(signature)},
            {"created_at", format_rfc3339_nano(created_at)}};

        if (fact.subject_checksum)
            j["subject_checksum"] = *fact.subject_checksum;

        j["prev_hash"] = prev_hash ? Json(crypto::to_base64(*prev_hash)) : Json(nullptr);

        return j;
    }

    Result<SignatureRecord> SignatureRecord::from_json(const Json &j)
    {
        try
        {
            SignatureRecord record;

            record.id = j.at("id").get<std::uint64_t>();
            record.fact.subject_id = j.at("subject_id").get<std::string>();
            record.fact.signer_id = j.at("signer_id").get<std::string>();
            record.fact.signer_email = j.at("signer_email").get<std::string>();
            record.fact.nonce = j.at("nonce").get<std::string>();
            record.signer_name = j.value("signer_name", "");

            auto signed_at = parse_rfc3339(j.at("signed_at").get<std::string>());
            if (!signed_at)
                return std::unexpected(signed_at.error());
            record.fact.signed_at = *signed_at;

            auto created_at = parse_rfc3339(j.at("created_at").get<std::string>());
            if (!created_at)
                return std::unexpected(created_at.error());
            record.created_at = *created_at;

            if (j.contains("subject_checksum") && !j["subject_checksum"].is_null())
                record.fact.subject_checksum = j["subject_checksum"].get<std::string>();

            auto hash = crypto::from_base64<32>(j.at("payload_hash").get<std::string>());
            if (!hash)
                return std::unexpected(hash.error());
            record.payload_hash = *hash;

            auto sig = crypto::from_base64<64>(j.at("signature").get<std::string>());
            if (!sig)
                return std::unexpected(sig.error());
            record.signature = *sig;

            if (j.contains("prev_hash") && !j["prev_hash"].is_null())
            {
                auto prev = crypto::from_base64<32>(j["prev_hash"].get<std::string>());
                if (!prev)
                    return std::unexpected(prev.error());
                record.prev_hash = *prev;
            }

            return record;
        }
        catch (const Json::exception &e)
        {
            return std::unexpected(LedgerError::parsing(
                fmt::format("Failed to parse SignatureRecord: {}", e.what())));
        }
    }

} // namespace attest
