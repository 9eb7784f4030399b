#include "attest/chain_builder.hpp"
#include "attest/timestamp.hpp"
#include <spdlog/spdlog.h>

namespace attest
{

    namespace
    {
        Result<void> require_field(const std::string &value, std::string_view name)
        {
            if (value.empty())
            {
                return std::unexpected(LedgerError::invalid_input(std::string(name) + " must not be empty"));
            }
            return {};
        }

        Result<void> require_utf8(const std::string &value, std::string_view name)
        {
            if (!is_valid_utf8(value))
            {
                return std::unexpected(LedgerError::invalid_input(std::string(name) + " is not valid UTF-8"));
            }
            return {};
        }

        std::string result_for(ErrorCode code)
        {
            switch (code)
            {
            case ErrorCode::AlreadyAcknowledged:
            case ErrorCode::NonceReused:
                return "conflict";
            case ErrorCode::SubjectChanged:
                return "precondition_failed";
            case ErrorCode::InvalidInput:
                return "rejected";
            default:
                return "error";
            }
        }
    } // namespace

    ChainBuilder::ChainBuilder(std::shared_ptr<const KeyCustodian> custodian,
                               std::shared_ptr<LedgerStore> store,
                               std::shared_ptr<const DocumentCatalog> catalog)
        : custodian_(std::move(custodian)), store_(std::move(store)), catalog_(std::move(catalog))
    {
    }

    Result<std::optional<std::string>> ChainBuilder::resolve_subject_checksum(const AttestationFact &fact) const
    {
        const bool presented = fact.subject_checksum && !fact.subject_checksum->empty();
        if (!catalog_)
            return presented ? fact.subject_checksum : std::nullopt;

        auto current = catalog_->current_checksum(fact.subject_id);
        if (!current)
        {
            if (current.error().code == ErrorCode::NotFound)
            {
                spdlog::debug("Subject {} not in catalog, skipping checksum check", fact.subject_id);
                return presented ? fact.subject_checksum : std::nullopt;
            }
            return std::unexpected(current.error());
        }

        if (presented && *current != *fact.subject_checksum)
        {
            return std::unexpected(LedgerError::subject_changed(
                "Subject " + fact.subject_id + " changed since it was presented for signing"));
        }

        // Bind the version being acknowledged into the signed payload
        if (current->empty())
            return std::optional<std::string>{};
        return std::optional<std::string>(std::move(*current));
    }

    Result<SignatureRecord> ChainBuilder::append(const AppendRequest &request) const
    {
        auto fail = [&](const LedgerError &err) -> Result<SignatureRecord>
        {
            auto event = AuditEvent::now("append", result_for(err.code));
            event.subject_id = request.fact.subject_id;
            event.signer_id = request.fact.signer_id;
            event.details = {{"error", err.what()}, {"code", std::string(error_code_to_string(err.code))}};

            auto level = spdlog::level::warn;
            if (err.code == ErrorCode::StorageError || err.code == ErrorCode::CryptoError)
                level = spdlog::level::err;
            audit_.log(event, level);
            return std::unexpected(err);
        };

        const auto &in = request.fact;
        for (auto check : {require_field(in.subject_id, "subject_id"),
                           require_field(in.signer_id, "signer_id"),
                           require_field(in.signer_email, "signer_email"),
                           require_utf8(in.subject_id, "subject_id"),
                           require_utf8(in.signer_id, "signer_id"),
                           require_utf8(in.signer_email, "signer_email"),
                           require_utf8(in.nonce, "nonce"),
                           require_utf8(in.subject_checksum.value_or(""), "subject_checksum"),
                           require_utf8(request.signer_name, "signer_name")})
        {
            if (!check)
                return fail(check.error());
        }

        auto existing = store_->find(in.subject_id, in.signer_id);
        if (!existing)
            return fail(existing.error());
        if (existing->has_value())
        {
            return fail(LedgerError::already_acknowledged(
                "'" + in.signer_id + "' already acknowledged '" + in.subject_id + "'"));
        }

        auto checksum = resolve_subject_checksum(in);
        if (!checksum)
            return fail(checksum.error());

        SignatureRecord pending;
        pending.fact = in;
        pending.fact.signer_email = normalize_email(in.signer_email);
        pending.fact.subject_checksum = std::move(*checksum);
        if (pending.fact.signed_at == Timestamp{})
            pending.fact.signed_at = now_utc();
        if (pending.fact.nonce.empty())
            pending.fact.nonce = crypto::generate_nonce();
        pending.signer_name = request.signer_name;

        pending.payload_hash = payload_hash(pending.fact);

        auto signature = custodian_->sign(pending.payload_hash);
        if (!signature)
            return fail(signature.error());
        pending.signature = *signature;

        auto stored = store_->insert_linked(pending);
        if (!stored)
            return fail(stored.error());

        auto event = AuditEvent::now("append", "ok");
        event.subject_id = stored->fact.subject_id;
        event.signer_id = stored->fact.signer_id;
        event.record_id = stored->id;
        event.details = {{"payload_hash", crypto::SHA256::to_hex(stored->payload_hash)},
                         {"signed_at", format_rfc3339_nano(stored->fact.signed_at)}};
        audit_.log(event);

        return stored;
    }

} // namespace attest
