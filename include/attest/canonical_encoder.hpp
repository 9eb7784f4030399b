#pragma once

#include "crypto.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace attest
{

    /**
     * The facts a signer attests to. Identity fields arrive already
     * authenticated from the caller.
     */
    struct AttestationFact
    {
        std::string subject_id;
        std::string signer_id;
        std::string signer_email;
        Timestamp signed_at{};
        std::string nonce;                           // generated on append when empty
        std::optional<std::string> subject_checksum; // document version being acknowledged
    };

    /**
     * Well-formed UTF-8: no overlong forms, surrogates or code points above
     * U+10FFFF. Every text field of a record must pass before it is signed.
     */
    bool is_valid_utf8(std::string_view text);

    /** Lower-cases ASCII letters; other bytes pass through unchanged */
    std::string normalize_email(std::string_view email);

    /**
     * Deterministic byte encoding of a fact, the exact input to hashing:
     *
     *   doc_id=<subject_id>\n
     *   user_sub=<signer_id>\n
     *   user_email=<normalized email>\n
     *   signed_at=<RFC 3339 UTC, nanosecond precision>\n
     *   nonce=<nonce>\n
     *   doc_checksum=<checksum>\n      (only when present)
     */
    std::string encode(const AttestationFact &fact);

    /** SHA-256 of encode(fact) */
    crypto::SHA256Hash payload_hash(const AttestationFact &fact);

} // namespace attest
