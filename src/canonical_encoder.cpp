#include "attest/canonical_encoder.hpp"
#include "attest/timestamp.hpp"
#include <cstdint>

namespace attest
{

    namespace
    {
        void append_line(std::string &out, std::string_view key, std::string_view value)
        {
            out.append(key);
            out.push_back('=');
            out.append(value);
            out.push_back('\n');
        }
    } // namespace

    bool is_valid_utf8(std::string_view text)
    {
        std::size_t i = 0;
        while (i < text.size())
        {
            auto lead = static_cast<unsigned char>(text[i]);
            std::size_t length = 0;
            std::uint32_t cp = 0;
            if (lead < 0x80)
            {
                ++i;
                continue;
            }
            else if (lead >= 0xC2 && lead <= 0xDF)
            {
                length = 2;
                cp = lead & 0x1F;
            }
            else if (lead >= 0xE0 && lead <= 0xEF)
            {
                length = 3;
                cp = lead & 0x0F;
            }
            else if (lead >= 0xF0 && lead <= 0xF4)
            {
                length = 4;
                cp = lead & 0x07;
            }
            else
            {
                return false;
            }

            if (i + length > text.size())
                return false;
            for (std::size_t k = 1; k < length; ++k)
            {
                auto cont = static_cast<unsigned char>(text[i + k]);
                if ((cont & 0xC0) != 0x80)
                    return false;
                cp = (cp << 6) | (cont & 0x3F);
            }

            if ((length == 3 && cp < 0x800) || (length == 4 && cp < 0x10000))
                return false; // overlong
            if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)
                return false;
            i += length;
        }
        return true;
    }

    std::string normalize_email(std::string_view email)
    {
        std::string out(email);
        for (char &c : out)
        {
            if (c >= 'A' && c <= 'Z')
                c = static_cast<char>(c - 'A' + 'a');
        }
        return out;
    }

    std::string encode(const AttestationFact &fact)
    {
        std::string out;
        out.reserve(128 + fact.subject_id.size() + fact.signer_id.size() + fact.signer_email.size());

        append_line(out, "doc_id", fact.subject_id);
        append_line(out, "user_sub", fact.signer_id);
        append_line(out, "user_email", normalize_email(fact.signer_email));
        append_line(out, "signed_at", format_rfc3339_nano(fact.signed_at));
        append_line(out, "nonce", fact.nonce);

        if (fact.subject_checksum && !fact.subject_checksum->empty())
        {
            append_line(out, "doc_checksum", *fact.subject_checksum);
        }

        return out;
    }

    crypto::SHA256Hash payload_hash(const AttestationFact &fact)
    {
        return crypto::SHA256::hash(encode(fact));
    }

} // namespace attest
