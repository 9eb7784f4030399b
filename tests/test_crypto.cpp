#include <catch2/catch_test_macros.hpp>
#include "attest/crypto.hpp"
#include <algorithm>
#include <string>
#include <unordered_set>

using namespace attest::crypto;

namespace
{
    Bytes from_hex(std::string_view hex)
    {
        Bytes out;
        for (std::size_t i = 0; i + 1 < hex.size(); i += 2)
            out.push_back(static_cast<uint8_t>(std::stoi(std::string(hex.substr(i, 2)), nullptr, 16)));
        return out;
    }
} // namespace

TEST_CASE("Ed25519 key generation", "[crypto]")
{
    auto keypair_result = Ed25519KeyPair::generate();
    REQUIRE(keypair_result.has_value());

    auto keypair = keypair_result.value();
    REQUIRE(keypair.public_key.size() == 32);
    REQUIRE(keypair.secret_key.size() == 64);
    REQUIRE(std::equal(keypair.public_key.begin(), keypair.public_key.end(), keypair.secret_key.begin() + 32));
}

TEST_CASE("Ed25519 signing and verification", "[crypto]")
{
    auto keypair = Ed25519KeyPair::generate().value();

    std::string message = "doc_id=doc-1\n";
    Bytes message_bytes(message.begin(), message.end());

    auto signature = keypair.sign(message_bytes);
    REQUIRE(signature.size() == 64);
    REQUIRE(Ed25519KeyPair::verify(message_bytes, signature, keypair.public_key));

    message_bytes[0] ^= 0x01;
    REQUIRE_FALSE(Ed25519KeyPair::verify(message_bytes, signature, keypair.public_key));

    auto other = Ed25519KeyPair::generate().value();
    message_bytes[0] ^= 0x01;
    REQUIRE_FALSE(Ed25519KeyPair::verify(message_bytes, signature, other.public_key));
}

TEST_CASE("Ed25519 key derivation from RFC 8032 seed", "[crypto]")
{
    auto seed_bytes = from_hex("9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60");
    Ed25519Seed seed{};
    std::copy(seed_bytes.begin(), seed_bytes.end(), seed.begin());

    auto keypair = Ed25519KeyPair::from_seed(seed);
    REQUIRE(keypair.has_value());

    auto expected = from_hex("d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a");
    REQUIRE(Bytes(keypair->public_key.begin(), keypair->public_key.end()) == expected);

    auto restored = Ed25519KeyPair::from_secret_key(keypair->secret_key);
    REQUIRE(restored.has_value());
    REQUIRE(restored->public_key == keypair->public_key);
}

TEST_CASE("Secret key with mismatched public half is rejected", "[crypto]")
{
    auto keypair = Ed25519KeyPair::generate().value();
    auto secret = keypair.secret_key;
    secret[40] ^= 0xFF;

    auto restored = Ed25519KeyPair::from_secret_key(secret);
    REQUIRE_FALSE(restored.has_value());
    REQUIRE(restored.error().code == attest::ErrorCode::InvalidKeyMaterial);
}

TEST_CASE("SHA-256 hashing", "[crypto]")
{
    auto hash = SHA256::hash(std::string_view("abc"));
    REQUIRE(SHA256::to_hex(hash) == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    Bytes data{'a', 'b', 'c'};
    REQUIRE(SHA256::hash(data) == hash);
}

TEST_CASE("Base64 encoding/decoding", "[crypto]")
{
    Bytes data = {0x00, 0x01, 0x02, 0x03, 0xFF, 0xFE};

    REQUIRE(Base64::encode(data) == "AAECA//+");
    REQUIRE(Base64::encode_url_safe(data) == "AAECA__-");

    auto decoded = Base64::decode("AAECA//+");
    REQUIRE(decoded.has_value());
    REQUIRE(*decoded == data);

    auto url_decoded = Base64::decode_url_safe("AAECA__-");
    REQUIRE(url_decoded.has_value());
    REQUIRE(*url_decoded == data);

    REQUIRE_FALSE(Base64::decode("not base64!").has_value());
}

TEST_CASE("Fixed-size base64 helpers check length", "[crypto]")
{
    SHA256Hash hash = SHA256::hash(std::string_view("x"));
    auto encoded = to_base64(hash);

    auto back = from_base64<32>(encoded);
    REQUIRE(back.has_value());
    REQUIRE(*back == hash);

    REQUIRE_FALSE(from_base64<64>(encoded).has_value());
}

TEST_CASE("Secure random generation", "[crypto]")
{
    auto bytes1 = SecureRandom::generate_bytes(32);
    auto bytes2 = SecureRandom::generate_bytes(32);

    REQUIRE(bytes1.size() == 32);
    REQUIRE(bytes2.size() == 32);
    REQUIRE(bytes1 != bytes2);
}

TEST_CASE("Nonces are URL-safe and do not collide", "[crypto][nonce]")
{
    std::unordered_set<std::string> seen;
    for (int i = 0; i < 10000; ++i)
    {
        auto nonce = generate_nonce();
        REQUIRE(nonce.size() == 22);
        REQUIRE(nonce.find_first_of("+/=") == std::string::npos);
        REQUIRE(seen.insert(nonce).second);
    }

    auto decoded = Base64::decode_url_safe(*seen.begin());
    REQUIRE(decoded.has_value());
    REQUIRE(decoded->size() == kNonceBytes);
}
