#include "hash/pow_hasher.hpp"
#include "hash/byte_utils.hpp"

#include <stdexcept>

namespace powminer
{
namespace hash
{

Pow_hasher::Pow_hasher()
: m_midstate{create_context()}
, m_work{create_context()}
{
    if (EVP_DigestInit_ex(m_midstate.get(), EVP_sha256(), nullptr) != 1)
    {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
}

Pow_hasher::Pow_hasher(std::vector<std::uint8_t> const& message)
: Pow_hasher()
{
    set_message(message);
}

Pow_hasher::Context Pow_hasher::create_context()
{
    Context ctx{EVP_MD_CTX_new()};
    if (!ctx)
    {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    return ctx;
}

void Pow_hasher::set_message(std::vector<std::uint8_t> const& message)
{
    if (EVP_DigestInit_ex(m_midstate.get(), EVP_sha256(), nullptr) != 1)
    {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
    // an empty payload contributes nothing, the midstate stays at the initial state
    if (!message.empty() && EVP_DigestUpdate(m_midstate.get(), message.data(), message.size()) != 1)
    {
        throw std::runtime_error("EVP_DigestUpdate failed for message");
    }
}

Pow_hasher::Digest Pow_hasher::calculate_hash(std::uint64_t nonce)
{
    if (EVP_MD_CTX_copy_ex(m_work.get(), m_midstate.get()) != 1)
    {
        throw std::runtime_error("EVP_MD_CTX_copy_ex failed");
    }

    auto const nonce_bytes = IntToBytes(nonce, 8);
    if (EVP_DigestUpdate(m_work.get(), nonce_bytes.data(), nonce_bytes.size()) != 1)
    {
        throw std::runtime_error("EVP_DigestUpdate failed for nonce");
    }

    Digest digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(m_work.get(), digest.data(), &length) != 1 || length != digest_length)
    {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    return digest;
}

std::string Pow_hasher::calculate_hex(std::uint64_t nonce)
{
    auto const digest = calculate_hash(nonce);
    return BytesToHexString(digest.begin(), digest.end());
}

}
}
