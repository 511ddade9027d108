#ifndef POWMINER_HASH_POW_HASHER_HPP
#define POWMINER_HASH_POW_HASHER_HPP

// SHA-256 over (message || nonce as 8 little endian bytes).
// The message is absorbed once into a midstate which is cloned for every nonce.

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <openssl/evp.h>

namespace powminer {
namespace hash
{

class Pow_hasher
{
public:

    static constexpr std::size_t digest_length = 32;
    using Digest = std::array<std::uint8_t, digest_length>;

    Pow_hasher();
    explicit Pow_hasher(std::vector<std::uint8_t> const& message);

    // absorbs the message into the midstate. Replaces any previous message.
    void set_message(std::vector<std::uint8_t> const& message);

    Digest calculate_hash(std::uint64_t nonce);
    // lowercase hex of calculate_hash(nonce)
    std::string calculate_hex(std::uint64_t nonce);

private:

    struct Context_deleter
    {
        void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
    };
    using Context = std::unique_ptr<EVP_MD_CTX, Context_deleter>;

    static Context create_context();

    Context m_midstate;
    Context m_work;
};

}
}

#endif
