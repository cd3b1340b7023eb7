#include "hubxfer/hash.hpp"
#include <openssl/evp.h>
#include <format>
#include <stdexcept>
#include <vector>

namespace hubxfer {

void Sha256::CtxDeleter::operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
}

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) throw std::bad_alloc();
    reset();
}

Sha256::~Sha256() = default;
Sha256::Sha256(Sha256&&) noexcept = default;
Sha256& Sha256::operator=(Sha256&&) noexcept = default;

void Sha256::reset() {
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
}

void Sha256::update(std::span<const char> data) {
    if (!data.empty()) EVP_DigestUpdate(ctx_.get(), data.data(), data.size());
}

std::string Sha256::finish() {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    EVP_DigestFinal_ex(ctx_.get(), hash, &hash_len);
    std::string actual;
    actual.reserve(hash_len * 2);
    for (unsigned int i = 0; i < hash_len; ++i) {
        actual += std::format("{:02x}", hash[i]);
    }
    reset();
    return actual;
}

std::string Sha256::of(std::string_view data) {
    Sha256 h;
    h.update(std::span<const char>(data.data(), data.size()));
    return h.finish();
}

std::string base64_encode(std::span<const char> data) {
    if (data.empty()) return {};
    std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
    int n = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(data.data()),
                            static_cast<int>(data.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(n));
}

} // namespace hubxfer
