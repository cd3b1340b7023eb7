#pragma once

#include <memory>
#include <span>
#include <string>
#include <string_view>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace hubxfer {

// Incremental SHA-256, the oid algorithm of Git LFS
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;
    Sha256(Sha256&&) noexcept;
    Sha256& operator=(Sha256&&) noexcept;

    void update(std::span<const char> data);
    // Lowercase hex digest; the hasher is reset afterwards
    std::string finish();

    static std::string of(std::string_view data);

private:
    struct CtxDeleter {
        void operator()(EVP_MD_CTX* ctx) const;
    };
    std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;

    void reset();
};

std::string base64_encode(std::span<const char> data);

} // namespace hubxfer
