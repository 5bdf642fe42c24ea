#pragma once

#include <openssl/evp.h>
#include <memory>

namespace uuidkey::crypto::detail {

// RAII wrapper for OpenSSL digest contexts
struct EVPMDCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept {
        if (ctx) EVP_MD_CTX_free(ctx);
    }
};

using UniqueMDCtx = std::unique_ptr<EVP_MD_CTX, EVPMDCtxDeleter>;

}  // namespace uuidkey::crypto::detail
