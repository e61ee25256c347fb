// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file SecureMemory.h
 * @brief Secure memory handling utilities
 *
 * RAII wrappers for key material, passphrases and OpenSSL contexts so that
 * sensitive bytes are wiped on every exit path, including worker-pool
 * tasks that outlive the request which submitted them.
 */

#ifndef AUTHKEEP_SECUREMEMORY_H
#define AUTHKEEP_SECUREMEMORY_H

#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <openssl/crypto.h>
#include <openssl/evp.h>

namespace AuthKeep {

/**
 * @brief Custom deleter for EVP_CIPHER_CTX
 */
struct EVPCipherContextDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const {
        if (ctx) {
            EVP_CIPHER_CTX_free(ctx);
        }
    }
};

/**
 * @brief Custom deleter for EVP_MD_CTX
 */
struct EVPDigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }
};

/**
 * @brief Secure allocator for std::vector that zeros memory on deallocation
 *
 * @tparam T Type of elements (typically uint8_t for crypto buffers)
 *
 * @code
 * SecureVector<uint8_t> key(32);
 * // ... use key ...
 * // Automatically zeroized on destruction
 * @endcode
 */
template<typename T>
class SecureAllocator : public std::allocator<T> {
public:
    template<typename U>
    struct rebind {
        using other = SecureAllocator<U>;
    };

    SecureAllocator() noexcept = default;

    template<typename U>
    SecureAllocator(const SecureAllocator<U>&) noexcept {}

    void deallocate(T* p, std::size_t n) {
        if (p) {
            OPENSSL_cleanse(p, n * sizeof(T));
            std::allocator<T>::deallocate(p, n);
        }
    }
};

template<typename T, typename U>
bool operator==(const SecureAllocator<T>&, const SecureAllocator<U>&) noexcept { return true; }

/**
 * @brief std::vector with secure allocator
 *
 * Use for derived keys, decrypted plaintext and anything else that must
 * not survive in freed heap memory.
 */
template<typename T>
using SecureVector = std::vector<T, SecureAllocator<T>>;

/** @brief RAII wrapper for EVP_CIPHER_CTX */
using EVPCipherContextPtr = std::unique_ptr<EVP_CIPHER_CTX, EVPCipherContextDeleter>;

/** @brief RAII wrapper for EVP_MD_CTX */
using EVPDigestContextPtr = std::unique_ptr<EVP_MD_CTX, EVPDigestContextDeleter>;

/**
 * @brief Securely clear a std::string containing sensitive data
 *
 * @note Always use this instead of manual memset or loops, as those can
 *       be optimized away by the compiler.
 */
inline void secure_clear_string(std::string& str) noexcept {
    if (!str.empty()) {
        OPENSSL_cleanse(str.data(), str.size());
        str.clear();
    }
}

/**
 * @brief Move-only owner of a passphrase or one-time code
 *
 * The buffer is wiped on destruction and on move. KDF tasks capture a
 * SecureString by value so the passphrase copy they hold is cleared even
 * when the submitting request has already timed out.
 *
 * @code
 * SecureString passphrase{read_passphrase()};
 * auto key = cipher.derive_key(passphrase.view(), salt, params);
 * @endcode
 */
class SecureString {
public:
    SecureString() = default;
    explicit SecureString(std::string str) : str_(std::move(str)) {}
    explicit SecureString(std::string_view str) : str_(str) {}

    ~SecureString() {
        secure_clear_string(str_);
    }

    SecureString(const SecureString&) = delete;
    SecureString& operator=(const SecureString&) = delete;

    SecureString(SecureString&& other) noexcept
        : str_(std::move(other.str_)) {
        secure_clear_string(other.str_);
    }

    SecureString& operator=(SecureString&& other) noexcept {
        if (this != &other) {
            secure_clear_string(str_);
            str_ = std::move(other.str_);
            secure_clear_string(other.str_);
        }
        return *this;
    }

    [[nodiscard]] std::string_view view() const noexcept { return str_; }
    [[nodiscard]] const std::string& get() const noexcept { return str_; }

    void clear() noexcept { secure_clear_string(str_); }

    [[nodiscard]] bool empty() const noexcept { return str_.empty(); }
    [[nodiscard]] size_t size() const noexcept { return str_.size(); }

private:
    std::string str_;
};

} // namespace AuthKeep

#endif // AUTHKEEP_SECUREMEMORY_H
