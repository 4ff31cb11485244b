/**
 * @file encryption_context.hpp
 * @brief Per-operation encryption state and the encryption capability probe.
 *
 * Whether the archive library can encrypt is resolved once (encryptionSupported())
 * and injected into every EncryptionContext, so the pipelines never probe on their own.
 */

#ifndef ENCRYPTION_CONTEXT_HPP
#define ENCRYPTION_CONTEXT_HPP

#include <string>
#include <utility>
#include "secret.hpp"

/**
 * @brief Encryption settings for one backup or restore operation.
 *
 * Created before the first entry is written or read and destroyed with the
 * operation. Never logged or serialized.
 */
struct EncryptionContext {
    bool enabled = false;    ///< Entries are (to be) encrypted.
    bool available = false;  ///< The archive library supports the configured cipher.
    Secret password;         ///< Archive password; empty when disabled.
    bool verified = false;   ///< Restore only: a trial decryption succeeded.

    /**
     * @brief Context for an unencrypted operation.
     */
    static EncryptionContext none(bool capability) {
        EncryptionContext context;
        context.available = capability;
        return context;
    }

    /**
     * @brief Context for an encrypted operation.
     */
    static EncryptionContext withPassword(Secret password, bool capability) {
        EncryptionContext context;
        context.enabled = true;
        context.available = capability;
        context.password = std::move(password);
        return context;
    }
};

/**
 * @brief Probes libarchive once for ZIP encryption support.
 *
 * @param method Encryption method name ("aes128" or "aes256").
 * @return bool True when libarchive was built with a crypto backend for the method.
 * @note The result of the first call per method is cached for the process lifetime.
 */
bool encryptionSupported(const std::string& method = "aes256");

#endif // ENCRYPTION_CONTEXT_HPP
