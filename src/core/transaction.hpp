#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace fee_estimator {

enum class TransactionKind {
    CRYPTO_TRANSFER,
    TOKEN_CREATE,
    TOKEN_MINT,
    TOPIC_CREATE,
    TOPIC_MESSAGE_SUBMIT,
    CONTRACT_CREATE,
    FILE_CREATE,
    FILE_APPEND
};

/**
 * What the fee sources need to know about one submitted transaction. Building
 * and signing it happen elsewhere; signed_bytes is the serialized signed
 * transaction, forwarded as-is to remote estimators.
 */
struct TransactionSummary {
    TransactionKind kind{TransactionKind::CRYPTO_TRANSFER};
    int64_t signature_count{1};
    int64_t size_bytes{0};
    int64_t key_count{0};
    std::string signed_bytes;
};

// Names match the schedule keys in settings.json ("CryptoTransfer", "TokenCreate", ...).
std::string kind_to_string(TransactionKind kind);
std::optional<TransactionKind> kind_from_string(const std::string& name);

} // namespace fee_estimator
