#include "transaction.hpp"
#include <array>
#include <utility>

namespace fee_estimator {

namespace {

const std::array<std::pair<TransactionKind, const char*>, 8> kKindNames{{
    {TransactionKind::CRYPTO_TRANSFER, "CryptoTransfer"},
    {TransactionKind::TOKEN_CREATE, "TokenCreate"},
    {TransactionKind::TOKEN_MINT, "TokenMint"},
    {TransactionKind::TOPIC_CREATE, "TopicCreate"},
    {TransactionKind::TOPIC_MESSAGE_SUBMIT, "TopicMessageSubmit"},
    {TransactionKind::CONTRACT_CREATE, "ContractCreate"},
    {TransactionKind::FILE_CREATE, "FileCreate"},
    {TransactionKind::FILE_APPEND, "FileAppend"},
}};

} // namespace

std::string kind_to_string(TransactionKind kind) {
    for (const auto& entry : kKindNames) {
        if (entry.first == kind) return entry.second;
    }
    return "Unknown";
}

std::optional<TransactionKind> kind_from_string(const std::string& name) {
    for (const auto& entry : kKindNames) {
        if (name == entry.second) return entry.first;
    }
    return std::nullopt;
}

} // namespace fee_estimator
