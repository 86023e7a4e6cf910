// IptvMux - IPTV Stream Multiplexing Proxy
// Account Store Implementation

#include "iptvmux/admission/account_store.hpp"

namespace iptvmux {
namespace admission {

InMemoryAccountStore::InMemoryAccountStore(const std::vector<core::AccountConfig>& accounts) {
    for (const auto& config : accounts) {
        Account account;
        account.id = config.id;
        account.name = config.name;
        account.server = config.server;
        account.enabled = config.enabled;
        account.userAgent = config.userAgent;
        account.legacyUsername = config.username;
        account.legacyPassword = config.password;
        accounts_[account.id] = std::move(account);
    }
}

std::optional<Account> InMemoryAccountStore::getAccount(core::AccountId accountId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(accountId);
    if (it == accounts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryAccountStore::upsert(Account account) {
    std::lock_guard<std::mutex> lock(mutex_);
    core::AccountId id = account.id;
    accounts_[id] = std::move(account);
}

std::vector<Account> InMemoryAccountStore::listAccounts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Account> result;
    result.reserve(accounts_.size());
    for (const auto& entry : accounts_) {
        result.push_back(entry.second);
    }
    return result;
}

} // namespace admission
} // namespace iptvmux
