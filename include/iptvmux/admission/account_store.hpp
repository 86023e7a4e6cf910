// IptvMux - IPTV Stream Multiplexing Proxy
// Account Store - Provider account lookup

#ifndef IPTVMUX_ADMISSION_ACCOUNT_STORE_HPP
#define IPTVMUX_ADMISSION_ACCOUNT_STORE_HPP

#include "iptvmux/core/config_manager.hpp"
#include "iptvmux/core/types.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace iptvmux {
namespace admission {

/**
 * @brief Provider account.
 */
struct Account {
    core::AccountId id = 0;
    std::string name;
    std::string server;          ///< Host[:port] or URL prefix of the provider
    bool enabled = true;
    std::string userAgent;       ///< Empty: use the configured default
    std::string legacyUsername;  ///< Used only when no credentials are listed
    std::string legacyPassword;

    bool hasLegacyCredential() const {
        return !legacyUsername.empty() && !legacyPassword.empty();
    }
};

/**
 * @brief Read access to accounts.
 */
class IAccountStore {
public:
    virtual ~IAccountStore() = default;

    virtual std::optional<Account> getAccount(core::AccountId accountId) const = 0;
};

/**
 * @brief IAccountStore over a fixed account list.
 */
class InMemoryAccountStore : public IAccountStore {
public:
    InMemoryAccountStore() = default;
    explicit InMemoryAccountStore(const std::vector<core::AccountConfig>& accounts);

    std::optional<Account> getAccount(core::AccountId accountId) const override;

    /**
     * @brief Insert or replace an account.
     */
    void upsert(Account account);

    std::vector<Account> listAccounts() const;

private:
    mutable std::mutex mutex_;
    std::map<core::AccountId, Account> accounts_;
};

} // namespace admission
} // namespace iptvmux

#endif // IPTVMUX_ADMISSION_ACCOUNT_STORE_HPP
