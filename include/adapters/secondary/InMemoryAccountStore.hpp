#pragma once

#include "ports/output/IAccountStore.hpp"
#include "utils/ThreadSafeMap.hpp"
#include <iostream>

namespace accounts::adapters::secondary {

/**
 * @brief In-memory хранилище учётных записей
 *
 * Данные живут до завершения процесса. create() перезаписывает запись
 * с совпадающим id: уникальность гарантирует генератор id в сервисе.
 */
class InMemoryAccountStore : public ports::output::IAccountStore {
public:
    InMemoryAccountStore() {
        std::cout << "[InMemoryAccountStore] Created" << std::endl;
    }

    domain::Account create(const domain::Account& account) override {
        accounts_.insert(account.id, account);
        return account;
    }

    std::optional<domain::Account> get(const std::string& id) const override {
        return accounts_.find(id);
    }

    std::vector<domain::Account> list() const override {
        return accounts_.values();
    }

    size_t size() const {
        return accounts_.size();
    }

private:
    utils::ThreadSafeMap<std::string, domain::Account> accounts_;
};

} // namespace accounts::adapters::secondary
