#pragma once

#include "ports/input/IAccountService.hpp"
#include "ports/output/IAccountStore.hpp"
#include "ports/output/IIdGenerator.hpp"
#include "ports/output/IClock.hpp"
#include <memory>
#include <iostream>

namespace accounts::application {

/**
 * @brief Сервис учётных записей
 *
 * Назначает id (UUID v4, не счётчик: создание идёт параллельно
 * из двух транспортов) и время создания, затем отдаёт запись в хранилище.
 * Собственного состояния не имеет.
 */
class AccountService : public ports::input::IAccountService {
public:
    AccountService(
        std::shared_ptr<ports::output::IAccountStore> store,
        std::shared_ptr<ports::output::IIdGenerator> idGenerator,
        std::shared_ptr<ports::output::IClock> clock
    ) : store_(std::move(store))
      , idGenerator_(std::move(idGenerator))
      , clock_(std::move(clock))
    {
        std::cout << "[AccountService] Created" << std::endl;
    }

    domain::Account createAccount(const std::string& name, const std::string& email) override {
        domain::Account account(
            idGenerator_->generate(),
            name,
            email,
            clock_->now()
        );
        return store_->create(account);
    }

    std::optional<domain::Account> getAccount(const std::string& id) override {
        return store_->get(id);
    }

    std::vector<domain::Account> listAccounts() override {
        return store_->list();
    }

private:
    std::shared_ptr<ports::output::IAccountStore> store_;
    std::shared_ptr<ports::output::IIdGenerator> idGenerator_;
    std::shared_ptr<ports::output::IClock> clock_;
};

} // namespace accounts::application
