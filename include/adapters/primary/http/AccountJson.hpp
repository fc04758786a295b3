#pragma once

#include "domain/Account.hpp"
#include <nlohmann/json.hpp>

namespace accounts::adapters::primary::http {

/**
 * @brief Account -> {"id", "name", "email", "created_at"}
 */
inline nlohmann::json accountToJson(const domain::Account& account) {
    nlohmann::json j;
    j["id"] = account.id;
    j["name"] = account.name;
    j["email"] = account.email;
    j["created_at"] = account.createdAt.toString();
    return j;
}

} // namespace accounts::adapters::primary::http
