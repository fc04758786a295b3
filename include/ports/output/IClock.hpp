#pragma once

#include "domain/Timestamp.hpp"

namespace accounts::ports::output {

/**
 * @brief Источник текущего времени (UTC)
 */
class IClock {
public:
    virtual ~IClock() = default;

    virtual domain::Timestamp now() const = 0;
};

} // namespace accounts::ports::output
