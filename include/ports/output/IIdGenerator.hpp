#pragma once

#include <string>

namespace accounts::ports::output {

/**
 * @brief Источник уникальных идентификаторов
 */
class IIdGenerator {
public:
    virtual ~IIdGenerator() = default;

    virtual std::string generate() = 0;
};

} // namespace accounts::ports::output
