#pragma once

#include "ports/output/IClock.hpp"

namespace accounts::utils {

class SystemClock : public ports::output::IClock {
public:
    domain::Timestamp now() const override {
        return domain::Timestamp::now();
    }
};

} // namespace accounts::utils
