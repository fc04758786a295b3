#pragma once

#include "ports/output/ICallObserver.hpp"
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace accounts::adapters::secondary {

/**
 * @brief Пишет каждый вызов одной строкой в поток (по умолчанию std::cout)
 *
 * Формат:
 *   [HTTP] POST /accounts | req: {"name":"a"} -> 400 | resp: {"error":"..."} | 0.087ms
 *   [gRPC] /account.AccountService/GetAccount | req: {"id":"x"} -> NOT_FOUND | resp: account not found | 0.031ms
 *
 * Строка форматируется вне блокировки, под mutex только запись в поток.
 */
class LogCallObserver : public ports::output::ICallObserver {
public:
    LogCallObserver() : out_(&std::cout) {}

    explicit LogCallObserver(std::ostream& out) : out_(&out) {}

    void onCallCompleted(const ports::output::CallRecord& record) override {
        std::string line = format(record);

        std::lock_guard<std::mutex> lock(mutex_);
        *out_ << line << std::endl;
    }

    static std::string format(const ports::output::CallRecord& record) {
        std::ostringstream ss;
        ss << "[" << record.transport << "] "
           << record.label
           << " | req: " << record.request
           << " -> " << record.status
           << " | resp: " << record.response
           << " | " << formatElapsed(record.elapsed);
        return ss.str();
    }

private:
    std::ostream* out_;
    std::mutex mutex_;

    static std::string formatElapsed(std::chrono::microseconds elapsed) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(3)
           << static_cast<double>(elapsed.count()) / 1000.0 << "ms";
        return ss.str();
    }
};

} // namespace accounts::adapters::secondary
