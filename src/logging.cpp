#include "capdi/logging.hpp"

#include <mutex>
#include <utility>

namespace capdi {

namespace {

std::shared_ptr<spdlog::logger> make_silent_logger() {
    return std::make_shared<spdlog::logger>("capdi");
}

struct logger_slot {
    std::mutex mutex;
    std::shared_ptr<spdlog::logger> current = make_silent_logger();
};

logger_slot& slot() {
    static logger_slot instance;
    return instance;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    auto& s = slot();
    std::lock_guard lock(s.mutex);
    return s.current;
}

void set_logger(std::shared_ptr<spdlog::logger> logger) {
    auto& s = slot();
    std::lock_guard lock(s.mutex);
    s.current = logger ? std::move(logger) : make_silent_logger();
}

} // namespace capdi
