#include <circsim/core/logging.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <utility>

namespace circsim::core {

namespace {

std::shared_ptr<spdlog::logger> make_default_logger() {
    auto result = std::make_shared<spdlog::logger>(
        "circsim", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    result->set_level(spdlog::level::debug);
    return result;
}

std::mutex& logger_mutex() {
    static std::mutex mutex;
    return mutex;
}

std::shared_ptr<spdlog::logger>& logger_slot() {
    static std::shared_ptr<spdlog::logger> slot = make_default_logger();
    return slot;
}

} // anonymous namespace

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard lock(logger_mutex());
    return logger_slot();
}

void set_logger(std::shared_ptr<spdlog::logger> new_logger) {
    std::lock_guard lock(logger_mutex());
    logger_slot() = new_logger ? std::move(new_logger) : make_default_logger();
}

std::string describe(const std::exception_ptr& error) {
    if (!error) {
        return "no error";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}

} // namespace circsim::core
