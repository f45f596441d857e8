#include <atomic>
#include <cinttypes>
#include <cstdio>
#include <ctime>
#include <mutex>

#include <magic_enum.hpp>
#include <spdlog/sinks/base_sink.h>

#ifdef __linux__
#include <sys/syscall.h>
#include <unistd.h>
#endif

#include "lb/common/logger.h"

static intmax_t current_thread_id() {
#ifdef __linux__
    return (intmax_t) syscall(SYS_gettid);
#else
    return 0;
#endif
}

static void default_callback(lb::LogLevel level, std::string_view message) {
    using namespace std::chrono;

    system_clock::time_point now = system_clock::now();
    std::time_t time = system_clock::to_time_t(now);

    tm tm = {};
    localtime_r(&time, &tm);

    char time_str[20];
    strftime(time_str, sizeof(time_str), "%d.%m.%Y %H:%M:%S", &tm);

    std::string_view level_name = magic_enum::enum_name(level);
    level_name.remove_prefix(std::string_view{"LOG_LEVEL_"}.size());

    fprintf(stderr, "%s.%06d [%" PRIdMAX "] [%.*s] %.*s\n", time_str,
            (int) (duration_cast<microseconds>(now.time_since_epoch()).count() % 1000000), current_thread_id(),
            (int) level_name.size(), level_name.data(), (int) message.size(), message.data());
}

namespace {

struct GlobalInfo {
    std::atomic<lb::LogLevel> log_level = lb::LogLevel::LOG_LEVEL_INFO;
    std::shared_ptr<lb::Logger::Callback> callback = std::make_shared<lb::Logger::Callback>(default_callback);
    std::mutex registry_mtx;
};

GlobalInfo &globals() {
    static GlobalInfo info;
    return info;
}

struct CallbackSink : spdlog::sinks::base_sink<std::mutex> {
    CallbackSink() {
        set_pattern_("[%n] %v");
    }

    void sink_it_(const spdlog::details::log_msg &msg) override {
        spdlog::memory_buf_t formatted;
        this->formatter_->format(msg, formatted);

        std::string_view message{formatted.data(), formatted.size()};
        while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
            message.remove_suffix(1);
        }

        std::shared_ptr<lb::Logger::Callback> callback = std::atomic_load(&globals().callback);
        (*callback)((lb::LogLevel) msg.level, message);
    }

    void flush_() override {
    }
};

} // namespace

lb::Logger::Logger(const std::string &name) {
    GlobalInfo &info = globals();
    std::scoped_lock l(info.registry_mtx);
    m_logger = spdlog::get(name);
    if (m_logger == nullptr) {
        m_logger = std::make_shared<spdlog::logger>(name, std::make_shared<CallbackSink>());
        m_logger->set_level((spdlog::level::level_enum) info.log_level.load());
        spdlog::register_logger(m_logger);
    }
}

void lb::Logger::set_log_level(LogLevel level) {
    globals().log_level.store(level);
    spdlog::set_level((spdlog::level::level_enum) level);
}

lb::LogLevel lb::Logger::get_log_level() {
    return globals().log_level.load();
}

void lb::Logger::set_callback(Callback cb) {
    std::atomic_store(&globals().callback, std::make_shared<Callback>(cb ? std::move(cb) : default_callback));
}
