#include <atomic>
#include <cinttypes>
#include <cstdio>
#include <ctime>
#include <mutex>

#include <magic_enum.hpp>
#include <spdlog/sinks/base_sink.h>
#include <unistd.h>

#ifdef __linux__
#include <sys/syscall.h>
#endif

#include "shroud/common/logger.h"

namespace shroud {

static intmax_t current_thread_id() {
#ifdef __linux__
    return (intmax_t) syscall(SYS_gettid);
#else
    return (intmax_t) getpid();
#endif
}

static void default_callback(LogLevel level, std::string_view message) {
    using namespace std::chrono;

    system_clock::time_point now = system_clock::now();
    std::time_t time = system_clock::to_time_t(now);
    tm tm = {};
    localtime_r(&time, &tm);

    char time_str[20];
    strftime(time_str, sizeof(time_str), "%d.%m.%Y %H:%M:%S", &tm);

    fprintf(stderr, "%s.%06d [%" PRIdMAX "] [%s] %.*s", time_str,
            (int) (duration_cast<microseconds>(now.time_since_epoch()).count() % 1000000), current_thread_id(),
            magic_enum::enum_name(level).data(), (int) message.size(), message.data());
}

struct GlobalInfo {
    std::atomic<LogLevel> default_log_level = LOG_LEVEL_INFO;
    std::shared_ptr<LoggerCallback> callback = std::make_shared<LoggerCallback>(default_callback);
    std::mutex registry_mtx;
};

static GlobalInfo &globals() {
    static GlobalInfo info;
    return info;
}

struct CallbackSink : spdlog::sinks::base_sink<std::mutex> {
    CallbackSink() {
        set_pattern_("[%n] %v");
    }

    void sink_it_(const spdlog::details::log_msg &msg) override {
        spdlog::memory_buf_t formatted;
        formatter_->format(msg, formatted);
        std::shared_ptr<LoggerCallback> callback = std::atomic_load(&globals().callback);
        (*callback)((LogLevel) msg.level, std::string_view{formatted.data(), formatted.size()});
    }

    void flush_() override {
        // No op
    }
};

Logger::Logger(const std::string &name) {
    GlobalInfo &info = globals();
    std::scoped_lock l(info.registry_mtx);
    m_logger = spdlog::get(name);
    if (m_logger == nullptr) {
        m_logger = spdlog::default_factory::create<CallbackSink>(name);
        m_logger->set_level((spdlog::level::level_enum) info.default_log_level.load());
    }
}

void set_default_log_level(LogLevel level) {
    globals().default_log_level.store(level);
    spdlog::set_level((spdlog::level::level_enum) level);
}

LogLevel get_default_log_level() {
    return globals().default_log_level.load();
}

void set_logger_callback(LoggerCallback cb) {
    std::atomic_store(&globals().callback, std::make_shared<LoggerCallback>(cb ? std::move(cb) : default_callback));
}

} // namespace shroud
