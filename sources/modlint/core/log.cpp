#include "modlint/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace modlint::log {

    namespace {
        spdlog::level::level_enum to_spdlog(const Level level) {
            switch (level) {
                case Level::Debug: return spdlog::level::debug;
                case Level::Info:  return spdlog::level::info;
                case Level::Warn:  return spdlog::level::warn;
                case Level::Error: return spdlog::level::err;
                case Level::Off:   return spdlog::level::off;
            }
            return spdlog::level::info;
        }
    }

    std::shared_ptr<spdlog::logger> logger() {
        static const std::shared_ptr<spdlog::logger> instance = [] {
            if (auto existing = spdlog::get("modlint")) {
                return existing;
            }
            auto created = spdlog::stderr_color_mt("modlint");
            created->set_pattern("[%H:%M:%S.%e] [%^%l%$] [t%t] %v");
            created->set_level(spdlog::level::warn);
            return created;
        }();
        return instance;
    }

    void set_level(const Level level) {
        logger()->set_level(to_spdlog(level));
    }

}  // namespace modlint::log
