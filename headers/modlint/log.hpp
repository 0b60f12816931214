#ifndef MODLINT_LOG_HPP
#define MODLINT_LOG_HPP

/**
 * @file log.hpp
 * @brief Project logger.
 *
 * All components log through one spdlog logger named "modlint" that writes
 * to stderr, so diagnostics printed on stdout stay machine-readable.
 *
 * @code
 *     log::logger()->debug("batch {} closed with {} modules", index, count);
 * @endcode
 */

#include <spdlog/spdlog.h>

#include <memory>

namespace modlint::log {

    enum class Level {
        Debug,
        Info,
        Warn,
        Error,
        Off
    };

    /**
     * Returns the shared logger, creating it on first use.
     */
    [[nodiscard]] std::shared_ptr<spdlog::logger> logger();

    /**
     * Sets the minimum level that reaches the sink.
     */
    void set_level(Level level);

}  // namespace modlint::log

#endif // MODLINT_LOG_HPP
