#ifndef MODLINT_VERSION_HPP
#define MODLINT_VERSION_HPP

/**
 * @file version.hpp
 * @brief modlint version information.
 */

namespace modlint {

    constexpr int VERSION_MAJOR = 0;
    constexpr int VERSION_MINOR = 3;
    constexpr int VERSION_PATCH = 0;

    constexpr auto VERSION_STRING = "0.3.0";

    constexpr auto PROJECT_NAME = "modlint";

    /**
     * Default configuration file looked up in the working directory.
     */
    constexpr auto CONFIG_FILE_NAME = ".modlintrc.json";

}  // namespace modlint

#endif // MODLINT_VERSION_HPP
