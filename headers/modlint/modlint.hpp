#ifndef MODLINT_MODLINT_HPP
#define MODLINT_MODLINT_HPP

/**
 * @file modlint.hpp
 * @brief Main header of the modlint library.
 *
 * Pulls in the runtime and its default collaborators. Include the specific
 * headers for narrower dependencies.
 */

#include "modlint/version.hpp"
#include "modlint/error.hpp"
#include "modlint/result.hpp"
#include "modlint/types.hpp"
#include "modlint/log.hpp"

#include "modlint/config/config.hpp"
#include "modlint/fs/file_system.hpp"
#include "modlint/fs/walker.hpp"
#include "modlint/loader/loader_registry.hpp"
#include "modlint/resolver/resolver.hpp"
#include "modlint/rules/builtin_rules.hpp"
#include "modlint/runtime/runtime.hpp"
#include "modlint/utils/json_utils.hpp"
#include "modlint/utils/path_utils.hpp"

#endif // MODLINT_MODLINT_HPP
