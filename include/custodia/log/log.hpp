#pragma once

#include <string_view>

#include <quill/LogMacros.h>

#include <custodia/log/formatter.hpp>
#include <custodia/log/frontend.hpp>

namespace custodia::log {

void initialize() noexcept;
logger* instance() noexcept;

/**
 * Sets the level of the root logger from its name, e.g. "debug" or "warning".
 *
 * Returns false and leaves the level unchanged when the name is not a quill level.
 */
bool set_level( std::string_view level ) noexcept;

} // namespace custodia::log
