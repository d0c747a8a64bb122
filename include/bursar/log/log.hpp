#pragma once

#include <string_view>

#include <quill/LogMacros.h>

#include <bursar/log/formatter.hpp>
#include <bursar/log/frontend.hpp>

namespace bursar::log {

void initialize() noexcept;
logger* instance() noexcept;

/**
 * Sets the filtering level of the root logger from its name ("debug", "info",
 * "warning", "error", ...). Returns false and leaves the level unchanged when the
 * name is not recognized.
 */
bool set_level( std::string_view level );

} // namespace bursar::log
