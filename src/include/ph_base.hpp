#pragma once
/**
 * @file ph_base.hpp
 * @brief Layer 1 umbrella: platform plus formatting, debug and module-definition basics.
 */
#include "ph_platform.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <fmt/chrono.h>

#include "utils/format_tools.hpp"
#include "utils/debug_info.hpp"
#include "utils/scope_guard.hpp"
#include "utils/module_def.hpp"
