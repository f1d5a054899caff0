#pragma once
/**
 * @file ph_service.hpp
 * @brief Layer 2 umbrella: lifecycle, logger, config, leader lock and the event loop.
 */
#include "ph_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"
#include "utils/pool_config.hpp"
#include "utils/ipc_path.hpp"
#include "utils/lock_file.hpp"
#include "utils/event_loop.hpp"
