#pragma once
/**
 * @file ph_pool.hpp
 * @brief Layer 3/4 umbrella: session pools and the pool server/client.
 */
#include "ph_service.hpp"

#include "pool/session_channel.hpp"
#include "pool/fill_message.hpp"
#include "pool/slot_pool.hpp"
#include "pool/completion_pool.hpp"
#include "pool/command_pool.hpp"

#include "ipc/pool_protocol.hpp"
#include "ipc/pool_server.hpp"
#include "ipc/pool_client.hpp"
