#pragma once
/**
 * @file pool_protocol.hpp
 * @brief Wire messages between PoolClient and PoolServer.
 *
 * Framing: one JSON object per line over an AF_UNIX stream socket.
 *
 *   request   {"type": <kind>, "id": <id>, ...}
 *   response  {"type": <kind>, "id": <id>, "success": <bool>, ...}
 *   event     {"type": <kind>, ...}                        (server push, no "id")
 *
 * The message sets are closed: decoding rejects unknown kinds and missing or mistyped
 * required fields with ProtocolError.
 */
#include "ph_base.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace poolhub::ipc
{

class ProtocolError : public std::runtime_error
{
  public:
    explicit ProtocolError(const std::string &what, std::string request_id = {})
        : std::runtime_error(what), m_request_id(std::move(request_id))
    {
    }
    /// Id of the offending request when it could be recovered, else empty.
    [[nodiscard]] const std::string &request_id() const noexcept { return m_request_id; }

  private:
    std::string m_request_id;
};

enum class PoolKind
{
    Completion,
    Command,
    All,
};

POOLHUB_UTILS_EXPORT const char *to_string(PoolKind kind) noexcept;
POOLHUB_UTILS_EXPORT std::optional<PoolKind> pool_kind_from_string(std::string_view name);

// ---------------------------------------------------------------------------
// Requests
// ---------------------------------------------------------------------------

struct CompletionRequest
{
    std::string id;
    std::string prefix;
    std::string suffix;
    std::string mode;
    std::string language_id;
    std::string file_name;
    std::string file_path;
};

struct CommandRequest
{
    std::string id;
    std::string message;
    std::optional<int> timeout_ms;
};

struct StatusRequest
{
    std::string id;
};

struct ConfigUpdateRequest
{
    std::string id;
    std::optional<std::string> model;
};

struct RecycleRequest
{
    std::string id;
    PoolKind pool = PoolKind::All;
};

struct WarmupRequest
{
    std::string id;
    PoolKind pool = PoolKind::Completion; ///< Completion or Command
};

struct DisposeRequest
{
    std::string id;
};

struct ClientHelloRequest
{
    std::string id;
    std::string client_id;
};

using Request = std::variant<CompletionRequest, CommandRequest, StatusRequest,
                             ConfigUpdateRequest, RecycleRequest, WarmupRequest, DisposeRequest,
                             ClientHelloRequest>;

// ---------------------------------------------------------------------------
// Responses
// ---------------------------------------------------------------------------

struct CompletionResponse
{
    std::string id;
    bool success = true;
    std::optional<std::string> completion;
    std::optional<std::string> error;
};

struct CommandResponse
{
    std::string id;
    bool success = true;
    std::optional<std::string> text;
    std::optional<nlohmann::json> meta;
    std::optional<std::string> error;
};

struct StatusResponse
{
    std::string id;
    bool success = true;
    bool completion_pool_available = false;
    bool command_pool_available = false;
    int connected_clients = 0;
    std::string model;
    nlohmann::json completion_pool; ///< PoolStats::to_json() or null
    nlohmann::json command_pool;
};

struct ConfigUpdateResponse
{
    std::string id;
    bool success = true;
    std::optional<std::string> error;
};

struct RecycleResponse
{
    std::string id;
    bool success = true;
    std::optional<std::string> error;
};

struct WarmupResponse
{
    std::string id;
    bool success = true;
    std::optional<std::string> error;
};

struct DisposeResponse
{
    std::string id;
    bool success = true;
};

struct ClientHelloResponse
{
    std::string id;
    bool success = true;
    std::string server_id;
    std::string model;
};

struct ErrorResponse
{
    std::string id;
    std::string error;
};

using Response = std::variant<CompletionResponse, CommandResponse, StatusResponse,
                              ConfigUpdateResponse, RecycleResponse, WarmupResponse,
                              DisposeResponse, ClientHelloResponse, ErrorResponse>;

// ---------------------------------------------------------------------------
// Server events
// ---------------------------------------------------------------------------

struct ServerShuttingDownEvent
{
};

struct PoolDegradedEvent
{
    PoolKind pool = PoolKind::Completion;
};

using Event = std::variant<ServerShuttingDownEvent, PoolDegradedEvent>;

/// Anything the server writes.
using ServerMessage = std::variant<Response, Event>;

// ---------------------------------------------------------------------------
// Codec
// ---------------------------------------------------------------------------

/** @brief Serializes to a single line terminated by '\n'. */
POOLHUB_UTILS_EXPORT std::string encode(const Request &request);
POOLHUB_UTILS_EXPORT std::string encode(const Response &response);
POOLHUB_UTILS_EXPORT std::string encode(const Event &event);

/** @throws ProtocolError */
POOLHUB_UTILS_EXPORT Request decode_request(std::string_view line);

/** @throws ProtocolError */
POOLHUB_UTILS_EXPORT ServerMessage decode_server_message(std::string_view line);

POOLHUB_UTILS_EXPORT const std::string &request_id(const Request &request);
POOLHUB_UTILS_EXPORT const std::string &response_id(const Response &response);
POOLHUB_UTILS_EXPORT const char *request_type(const Request &request);
POOLHUB_UTILS_EXPORT const char *response_type(const Response &response);
/** @brief The `success` flag; always false for ErrorResponse. */
POOLHUB_UTILS_EXPORT bool response_success(const Response &response);

/** @brief 8 random base-36 characters. */
POOLHUB_UTILS_EXPORT std::string generate_request_id();

} // namespace poolhub::ipc
