#include "ph_base.hpp"
#include "ipc/pool_protocol.hpp"

#include <random>

using json = nlohmann::json;

namespace poolhub::ipc
{

namespace
{

constexpr const char *kCompletion = "completion";
constexpr const char *kCommand = "command";
constexpr const char *kStatus = "status";
constexpr const char *kConfigUpdate = "config-update";
constexpr const char *kRecycle = "recycle";
constexpr const char *kWarmup = "warmup";
constexpr const char *kDispose = "dispose";
constexpr const char *kClientHello = "client-hello";
constexpr const char *kError = "error";
constexpr const char *kServerShuttingDown = "server-shutting-down";
constexpr const char *kPoolDegraded = "pool-degraded";

json parse_object(std::string_view line)
{
    json j = json::parse(line, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object())
    {
        throw ProtocolError("malformed frame: not a JSON object");
    }
    return j;
}

std::string require_string(const json &j, const char *key, const std::string &id)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_string())
    {
        throw ProtocolError(fmt::format("missing or non-string field '{}'", key), id);
    }
    return it->get<std::string>();
}

std::string string_or_empty(const json &j, const char *key)
{
    auto it = j.find(key);
    return it != j.end() && it->is_string() ? it->get<std::string>() : std::string{};
}

std::optional<std::string> nullable_string(const json &j, const char *key)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_string())
        return std::nullopt;
    return it->get<std::string>();
}

bool require_bool(const json &j, const char *key, const std::string &id)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_boolean())
    {
        throw ProtocolError(fmt::format("missing or non-boolean field '{}'", key), id);
    }
    return it->get<bool>();
}

PoolKind require_pool(const json &j, const std::string &id, bool allow_all)
{
    const std::string name = require_string(j, "pool", id);
    auto kind = pool_kind_from_string(name);
    if (!kind || (!allow_all && *kind == PoolKind::All))
    {
        throw ProtocolError(fmt::format("invalid pool '{}'", name), id);
    }
    return *kind;
}

template <typename T> json optional_to_json(const std::optional<T> &v)
{
    return v ? json(*v) : json(nullptr);
}

// --- request encoders ---

json to_json(const CompletionRequest &r)
{
    return json{{"type", kCompletion},       {"id", r.id},
                {"prefix", r.prefix},        {"suffix", r.suffix},
                {"mode", r.mode},            {"languageId", r.language_id},
                {"fileName", r.file_name},   {"filePath", r.file_path}};
}
json to_json(const CommandRequest &r)
{
    json j{{"type", kCommand}, {"id", r.id}, {"message", r.message}};
    if (r.timeout_ms)
        j["timeoutMs"] = *r.timeout_ms;
    return j;
}
json to_json(const StatusRequest &r) { return json{{"type", kStatus}, {"id", r.id}}; }
json to_json(const ConfigUpdateRequest &r)
{
    json j{{"type", kConfigUpdate}, {"id", r.id}};
    if (r.model)
        j["model"] = *r.model;
    return j;
}
json to_json(const RecycleRequest &r)
{
    return json{{"type", kRecycle}, {"id", r.id}, {"pool", to_string(r.pool)}};
}
json to_json(const WarmupRequest &r)
{
    return json{{"type", kWarmup}, {"id", r.id}, {"pool", to_string(r.pool)}};
}
json to_json(const DisposeRequest &r) { return json{{"type", kDispose}, {"id", r.id}}; }
json to_json(const ClientHelloRequest &r)
{
    return json{{"type", kClientHello}, {"id", r.id}, {"clientId", r.client_id}};
}

// --- response encoders ---

json with_error(json j, const std::optional<std::string> &error)
{
    if (error)
        j["error"] = *error;
    return j;
}

json to_json(const CompletionResponse &r)
{
    return with_error(json{{"type", kCompletion},
                           {"id", r.id},
                           {"success", r.success},
                           {"completion", optional_to_json(r.completion)}},
                      r.error);
}
json to_json(const CommandResponse &r)
{
    return with_error(json{{"type", kCommand},
                           {"id", r.id},
                           {"success", r.success},
                           {"text", optional_to_json(r.text)},
                           {"meta", r.meta ? *r.meta : json(nullptr)}},
                      r.error);
}
json to_json(const StatusResponse &r)
{
    return json{{"type", kStatus},
                {"id", r.id},
                {"success", r.success},
                {"completionPoolAvailable", r.completion_pool_available},
                {"commandPoolAvailable", r.command_pool_available},
                {"connectedClients", r.connected_clients},
                {"model", r.model},
                {"completionPool", r.completion_pool},
                {"commandPool", r.command_pool}};
}
json to_json(const ConfigUpdateResponse &r)
{
    return with_error(json{{"type", kConfigUpdate}, {"id", r.id}, {"success", r.success}},
                      r.error);
}
json to_json(const RecycleResponse &r)
{
    return with_error(json{{"type", kRecycle}, {"id", r.id}, {"success", r.success}}, r.error);
}
json to_json(const WarmupResponse &r)
{
    return with_error(json{{"type", kWarmup}, {"id", r.id}, {"success", r.success}}, r.error);
}
json to_json(const DisposeResponse &r)
{
    return json{{"type", kDispose}, {"id", r.id}, {"success", r.success}};
}
json to_json(const ClientHelloResponse &r)
{
    return json{{"type", kClientHello},
                {"id", r.id},
                {"success", r.success},
                {"serverId", r.server_id},
                {"model", r.model}};
}
json to_json(const ErrorResponse &r)
{
    return json{{"type", kError}, {"id", r.id}, {"success", false}, {"error", r.error}};
}

// --- event encoders ---

json to_json(const ServerShuttingDownEvent &) { return json{{"type", kServerShuttingDown}}; }
json to_json(const PoolDegradedEvent &e)
{
    return json{{"type", kPoolDegraded}, {"pool", to_string(e.pool)}};
}

std::string to_line(const json &j)
{
    // Replacement keeps a frame valid even if a backend produced broken UTF-8.
    return j.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
}

// --- response decoding ---

Response decode_response(const json &j, const std::string &type, const std::string &id)
{
    if (type == kError)
    {
        return ErrorResponse{id, string_or_empty(j, "error")};
    }
    const bool success = require_bool(j, "success", id);
    if (type == kCompletion)
    {
        return CompletionResponse{id, success, nullable_string(j, "completion"),
                                  nullable_string(j, "error")};
    }
    if (type == kCommand)
    {
        std::optional<json> meta;
        if (auto it = j.find("meta"); it != j.end() && it->is_object())
            meta = *it;
        return CommandResponse{id, success, nullable_string(j, "text"), std::move(meta),
                               nullable_string(j, "error")};
    }
    if (type == kStatus)
    {
        StatusResponse r;
        r.id = id;
        r.success = success;
        r.completion_pool_available = j.value("completionPoolAvailable", false);
        r.command_pool_available = j.value("commandPoolAvailable", false);
        r.connected_clients = j.value("connectedClients", 0);
        r.model = string_or_empty(j, "model");
        r.completion_pool = j.value("completionPool", json(nullptr));
        r.command_pool = j.value("commandPool", json(nullptr));
        return r;
    }
    if (type == kConfigUpdate)
        return ConfigUpdateResponse{id, success, nullable_string(j, "error")};
    if (type == kRecycle)
        return RecycleResponse{id, success, nullable_string(j, "error")};
    if (type == kWarmup)
        return WarmupResponse{id, success, nullable_string(j, "error")};
    if (type == kDispose)
        return DisposeResponse{id, success};
    if (type == kClientHello)
    {
        return ClientHelloResponse{id, success, string_or_empty(j, "serverId"),
                                   string_or_empty(j, "model")};
    }
    throw ProtocolError(fmt::format("unknown response type '{}'", type), id);
}

Event decode_event(const json &j, const std::string &type)
{
    if (type == kServerShuttingDown)
        return ServerShuttingDownEvent{};
    if (type == kPoolDegraded)
        return PoolDegradedEvent{require_pool(j, {}, /*allow_all=*/false)};
    throw ProtocolError(fmt::format("unknown event type '{}'", type));
}

} // namespace

const char *to_string(PoolKind kind) noexcept
{
    switch (kind)
    {
    case PoolKind::Completion:
        return "completion";
    case PoolKind::Command:
        return "command";
    case PoolKind::All:
        return "all";
    }
    return "unknown";
}

std::optional<PoolKind> pool_kind_from_string(std::string_view name)
{
    if (name == "completion")
        return PoolKind::Completion;
    if (name == "command")
        return PoolKind::Command;
    if (name == "all")
        return PoolKind::All;
    return std::nullopt;
}

std::string encode(const Request &request)
{
    return to_line(std::visit([](const auto &r) { return to_json(r); }, request));
}

std::string encode(const Response &response)
{
    return to_line(std::visit([](const auto &r) { return to_json(r); }, response));
}

std::string encode(const Event &event)
{
    return to_line(std::visit([](const auto &e) { return to_json(e); }, event));
}

namespace
{
Request decode_request_object(const json &j);
}

Request decode_request(std::string_view line)
{
    const json j = parse_object(line);
    try
    {
        return decode_request_object(j);
    }
    catch (const json::exception &e)
    {
        throw ProtocolError(fmt::format("invalid request: {}", e.what()),
                            string_or_empty(j, "id"));
    }
}

namespace
{
Request decode_request_object(const json &j)
{
    const std::string id = string_or_empty(j, "id");
    if (id.empty())
    {
        throw ProtocolError("request without an id");
    }
    const std::string type = require_string(j, "type", id);

    if (type == kCompletion)
    {
        CompletionRequest r;
        r.id = id;
        r.prefix = require_string(j, "prefix", id);
        r.suffix = require_string(j, "suffix", id);
        r.mode = string_or_empty(j, "mode");
        r.language_id = string_or_empty(j, "languageId");
        r.file_name = string_or_empty(j, "fileName");
        r.file_path = string_or_empty(j, "filePath");
        return r;
    }
    if (type == kCommand)
    {
        CommandRequest r;
        r.id = id;
        r.message = require_string(j, "message", id);
        if (auto it = j.find("timeoutMs"); it != j.end() && !it->is_null())
        {
            if (!it->is_number_integer())
                throw ProtocolError("non-integer field 'timeoutMs'", id);
            r.timeout_ms = it->get<int>();
        }
        return r;
    }
    if (type == kStatus)
        return StatusRequest{id};
    if (type == kConfigUpdate)
        return ConfigUpdateRequest{id, nullable_string(j, "model")};
    if (type == kRecycle)
        return RecycleRequest{id, require_pool(j, id, /*allow_all=*/true)};
    if (type == kWarmup)
        return WarmupRequest{id, require_pool(j, id, /*allow_all=*/false)};
    if (type == kDispose)
        return DisposeRequest{id};
    if (type == kClientHello)
        return ClientHelloRequest{id, require_string(j, "clientId", id)};

    throw ProtocolError(fmt::format("unknown request type '{}'", type), id);
}
} // namespace

ServerMessage decode_server_message(std::string_view line)
{
    const json j = parse_object(line);
    const std::string type = require_string(j, "type", {});
    try
    {
        if (auto it = j.find("id"); it != j.end())
        {
            if (!it->is_string())
                throw ProtocolError("non-string field 'id'");
            return decode_response(j, type, it->get<std::string>());
        }
        return decode_event(j, type);
    }
    catch (const json::exception &e)
    {
        throw ProtocolError(fmt::format("invalid server message: {}", e.what()));
    }
}

const std::string &request_id(const Request &request)
{
    return std::visit([](const auto &r) -> const std::string & { return r.id; }, request);
}

const std::string &response_id(const Response &response)
{
    return std::visit([](const auto &r) -> const std::string & { return r.id; }, response);
}

const char *request_type(const Request &request)
{
    static constexpr const char *kNames[] = {kCompletion, kCommand, kStatus,     kConfigUpdate,
                                             kRecycle,    kWarmup,  kDispose,    kClientHello};
    return kNames[request.index()];
}

const char *response_type(const Response &response)
{
    static constexpr const char *kNames[] = {kCompletion, kCommand, kStatus,
                                             kConfigUpdate, kRecycle, kWarmup,
                                             kDispose,    kClientHello, kError};
    return kNames[response.index()];
}

bool response_success(const Response &response)
{
    return std::visit(
        [](const auto &r)
        {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, ErrorResponse>)
                return false;
            else
                return r.success;
        },
        response);
}

std::string generate_request_id()
{
    static constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> pick(0, 35);
    std::string id(8, '0');
    for (char &c : id)
    {
        c = kAlphabet[pick(rng)];
    }
    return id;
}

} // namespace poolhub::ipc
