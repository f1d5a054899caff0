/**
 * @file test_pool_protocol.cpp
 * @brief Newline-delimited JSON messages between PoolClient and PoolServer.
 */
#include "ph_pool.hpp"
#include "test_patterns.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <set>

using namespace poolhub::ipc;
using json = nlohmann::json;
using ::testing::HasSubstr;

class PoolProtocolTest : public poolhub::tests::PureApiTest
{
  protected:
    static json frame(const std::string &line)
    {
        EXPECT_FALSE(line.empty());
        EXPECT_EQ(line.back(), '\n');
        EXPECT_EQ(line.find('\n'), line.size() - 1) << "frame spans several lines";
        return json::parse(line);
    }

    /// Expects decode_request(@p line) to throw ProtocolError carrying @p id.
    static void expect_rejected(const std::string &line, const std::string &id,
                                const std::string &what)
    {
        try
        {
            (void)decode_request(line);
            ADD_FAILURE() << "accepted: " << line;
        }
        catch (const ProtocolError &e)
        {
            EXPECT_EQ(e.request_id(), id) << line;
            EXPECT_THAT(e.what(), HasSubstr(what)) << line;
        }
    }
};

TEST_F(PoolProtocolTest, CompletionRequestLayout)
{
    CompletionRequest req;
    req.id = "abc12345";
    req.prefix = "int main() {\n";
    req.suffix = "}\n";
    req.language_id = "cpp";
    req.file_name = "main.cpp";
    const json j = frame(encode(Request{req}));
    EXPECT_EQ(j["type"], "completion");
    EXPECT_EQ(j["id"], "abc12345");
    EXPECT_EQ(j["prefix"], "int main() {\n");
    EXPECT_EQ(j["suffix"], "}\n");
    EXPECT_EQ(j["languageId"], "cpp");
    EXPECT_EQ(j["fileName"], "main.cpp");
    EXPECT_EQ(j["filePath"], "");
    EXPECT_EQ(j["mode"], "");
}

TEST_F(PoolProtocolTest, CompletionRequestOptionalFieldsDefault)
{
    const Request r = decode_request(R"({"type":"completion","id":"r1","prefix":"a","suffix":""})");
    const auto *req = std::get_if<CompletionRequest>(&r);
    ASSERT_NE(req, nullptr);
    EXPECT_EQ(req->prefix, "a");
    EXPECT_EQ(req->suffix, "");
    EXPECT_EQ(req->language_id, "");
    EXPECT_EQ(request_id(r), "r1");
    EXPECT_STREQ(request_type(r), "completion");
}

TEST_F(PoolProtocolTest, CommandTimeoutIsOptional)
{
    const Request absent = decode_request(R"({"type":"command","id":"c1","message":"hi"})");
    EXPECT_FALSE(std::get<CommandRequest>(absent).timeout_ms.has_value());

    const Request null_timeout =
        decode_request(R"({"type":"command","id":"c2","message":"hi","timeoutMs":null})");
    EXPECT_FALSE(std::get<CommandRequest>(null_timeout).timeout_ms.has_value());

    const Request given =
        decode_request(R"({"type":"command","id":"c3","message":"hi","timeoutMs":1500})");
    EXPECT_EQ(std::get<CommandRequest>(given).timeout_ms, 1500);

    expect_rejected(R"({"type":"command","id":"c4","message":"hi","timeoutMs":"soon"})", "c4",
                    "timeoutMs");

    // Encoding omits an absent timeout.
    const json j = frame(encode(Request{CommandRequest{"c5", "hi", std::nullopt}}));
    EXPECT_FALSE(j.contains("timeoutMs"));
}

TEST_F(PoolProtocolTest, PoolNamesAreValidatedPerRequest)
{
    EXPECT_EQ(std::get<RecycleRequest>(decode_request(R"({"type":"recycle","id":"x","pool":"all"})"))
                  .pool,
              PoolKind::All);
    EXPECT_EQ(std::get<WarmupRequest>(
                  decode_request(R"({"type":"warmup","id":"x","pool":"command"})"))
                  .pool,
              PoolKind::Command);
    expect_rejected(R"({"type":"warmup","id":"w1","pool":"all"})", "w1", "invalid pool");
    expect_rejected(R"({"type":"recycle","id":"r1","pool":"everything"})", "r1", "invalid pool");
    expect_rejected(R"({"type":"recycle","id":"r2"})", "r2", "'pool'");

    EXPECT_STREQ(to_string(PoolKind::Completion), "completion");
    EXPECT_EQ(pool_kind_from_string("command"), PoolKind::Command);
    EXPECT_FALSE(pool_kind_from_string("Command").has_value());
}

TEST_F(PoolProtocolTest, MalformedRequestsAreRejected)
{
    expect_rejected("not json", "", "malformed");
    expect_rejected("[1,2,3]", "", "malformed");
    expect_rejected(R"({"type":"status"})", "", "without an id");
    expect_rejected(R"({"type":"status","id":""})", "", "without an id");
    expect_rejected(R"({"id":"n1"})", "n1", "'type'");
    expect_rejected(R"({"type":"teleport","id":"t1"})", "t1", "unknown request type");
    expect_rejected(R"({"type":"completion","id":"p1","suffix":""})", "p1", "'prefix'");
    expect_rejected(R"({"type":"completion","id":"p2","prefix":7,"suffix":""})", "p2", "'prefix'");
    expect_rejected(R"({"type":"client-hello","id":"h1"})", "h1", "'clientId'");
}

TEST_F(PoolProtocolTest, SmallRequests)
{
    EXPECT_TRUE(std::holds_alternative<StatusRequest>(
        decode_request(R"({"type":"status","id":"s"})")));
    EXPECT_TRUE(std::holds_alternative<DisposeRequest>(
        decode_request(R"({"type":"dispose","id":"d"})")));

    const Request hello = decode_request(R"({"type":"client-hello","id":"h","clientId":"42-ab"})");
    EXPECT_EQ(std::get<ClientHelloRequest>(hello).client_id, "42-ab");

    const Request no_model = decode_request(R"({"type":"config-update","id":"u"})");
    EXPECT_FALSE(std::get<ConfigUpdateRequest>(no_model).model.has_value());
    const Request model = decode_request(R"({"type":"config-update","id":"u","model":"opus"})");
    EXPECT_EQ(std::get<ConfigUpdateRequest>(model).model, "opus");
}

TEST_F(PoolProtocolTest, ResponsesCarrySuccessFlag)
{
    const json failed =
        frame(encode(Response{CompletionResponse{"r1", false, std::nullopt, "Completion pool not available"}}));
    EXPECT_EQ(failed["type"], "completion");
    EXPECT_EQ(failed["success"], false);
    EXPECT_TRUE(failed["completion"].is_null());
    EXPECT_EQ(failed["error"], "Completion pool not available");

    const json ok = frame(encode(Response{CompletionResponse{"r2", true, "x + 1", std::nullopt}}));
    EXPECT_EQ(ok["completion"], "x + 1");
    EXPECT_FALSE(ok.contains("error"));

    const json error = frame(encode(Response{ErrorResponse{"r3", "unknown request type 'x'"}}));
    EXPECT_EQ(error["type"], "error");
    EXPECT_EQ(error["success"], false);

    EXPECT_FALSE(response_success(Response{ErrorResponse{"r3", "e"}}));
    EXPECT_TRUE(response_success(Response{DisposeResponse{"r4", true}}));
    EXPECT_STREQ(response_type(Response{WarmupResponse{"r5", true, std::nullopt}}), "warmup");
    EXPECT_EQ(response_id(Response{RecycleResponse{"r6", true, std::nullopt}}), "r6");
}

TEST_F(PoolProtocolTest, StatusResponseLayout)
{
    StatusResponse status;
    status.id = "s1";
    status.completion_pool_available = true;
    status.connected_clients = 3;
    status.model = "haiku";
    status.completion_pool = json{{"label", "CompletionPool"}};
    const json j = frame(encode(Response{status}));
    EXPECT_EQ(j["completionPoolAvailable"], true);
    EXPECT_EQ(j["commandPoolAvailable"], false);
    EXPECT_EQ(j["connectedClients"], 3);
    EXPECT_EQ(j["completionPool"]["label"], "CompletionPool");
    EXPECT_TRUE(j["commandPool"].is_null());

    const ServerMessage back = decode_server_message(encode(Response{status}));
    const auto &decoded = std::get<StatusResponse>(std::get<Response>(back));
    EXPECT_EQ(decoded.connected_clients, 3);
    EXPECT_EQ(decoded.model, "haiku");
    EXPECT_EQ(decoded.completion_pool["label"], "CompletionPool");
}

TEST_F(PoolProtocolTest, CommandResponseMeta)
{
    const ServerMessage with_meta = decode_server_message(
        R"({"type":"command","id":"c","success":true,"text":"done","meta":{"inputTokens":4}})");
    const auto &reply = std::get<CommandResponse>(std::get<Response>(with_meta));
    EXPECT_EQ(reply.text, "done");
    ASSERT_TRUE(reply.meta.has_value());
    EXPECT_EQ((*reply.meta)["inputTokens"], 4);

    const ServerMessage null_meta = decode_server_message(
        R"({"type":"command","id":"c","success":true,"text":null,"meta":null})");
    const auto &empty = std::get<CommandResponse>(std::get<Response>(null_meta));
    EXPECT_FALSE(empty.text.has_value());
    EXPECT_FALSE(empty.meta.has_value());
}

TEST_F(PoolProtocolTest, EventsHaveNoId)
{
    const json shutdown = frame(encode(Event{ServerShuttingDownEvent{}}));
    EXPECT_EQ(shutdown, json({{"type", "server-shutting-down"}}));
    const json degraded = frame(encode(Event{PoolDegradedEvent{PoolKind::Command}}));
    EXPECT_EQ(degraded["pool"], "command");
    EXPECT_FALSE(degraded.contains("id"));

    const ServerMessage msg = decode_server_message(R"({"type":"pool-degraded","pool":"completion"})");
    ASSERT_TRUE(std::holds_alternative<Event>(msg));
    EXPECT_EQ(std::get<PoolDegradedEvent>(std::get<Event>(msg)).pool, PoolKind::Completion);
}

TEST_F(PoolProtocolTest, MalformedServerMessagesAreRejected)
{
    EXPECT_THROW(decode_server_message("{"), ProtocolError);
    EXPECT_THROW(decode_server_message(R"({"id":"x","success":true})"), ProtocolError);
    EXPECT_THROW(decode_server_message(R"({"type":"status","id":"x"})"), ProtocolError);
    EXPECT_THROW(decode_server_message(R"({"type":"status","id":7,"success":true})"),
                 ProtocolError);
    EXPECT_THROW(decode_server_message(R"({"type":"teleport","id":"x","success":true})"),
                 ProtocolError);
    EXPECT_THROW(decode_server_message(R"({"type":"pool-degraded","pool":"all"})"), ProtocolError);
    EXPECT_THROW(decode_server_message(R"({"type":"meteor-strike"})"), ProtocolError);
}

TEST_F(PoolProtocolTest, BrokenUtf8StaysOneValidFrame)
{
    const std::string broken = std::string("ok ") + static_cast<char>(0xC3) + "\n(";
    const json j = frame(encode(Response{CompletionResponse{"u", true, broken, std::nullopt}}));
    EXPECT_TRUE(j["completion"].is_string());
}

TEST_F(PoolProtocolTest, GeneratedIdsAreShortAndDistinct)
{
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i)
    {
        const std::string id = generate_request_id();
        ASSERT_EQ(id.size(), 8u);
        for (char c : id)
        {
            EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'z')) << id;
        }
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 200u);
}
