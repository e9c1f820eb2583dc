#include <agentlink/errors.hpp>
#include <agentlink/protocol/control.hpp>
#include <chrono>
#include <condition_variable>
#include <future>
#include <gtest/gtest.h>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace agentlink;
using namespace agentlink::protocol;

namespace
{

// Captures written requests so the test can answer them from another thread
struct CapturingWriter
{
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<json> sent;

    WriteFunction function()
    {
        return [this](const std::string& data)
        {
            {
                std::lock_guard<std::mutex> lock(mutex);
                sent.push_back(json::parse(data));
            }
            cv.notify_all();
        };
    }

    json wait_for(size_t count)
    {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait_for(lock, std::chrono::seconds(5), [&] { return sent.size() >= count; });
        return sent.size() >= count ? sent[count - 1] : json();
    }
};

json success(const std::string& id, const json& payload)
{
    return {{"type", "control_response"},
            {"response", {{"subtype", "success"}, {"request_id", id}, {"response", payload}}}};
}

} // namespace

TEST(ControlProtocolUnitTest, GenerateRequestId)
{
    ControlProtocol protocol;

    auto id1 = protocol.generate_request_id();
    auto id2 = protocol.generate_request_id();

    EXPECT_NE(id1, id2);
    EXPECT_EQ(id1.substr(0, 4), "req_");

    // req_N_XXXXXXXX
    auto last = id1.rfind('_');
    ASSERT_NE(last, std::string::npos);
    EXPECT_EQ(id1.size() - last - 1, 8u);
}

TEST(ControlProtocolUnitTest, RequestIdsUniqueAcrossThreads)
{
    ControlProtocol protocol;
    std::mutex mutex;
    std::set<std::string> ids;

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t)
    {
        threads.emplace_back(
            [&]
            {
                for (int i = 0; i < 100; ++i)
                {
                    auto id = protocol.generate_request_id();
                    std::lock_guard<std::mutex> lock(mutex);
                    ids.insert(id);
                }
            });
    }
    for (auto& t : threads)
        t.join();

    EXPECT_EQ(ids.size(), 800u);
}

TEST(ControlProtocolUnitTest, RequestCarriesSubtypeAndData)
{
    ControlProtocol protocol;
    std::string line;
    WriteFunction capture = [&](const std::string& data) { line = data; };

    EXPECT_THROW(protocol.send_request(capture, "set_permission_mode", {{"mode", "acceptEdits"}},
                                       std::chrono::milliseconds(10)),
                 TimeoutError);

    ASSERT_FALSE(line.empty());
    EXPECT_EQ(line.back(), '\n');
    auto parsed = json::parse(line);
    EXPECT_EQ(parsed["type"], "control_request");
    EXPECT_TRUE(parsed["request_id"].is_string());
    EXPECT_EQ(parsed["request"]["subtype"], "set_permission_mode");
    EXPECT_EQ(parsed["request"]["mode"], "acceptEdits");
}

TEST(ControlProtocolUnitTest, HandleSuccessResponse)
{
    ControlProtocol protocol;
    CapturingWriter writer;

    auto result = std::async(std::launch::async,
                             [&] { return protocol.send_request(writer.function(), "interrupt", {}); });

    json sent = writer.wait_for(1);
    ASSERT_TRUE(sent.is_object());
    EXPECT_EQ(sent["request"]["subtype"], "interrupt");

    std::string id = sent["request_id"].get<std::string>();
    EXPECT_TRUE(protocol.handle_response(success(id, {{"ok", true}})));
    EXPECT_EQ(result.get()["ok"], true);
    EXPECT_EQ(protocol.pending_count(), 0u);
}

TEST(ControlProtocolUnitTest, HandleErrorResponse)
{
    ControlProtocol protocol;
    CapturingWriter writer;

    auto result = std::async(std::launch::async,
                             [&] { return protocol.send_request(writer.function(), "set_model", {}); });

    json sent = writer.wait_for(1);
    json error = {{"type", "control_response"},
                  {"response",
                   {{"subtype", "error"},
                    {"request_id", sent["request_id"].get<std::string>()},
                    {"error", "model not available"}}}};
    EXPECT_TRUE(protocol.handle_response(error));

    try
    {
        result.get();
        FAIL() << "Expected ProtocolError";
    }
    catch (const ProtocolError& e)
    {
        EXPECT_STREQ(e.what(), "model not available");
    }
}

TEST(ControlProtocolUnitTest, UnknownResponseIsIgnored)
{
    ControlProtocol protocol;
    EXPECT_FALSE(protocol.handle_response(success("req_999_deadbeef", {})));
    EXPECT_FALSE(protocol.handle_response({{"type", "control_response"}, {"response", json::object()}}));
}

TEST(ControlProtocolUnitTest, ConcurrentRequestsResolveOnlyTheirOwn)
{
    ControlProtocol protocol;
    CapturingWriter writer;
    constexpr int kRequests = 16;

    std::vector<std::future<json>> results;
    for (int i = 0; i < kRequests; ++i)
    {
        results.push_back(std::async(std::launch::async,
                                     [&, i]
                                     {
                                         return protocol.send_request(writer.function(), "probe",
                                                                      {{"index", i}});
                                     }));
    }

    writer.wait_for(kRequests);
    std::vector<json> sent;
    {
        std::lock_guard<std::mutex> lock(writer.mutex);
        sent = writer.sent;
    }
    ASSERT_EQ(sent.size(), static_cast<size_t>(kRequests));

    // Answer in reverse order, echoing the index each request carried
    for (auto it = sent.rbegin(); it != sent.rend(); ++it)
        protocol.handle_response(
            success((*it)["request_id"].get<std::string>(), {{"echo", (*it)["request"]["index"]}}));

    for (int i = 0; i < kRequests; ++i)
        EXPECT_EQ(results[i].get()["echo"], i);
}

TEST(ControlProtocolUnitTest, TimeoutThenLateResponseIsNoOp)
{
    ControlProtocol protocol;
    CapturingWriter writer;

    auto start = std::chrono::steady_clock::now();
    try
    {
        protocol.send_request(writer.function(), "slow", {}, std::chrono::milliseconds(50));
        FAIL() << "Expected TimeoutError";
    }
    catch (const TimeoutError& e)
    {
        EXPECT_EQ(e.operation(), "slow");
        EXPECT_EQ(e.timeout(), std::chrono::milliseconds(50));
    }
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(50));

    std::string id = writer.wait_for(1)["request_id"].get<std::string>();
    EXPECT_FALSE(protocol.is_pending(id));
    EXPECT_FALSE(protocol.handle_response(success(id, {})));
}

TEST(ControlProtocolUnitTest, WriteFailureClearsPendingEntry)
{
    ControlProtocol protocol;
    auto failing = [](const std::string&) { throw WriteError("pipe closed"); };

    EXPECT_THROW(protocol.send_request(failing, "interrupt", {}), WriteError);
    EXPECT_EQ(protocol.pending_count(), 0u);
}

TEST(ControlProtocolUnitTest, FailAllPendingRejectsWaitersAndNewRequests)
{
    ControlProtocol protocol;
    CapturingWriter writer;

    auto result = std::async(std::launch::async,
                             [&] { return protocol.send_request(writer.function(), "interrupt", {}); });
    writer.wait_for(1);

    protocol.fail_all_pending("end of stream");
    try
    {
        result.get();
        FAIL() << "Expected ConnectionError";
    }
    catch (const ConnectionError& e)
    {
        EXPECT_NE(std::string(e.what()).find("end of stream"), std::string::npos);
    }

    EXPECT_THROW(protocol.send_request(writer.function(), "interrupt", {}), ConnectionError);
}

TEST(ControlResponseTest, ParsesFlatForm)
{
    json flat = {{"type", "control_response"},
                 {"request_id", "req_1_00000000"},
                 {"subtype", "success"},
                 {"response", {{"value", 7}}}};
    auto resp = ControlResponse::from_json(flat);
    EXPECT_EQ(resp.request_id, "req_1_00000000");
    EXPECT_FALSE(resp.is_error());
    EXPECT_EQ(resp.response["value"], 7);
}

TEST(ControlResponseTest, ErrorFieldForcesErrorSubtype)
{
    json msg = {{"type", "control_response"},
                {"response", {{"request_id", "r"}, {"error", "bad"}}}};
    auto resp = ControlResponse::from_json(msg);
    EXPECT_TRUE(resp.is_error());
    EXPECT_EQ(resp.subtype, "error");
    EXPECT_EQ(resp.error, "bad");
}

TEST(ControlResponseTest, SerializesNestedEnvelope)
{
    auto ok = ControlResponse::success("abc", {{"behavior", "allow"}}).to_json();
    EXPECT_EQ(ok["type"], "control_response");
    EXPECT_EQ(ok["response"]["subtype"], "success");
    EXPECT_EQ(ok["response"]["request_id"], "abc");
    EXPECT_EQ(ok["response"]["response"]["behavior"], "allow");

    auto err = ControlResponse::failure("abc", "nope").to_json();
    EXPECT_EQ(err["response"]["subtype"], "error");
    EXPECT_EQ(err["response"]["error"], "nope");
    EXPECT_FALSE(err["response"].contains("response"));
}

TEST(ControlRequestTest, FromJsonRequiresIdAndBody)
{
    EXPECT_THROW(ControlRequest::from_json({{"type", "control_request"}}), ProtocolError);
    EXPECT_THROW(ControlRequest::from_json({{"request_id", "x"}}), ProtocolError);

    auto req = ControlRequest::from_json(
        {{"type", "control_request"}, {"request_id", "x"}, {"request", {{"subtype", "can_use_tool"}}}});
    EXPECT_EQ(req.request_id, "x");
    EXPECT_EQ(req.subtype(), "can_use_tool");
}

TEST(ControlResponseTest, NonStringFieldsAreProtocolErrors)
{
    ControlProtocol protocol;
    json numeric_id = {{"type", "control_response"},
                       {"response", {{"request_id", 7}, {"subtype", "success"}}}};
    EXPECT_THROW(protocol.handle_response(numeric_id), ProtocolError);

    json numeric_subtype = {{"type", "control_response"},
                            {"response", {{"request_id", "req_1"}, {"subtype", 1}}}};
    EXPECT_THROW(ControlResponse::from_json(numeric_subtype), ProtocolError);
}
