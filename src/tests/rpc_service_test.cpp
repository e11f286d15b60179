#include <gtest/gtest.h>
#include <boost/asio.hpp>
#include <atomic>
#include <future>
#include <memory>
#include <thread>
#include <vector>
#include "rpc/rpc_service.hpp"
#include "test_utils.hpp"

using namespace cloudsim::network;
using namespace cloudsim::rpc;

class RpcServiceTest : public ::testing::Test {
protected:
  static constexpr uint16_t BASE_PORT = 19300;

  std::unique_ptr<Transport> caller_transport;
  std::unique_ptr<Transport> callee_transport;
  std::unique_ptr<RpcService> caller;
  std::unique_ptr<RpcService> callee;

  void SetUp() override {
    caller_transport = std::make_unique<Transport>("caller", NodeAddress{"127.0.0.1", BASE_PORT});
    callee_transport = std::make_unique<Transport>("callee", NodeAddress{"127.0.0.1", BASE_PORT + 1});
    caller = std::make_unique<RpcService>("caller", *caller_transport);
    callee = std::make_unique<RpcService>("callee", *callee_transport);

    ASSERT_TRUE(caller_transport->start_listener());
    ASSERT_TRUE(callee_transport->start_listener());

    callee->register_method("ping", [](const nlohmann::json&) {
      return nlohmann::json{{"success", true}, {"node_id", "callee"}, {"uptime", 0.5}};
    });
    callee->register_method("add", [](const nlohmann::json& params) {
      return nlohmann::json(params.at("a").get<int>() + params.at("b").get<int>());
    });
    callee->register_method("echo", [](const nlohmann::json& params) { return params; });
  }

  void TearDown() override {
    caller_transport->shutdown();
    callee_transport->shutdown();
    caller.reset();
    callee.reset();
  }

  const NodeAddress& callee_address() const { return callee_transport->get_address(); }
};

TEST_F(RpcServiceTest, PingReturnsRemoteResult) {
  RpcResult result = caller->call(callee_address(), "ping");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.code, RpcError::SUCCESS);
  EXPECT_EQ(result.result["node_id"], "callee");
  EXPECT_GE(result.result["uptime"].get<double>(), 0.0);
  EXPECT_EQ(caller->pending_call_count(), 0u);
}

TEST_F(RpcServiceTest, ParametersReachTheMethod) {
  RpcResult result = caller->call(callee_address(), "add", {{"a", 20}, {"b", 22}});
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.result, 42);
}

TEST_F(RpcServiceTest, UnknownMethodIsRemoteError) {
  RpcResult result = caller->call(callee_address(), "does_not_exist");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.code, RpcError::REMOTE_ERROR);
  EXPECT_EQ(result.error, "Method does_not_exist not found");
}

TEST_F(RpcServiceTest, ThrowingMethodReportsItsMessage) {
  callee->register_method("explode", [](const nlohmann::json&) -> nlohmann::json {
    throw std::runtime_error("disk on fire");
  });

  RpcResult result = caller->call(callee_address(), "explode");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.code, RpcError::REMOTE_ERROR);
  EXPECT_EQ(result.error, "disk on fire");

  // Missing parameters surface the same way
  RpcResult missing = caller->call(callee_address(), "add", {{"a", 1}});
  EXPECT_FALSE(missing.success);
  EXPECT_EQ(missing.code, RpcError::REMOTE_ERROR);
  EXPECT_FALSE(missing.error.empty());
}

TEST_F(RpcServiceTest, RefusedConnectionFailsImmediately) {
  auto start = std::chrono::steady_clock::now();
  RpcResult result = caller->call(NodeAddress{"127.0.0.1", BASE_PORT + 9}, "ping");

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.code, RpcError::SEND_FAILED);
  EXPECT_EQ(result.error, "Failed to send RPC request");
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
  EXPECT_EQ(caller->pending_call_count(), 0u);
}

TEST_F(RpcServiceTest, SilentPeerTimesOutWithinTheCallTimeout) {
  // Listens so the request can be written, but never reads or answers
  boost::asio::io_context io_context;
  boost::asio::ip::tcp::acceptor silent(io_context,
    boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), BASE_PORT + 5));

  auto start = std::chrono::steady_clock::now();
  RpcResult result = caller->call(NodeAddress{"127.0.0.1", BASE_PORT + 5}, "ping",
                                  nlohmann::json::object(), std::chrono::seconds(1));
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.code, RpcError::TIMEOUT);
  EXPECT_GE(elapsed, std::chrono::milliseconds(900));
  EXPECT_LT(elapsed, std::chrono::milliseconds(2000));
  EXPECT_EQ(caller->pending_call_count(), 0u);
}

TEST_F(RpcServiceTest, UnreachablePeerTimesOutWithinTheCallTimeout) {
  // Accept queue of a listener that never accepts is filled first, so the next
  // connect is never completed by the peer
  boost::asio::io_context io_context;
  boost::asio::ip::tcp::endpoint endpoint(boost::asio::ip::make_address("127.0.0.1"), BASE_PORT + 6);
  boost::asio::ip::tcp::acceptor full(io_context);
  full.open(endpoint.protocol());
  full.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
  full.bind(endpoint);
  full.listen(0);

  std::vector<std::unique_ptr<boost::asio::ip::tcp::socket>> fillers;
  for (int i = 0; i < 4; ++i) {
    auto socket = std::make_unique<boost::asio::ip::tcp::socket>(io_context);
    socket->async_connect(endpoint, [](const boost::system::error_code&) {});
    fillers.push_back(std::move(socket));
  }
  io_context.run_for(std::chrono::milliseconds(300));

  auto start = std::chrono::steady_clock::now();
  RpcResult result = caller->call(NodeAddress{"127.0.0.1", BASE_PORT + 6}, "ping",
                                  nlohmann::json::object(), std::chrono::seconds(1));
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.code, RpcError::TIMEOUT);
  EXPECT_EQ(result.error, "RPC call to 127.0.0.1:" + std::to_string(BASE_PORT + 6) + " timed out");
  EXPECT_LT(elapsed, std::chrono::milliseconds(2000));
  EXPECT_EQ(caller->pending_call_count(), 0u);
}

TEST_F(RpcServiceTest, UnencodableParamsFailWithoutThrowing) {
  RpcResult result;
  EXPECT_NO_THROW(result = caller->call(callee_address(), "echo", {{"s", "\xff\xfe"}},
                                        std::chrono::seconds(1)));
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.code, RpcError::SEND_FAILED);
  EXPECT_EQ(caller->pending_call_count(), 0u);
  EXPECT_EQ(caller_transport->pending_ack_count(), 0u);

  // The transport is still usable and shuts down cleanly afterwards
  RpcResult next = caller->call(callee_address(), "echo", {{"s", "ok"}});
  ASSERT_TRUE(next.success) << next.error;
  EXPECT_EQ(next.result["s"], "ok");

  auto stopped = std::async(std::launch::async, [this]() { caller_transport->shutdown(); });
  EXPECT_EQ(stopped.wait_for(std::chrono::seconds(5)), std::future_status::ready);
}

TEST_F(RpcServiceTest, LateResponseIsDropped) {
  std::atomic<bool> finished{false};
  callee->register_method("slow", [&finished](const nlohmann::json&) {
    std::this_thread::sleep_for(std::chrono::milliseconds(800));
    finished = true;
    return nlohmann::json("late");
  });

  RpcResult result = caller->call(callee_address(), "slow", nlohmann::json::object(),
                                  std::chrono::milliseconds(200));
  EXPECT_EQ(result.code, RpcError::TIMEOUT);
  EXPECT_EQ(caller->pending_call_count(), 0u);

  ASSERT_TRUE(wait_until([&]() { return finished.load(); }));
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  EXPECT_EQ(caller->pending_call_count(), 0u);

  RpcResult next = caller->call(callee_address(), "ping");
  EXPECT_TRUE(next.success) << next.error;
}

TEST_F(RpcServiceTest, ConcurrentCallsGetTheirOwnResults) {
  std::vector<std::thread> threads;
  std::atomic<int> matched{0};

  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([this, i, &matched]() {
      RpcResult result = caller->call(callee_address(), "echo", {{"value", i}});
      if (result.success && result.result["value"] == i) {
        ++matched;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(matched.load(), 8);
  EXPECT_EQ(caller->pending_call_count(), 0u);
}

TEST_F(RpcServiceTest, MethodRegistry) {
  EXPECT_TRUE(callee->has_method("ping"));
  EXPECT_FALSE(caller->has_method("ping"));

  callee->register_method("ping", [](const nlohmann::json&) { return nlohmann::json("pong"); });
  RpcResult result = caller->call(callee_address(), "ping");
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.result, "pong");
}

TEST(RpcErrorTest, NamesEveryCode) {
  EXPECT_STREQ(rpc_error_to_string(RpcError::TIMEOUT), "Timeout");
  EXPECT_STREQ(rpc_error_to_string(RpcError::UNKNOWN_NODE), "Unknown node");
  EXPECT_STREQ(rpc_error_to_string(RpcError::SEND_FAILED), "Send failed");
}
