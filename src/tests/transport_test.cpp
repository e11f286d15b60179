#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <vector>
#include "network/transport.hpp"
#include "test_utils.hpp"

using namespace cloudsim::network;

class TransportTest : public ::testing::Test {
protected:
  static constexpr uint16_t BASE_PORT = 19100;

  std::unique_ptr<Transport> sender;
  std::unique_ptr<Transport> receiver;

  void SetUp() override {
    sender = std::make_unique<Transport>("sender", NodeAddress{"127.0.0.1", BASE_PORT});
    receiver = std::make_unique<Transport>("receiver", NodeAddress{"127.0.0.1", BASE_PORT + 1});
  }

  void TearDown() override {
    if (sender) {
      sender->shutdown();
    }
    if (receiver) {
      receiver->shutdown();
    }
  }

  void start_both() {
    ASSERT_TRUE(sender->start_listener());
    ASSERT_TRUE(receiver->start_listener());
  }
};

TEST_F(TransportTest, StartShutdownAndRestart) {
  ASSERT_TRUE(receiver->start_listener());
  EXPECT_TRUE(receiver->is_running());
  EXPECT_FALSE(receiver->start_listener());

  receiver->shutdown();
  EXPECT_FALSE(receiver->is_running());
  receiver->shutdown();

  ASSERT_TRUE(receiver->start_listener());
  EXPECT_TRUE(receiver->is_running());
}

TEST_F(TransportTest, BindConflictFailsToStart) {
  ASSERT_TRUE(receiver->start_listener());

  Transport intruder("intruder", receiver->get_address());
  EXPECT_FALSE(intruder.start_listener());
  EXPECT_FALSE(intruder.is_running());
}

TEST_F(TransportTest, SendRequiresRunningTransport) {
  ASSERT_TRUE(receiver->start_listener());
  auto message = sender->create_message(MessageType::DISCOVERY, "127.0.0.1", {{"port", BASE_PORT}});
  EXPECT_EQ(sender->send(receiver->get_address(), message), NetworkError::NOT_RUNNING);
}

TEST_F(TransportTest, CreateMessageFillsEnvelope) {
  auto first = sender->create_message(MessageType::RPC_REQUEST, "10.0.0.2", {{"k", 1}}, true);
  auto second = sender->create_message(MessageType::RPC_REQUEST, "10.0.0.2", {{"k", 1}}, true);

  EXPECT_EQ(first.message_type, MessageType::RPC_REQUEST);
  EXPECT_EQ(first.source_ip, "127.0.0.1");
  EXPECT_EQ(first.target_ip, "10.0.0.2");
  EXPECT_EQ(first.payload["k"], 1);
  EXPECT_TRUE(first.requires_ack);
  EXPECT_GT(first.timestamp, 0.0);
  EXPECT_NE(first.message_id, second.message_id);
}

TEST_F(TransportTest, DispatchesToRegisteredHandler) {
  start_both();

  std::mutex mutex;
  std::vector<WireMessage> received;
  receiver->register_handler(MessageType::RPC_REQUEST, [&](const WireMessage& message) {
    std::lock_guard<std::mutex> lock(mutex);
    received.push_back(message);
  });
  EXPECT_TRUE(receiver->has_handler(MessageType::RPC_REQUEST));

  auto message = sender->create_message(MessageType::RPC_REQUEST, "127.0.0.1", {{"method_name", "ping"}});
  ASSERT_EQ(sender->send(receiver->get_address(), message), NetworkError::SUCCESS);

  ASSERT_TRUE(wait_until([&]() {
    std::lock_guard<std::mutex> lock(mutex);
    return received.size() == 1;
  }));

  std::lock_guard<std::mutex> lock(mutex);
  EXPECT_EQ(received[0].message_id, message.message_id);
  EXPECT_EQ(received[0].payload["method_name"], "ping");
}

TEST_F(TransportTest, AcknowledgedDataTransferClearsPendingAck) {
  start_both();

  std::atomic<int> delivered{0};
  receiver->register_handler(MessageType::DATA_TRANSFER, [&](const WireMessage&) { ++delivered; });

  auto message = sender->create_message(MessageType::DATA_TRANSFER, "127.0.0.1", {{"data", "abc"}}, true);
  ASSERT_EQ(sender->send(receiver->get_address(), message), NetworkError::SUCCESS);

  // The data-ack is read on the same connection before send returns
  EXPECT_EQ(delivered.load(), 1);
  EXPECT_FALSE(sender->has_pending_ack(message.message_id));
  EXPECT_EQ(sender->pending_ack_count(), 0u);
}

TEST_F(TransportTest, HeartbeatIsAnsweredInline) {
  start_both();

  std::mutex mutex;
  nlohmann::json ack_payload;
  sender->register_handler(MessageType::HEARTBEAT_ACK, [&](const WireMessage& message) {
    std::lock_guard<std::mutex> lock(mutex);
    ack_payload = message.payload;
  });

  auto heartbeat = sender->create_message(MessageType::HEARTBEAT, "127.0.0.1", {{"node_id", "sender"}});
  ASSERT_EQ(sender->send(receiver->get_address(), heartbeat), NetworkError::SUCCESS);

  std::lock_guard<std::mutex> lock(mutex);
  EXPECT_EQ(ack_payload["node_id"], "receiver");
  EXPECT_EQ(ack_payload["status"], "alive");
}

TEST_F(TransportTest, UnacknowledgedEntriesExpire) {
  TransportConfig config;
  config.ack_timeout = std::chrono::milliseconds(200);
  config.ack_sweep_interval = std::chrono::milliseconds(50);
  sender = std::make_unique<Transport>("sender", NodeAddress{"127.0.0.1", BASE_PORT}, config);
  start_both();

  // rpc_request is never acknowledged inline
  auto message = sender->create_message(MessageType::RPC_REQUEST, "127.0.0.1", nlohmann::json::object(), true);
  ASSERT_EQ(sender->send(receiver->get_address(), message), NetworkError::SUCCESS);
  EXPECT_TRUE(sender->has_pending_ack(message.message_id));

  EXPECT_TRUE(wait_until([&]() { return sender->pending_ack_count() == 0; }));
}

TEST_F(TransportTest, RefusedConnectionIsReportedNotThrown) {
  ASSERT_TRUE(sender->start_listener());

  auto message = sender->create_message(MessageType::DATA_TRANSFER, "127.0.0.1", {{"data", "x"}}, true);
  NetworkError result = NetworkError::SUCCESS;
  EXPECT_NO_THROW(result = sender->send(NodeAddress{"127.0.0.1", BASE_PORT + 9}, message));
  EXPECT_EQ(result, NetworkError::CONNECTION_FAILED);
  EXPECT_EQ(sender->pending_ack_count(), 0u);
}

TEST_F(TransportTest, SurvivesUnhandledTypesAndThrowingHandlers) {
  start_both();

  std::atomic<int> calls{0};
  receiver->register_handler(MessageType::RPC_RESPONSE, [&](const WireMessage&) {
    ++calls;
    throw std::runtime_error("handler failure");
  });

  auto unhandled = sender->create_message(MessageType::DISCOVERY_ACK, "127.0.0.1", {{"node_id", "sender"}});
  EXPECT_EQ(sender->send(receiver->get_address(), unhandled), NetworkError::SUCCESS);

  for (int i = 0; i < 2; ++i) {
    auto message = sender->create_message(MessageType::RPC_RESPONSE, "127.0.0.1", {{"call_id", i}});
    EXPECT_EQ(sender->send(receiver->get_address(), message), NetworkError::SUCCESS);
  }

  EXPECT_TRUE(wait_until([&]() { return calls.load() == 2; }));
  EXPECT_TRUE(receiver->is_running());
}

TEST_F(TransportTest, ReplacingAndRemovingHandlers) {
  start_both();

  std::atomic<int> first{0};
  std::atomic<int> second{0};
  receiver->register_handler(MessageType::DISCOVERY, [&](const WireMessage&) { ++first; });
  receiver->register_handler(MessageType::DISCOVERY, [&](const WireMessage&) { ++second; });

  auto message = sender->create_message(MessageType::DISCOVERY, "127.0.0.1", {{"port", BASE_PORT}});
  ASSERT_EQ(sender->send(receiver->get_address(), message), NetworkError::SUCCESS);
  ASSERT_TRUE(wait_until([&]() { return second.load() == 1; }));
  EXPECT_EQ(first.load(), 0);

  receiver->unregister_handler(MessageType::DISCOVERY);
  EXPECT_FALSE(receiver->has_handler(MessageType::DISCOVERY));
}
