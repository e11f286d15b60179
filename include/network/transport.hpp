#ifndef CLOUDSIM_NETWORK_TRANSPORT_HPP
#define CLOUDSIM_NETWORK_TRANSPORT_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <boost/asio.hpp>
#include "network/codec.hpp"
#include "network/message.hpp"
#include "network/network_error.hpp"

namespace cloudsim {
namespace network {

struct TransportConfig {
  // Age after which an unacknowledged message is dropped from tracking
  std::chrono::milliseconds ack_timeout{5000};
  std::chrono::milliseconds ack_sweep_interval{1000};
  // Upper bound for connect + write (+ inline reply) of one send
  std::chrono::milliseconds io_timeout{10000};
  std::chrono::milliseconds reply_timeout{2000};
  std::size_t handler_threads{4};
  std::size_t max_frame_size{Codec::DEFAULT_MAX_FRAME_SIZE};
};

using MessageHandler = std::function<void(const WireMessage&)>;

// Per-node TCP endpoint. Every send opens its own connection and carries exactly
// one frame; the receiver may answer heartbeats and acknowledged data transfers
// with one inline frame on the same connection.
class Transport {
public:
  Transport(const Transport&) = delete;
  Transport& operator=(const Transport&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Transport(const std::string& node_id, const NodeAddress& address,
            const TransportConfig& config = TransportConfig());
  ~Transport();


  // ---- INITIALIZATION AND TEARDOWN ----
  // Binds the listener and starts the accept and ack-expiry loops.
  // Returns false if already running or the address cannot be bound.
  bool start_listener();
  // Stops accepting, waits for in-flight sends and handlers, then stops all threads
  void shutdown();
  bool is_running() const { return is_running_; }


  // ---- OUTGOING MESSAGES ----
  // Builds a message originating from this node with a fresh message id
  WireMessage create_message(MessageType type, const std::string& target_ip,
                             nlohmann::json payload, bool requires_ack = false) const;
  // Opens a connection, writes the message and closes. Never retries.
  NetworkError send(const NodeAddress& target, const WireMessage& message);
  NetworkError send(const NodeAddress& target, const WireMessage& message,
                    std::chrono::milliseconds timeout);


  // ---- HANDLER REGISTRATION ----
  // At most one handler per message type, a later registration replaces the earlier one
  void register_handler(MessageType type, MessageHandler handler);
  void unregister_handler(MessageType type);
  bool has_handler(MessageType type) const;


  // ---- ACKNOWLEDGMENT TRACKING ----
  std::size_t pending_ack_count() const;
  bool has_pending_ack(const std::string& message_id) const;


  // ---- GETTERS ----
  const std::string& get_node_id() const { return node_id_; }
  const NodeAddress& get_address() const { return address_; }
  const TransportConfig& get_config() const { return config_; }

private:
  using Socket = boost::asio::ip::tcp::socket;
  using SocketPtr = std::shared_ptr<Socket>;
  using Clock = std::chrono::steady_clock;

  struct PendingAck {
    WireMessage message;
    Clock::time_point sent_at;
  };

  // ---- PARAMETERS ----
  const std::string node_id_;
  const NodeAddress address_;
  const TransportConfig config_;
  const Codec codec_;

  // Server state
  std::atomic<bool> is_running_{false};
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  std::unique_ptr<std::thread> io_thread_;
  std::unique_ptr<boost::asio::thread_pool> handler_pool_;
  std::unique_ptr<std::thread> ack_thread_;

  // Guards is_running_ transitions and the in-flight send count
  std::mutex lifecycle_mutex_;
  std::condition_variable lifecycle_cv_;
  std::size_t active_sends_{0};

  std::map<MessageType, MessageHandler> handlers_;
  mutable std::mutex handlers_mutex_;

  std::map<std::string, PendingAck> pending_acks_;
  mutable std::mutex acks_mutex_;


  // ---- INCOMING CONNECTIONS ----
  // Main listening loop that hands every accepted connection to the handler pool
  void start_accept();
  // Reads one frame from an accepted connection and processes it
  void handle_connection(SocketPtr socket);
  // Routes a decoded message; reply_socket is null when there is no one to answer
  void process_message(const WireMessage& message, Socket* reply_socket);
  // Invokes the registered handler for the message type, if any
  void dispatch(const WireMessage& message);
  // Writes one reply frame on the inbound connection
  void reply_inline(Socket& socket, MessageType type, const WireMessage& request,
                    nlohmann::json payload);


  // ---- OUTGOING CONNECTIONS ----
  // Counts one in-flight send for the lifetime of the guard, shutdown waits for it
  class ActiveSend {
  public:
    explicit ActiveSend(Transport& transport) : transport_(transport), active_(transport.begin_send()) {}
    ~ActiveSend() {
      if (active_) {
        transport_.end_send();
      }
    }
    ActiveSend(const ActiveSend&) = delete;
    ActiveSend& operator=(const ActiveSend&) = delete;
    bool is_active() const { return active_; }

  private:
    Transport& transport_;
    const bool active_;
  };

  bool begin_send();
  void end_send();
  NetworkError deliver(const NodeAddress& target, const WireMessage& message,
                       std::chrono::milliseconds timeout);
  static bool expects_inline_reply(const WireMessage& message);


  // ---- SOCKET OPERATIONS WITH DEADLINES ----
  NetworkError connect_socket(const SocketPtr& socket, const NodeAddress& target,
                              Clock::time_point deadline);
  NetworkError write_frame(const SocketPtr& socket, const std::string& frame,
                           Clock::time_point deadline);
  NetworkError read_frame(const SocketPtr& socket, WireMessage& message,
                          Clock::time_point deadline);
  // Waits for an asynchronous operation, closing the socket if the deadline passes
  template <typename T>
  bool await(std::future<T>& operation, const SocketPtr& socket, Clock::time_point deadline);
  static void close_socket(Socket& socket);


  // ---- ACKNOWLEDGMENT TRACKING ----
  void record_pending_ack(const WireMessage& message);
  void remove_pending_ack(const std::string& message_id);
  void handle_ack(const WireMessage& ack);
  // Background sweep that drops expired entries without retransmitting
  void ack_expiry_loop();
  std::size_t expire_pending_acks();
};

} // namespace network
} // namespace cloudsim

#endif // CLOUDSIM_NETWORK_TRANSPORT_HPP
