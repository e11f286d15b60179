#include "network/transport.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <array>

namespace cloudsim {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Transport::Transport(const std::string& node_id, const NodeAddress& address,
                     const TransportConfig& config)
  : node_id_(node_id)
  , address_(address)
  , config_(config)
  , codec_(config.max_frame_size) {
  BOOST_LOG_TRIVIAL(info) << "Transport: Initializing transport for node " << node_id_
                          << " on " << address_.to_string();
}

Transport::~Transport() {
  shutdown();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool Transport::start_listener() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "Transport: Listener already running for node " << node_id_;
    return false;
  }

  try {
    io_context_.restart();

    boost::asio::ip::tcp::endpoint endpoint(
      boost::asio::ip::make_address(address_.host),
      address_.port
    );

    BOOST_LOG_TRIVIAL(debug) << "Transport: Binding acceptor to " << address_.to_string();
    acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(io_context_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Transport: Failed to bind " << address_.to_string()
                             << " for node " << node_id_ << ": " << e.what();
    acceptor_.reset();
    return false;
  }

  handler_pool_ = std::make_unique<boost::asio::thread_pool>(std::max<std::size_t>(1, config_.handler_threads));
  is_running_ = true;

  start_accept();

  io_thread_ = std::make_unique<std::thread>([this]() {
    try {
      auto work = boost::asio::make_work_guard(io_context_);
      io_context_.run();
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Transport: IO context error: " << e.what();
    }
  });

  ack_thread_ = std::make_unique<std::thread>(&Transport::ack_expiry_loop, this);

  BOOST_LOG_TRIVIAL(info) << "Transport: Node " << node_id_ << " listening on " << address_.to_string();
  return true;
}

void Transport::shutdown() {
  {
    std::unique_lock<std::mutex> lock(lifecycle_mutex_);
    if (!is_running_) {
      return;
    }
    BOOST_LOG_TRIVIAL(info) << "Transport: Initiating shutdown for node " << node_id_;
    is_running_ = false;
    lifecycle_cv_.notify_all();

    // Outbound sends still need the io thread to complete
    lifecycle_cv_.wait(lock, [this]() { return active_sends_ == 0; });
  }

  if (ack_thread_ && ack_thread_->joinable()) {
    ack_thread_->join();
  }
  ack_thread_.reset();

  // Close the acceptor on the io thread so the pending accept is aborted there
  auto closed = std::make_shared<std::promise<void>>();
  boost::asio::post(io_context_, [this, closed]() {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Transport: Error closing acceptor: " << ec.message();
    }
    closed->set_value();
  });
  closed->get_future().wait_for(std::chrono::seconds(1));

  // In-flight connection handlers finish before the io context goes away
  if (handler_pool_) {
    handler_pool_->join();
  }

  io_context_.stop();
  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
  }
  io_thread_.reset();
  handler_pool_.reset();
  acceptor_.reset();

  BOOST_LOG_TRIVIAL(info) << "Transport: Shutdown complete for node " << node_id_;
}


//==============================================
// INCOMING CONNECTIONS
//==============================================

void Transport::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  auto socket = std::make_shared<Socket>(io_context_);

  acceptor_->async_accept(*socket,
    [this, socket](const boost::system::error_code& error) {
      if (!error) {
        BOOST_LOG_TRIVIAL(trace) << "Transport: Accepted connection on node " << node_id_;
        boost::asio::post(*handler_pool_, [this, socket]() { handle_connection(socket); });
      } else if (error != boost::asio::error::operation_aborted) {
        BOOST_LOG_TRIVIAL(error) << "Transport: Accept error: " << error.message();
      }

      if (is_running_) {
        start_accept();
      }
    });
}

void Transport::handle_connection(SocketPtr socket) {
  WireMessage message;
  auto deadline = Clock::now() + config_.io_timeout;

  NetworkError result = read_frame(socket, message, deadline);
  if (result != NetworkError::SUCCESS) {
    BOOST_LOG_TRIVIAL(warning) << "Transport: Dropping inbound connection on node " << node_id_
                               << ": " << network_error_to_string(result);
    close_socket(*socket);
    return;
  }

  BOOST_LOG_TRIVIAL(debug) << "Transport: Node " << node_id_ << " received "
                           << to_string(message.message_type) << " from " << message.source_ip;
  process_message(message, socket.get());
  close_socket(*socket);
}

void Transport::process_message(const WireMessage& message, Socket* reply_socket) {
  switch (message.message_type) {
    case MessageType::HEARTBEAT:
      if (reply_socket) {
        reply_inline(*reply_socket, MessageType::HEARTBEAT_ACK, message,
                     {{"node_id", node_id_}, {"status", "alive"}});
      }
      break;

    case MessageType::DATA_TRANSFER:
      dispatch(message);
      if (message.requires_ack && reply_socket) {
        reply_inline(*reply_socket, MessageType::DATA_ACK, message,
                     {{"original_message_id", message.message_id}});
      }
      break;

    case MessageType::DATA_ACK:
      handle_ack(message);
      break;

    default:
      dispatch(message);
      break;
  }
}

void Transport::dispatch(const WireMessage& message) {
  MessageHandler handler;
  {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    auto it = handlers_.find(message.message_type);
    if (it != handlers_.end()) {
      handler = it->second;
    }
  }

  if (!handler) {
    BOOST_LOG_TRIVIAL(warning) << "Transport: Node " << node_id_ << " has no handler for message type: "
                               << to_string(message.message_type);
    return;
  }

  try {
    handler(message);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Transport: Handler for " << to_string(message.message_type)
                             << " failed on node " << node_id_ << ": " << e.what();
  }
}

void Transport::reply_inline(Socket& socket, MessageType type, const WireMessage& request,
                             nlohmann::json payload) {
  WireMessage reply = create_message(type, request.source_ip, std::move(payload));

  std::string frame;
  try {
    frame = codec_.encode(reply);
  } catch (const CodecError& e) {
    BOOST_LOG_TRIVIAL(error) << "Transport: Failed to encode inline reply: " << e.what();
    return;
  }

  // The sender may already have closed its end; a failed reply is not an error
  boost::system::error_code ec;
  boost::asio::write(socket, boost::asio::buffer(frame), ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(debug) << "Transport: Inline " << to_string(type) << " not delivered: " << ec.message();
    return;
  }
  BOOST_LOG_TRIVIAL(trace) << "Transport: Sent inline " << to_string(type) << " to " << request.source_ip;
}


//==============================================
// OUTGOING MESSAGES
//==============================================

WireMessage Transport::create_message(MessageType type, const std::string& target_ip,
                                      nlohmann::json payload, bool requires_ack) const {
  WireMessage message;
  message.message_id = generate_message_id(node_id_);
  message.message_type = type;
  message.source_ip = address_.host;
  message.target_ip = target_ip;
  message.payload = std::move(payload);
  message.timestamp = unix_time_now();
  message.requires_ack = requires_ack;
  return message;
}

NetworkError Transport::send(const NodeAddress& target, const WireMessage& message) {
  return send(target, message, config_.io_timeout);
}

NetworkError Transport::send(const NodeAddress& target, const WireMessage& message,
                             std::chrono::milliseconds timeout) {
  ActiveSend active(*this);
  if (!active.is_active()) {
    BOOST_LOG_TRIVIAL(error) << "Transport: Cannot send " << to_string(message.message_type)
                             << " from node " << node_id_ << " - transport not running";
    return NetworkError::NOT_RUNNING;
  }

  try {
    return deliver(target, message, std::min(timeout, config_.io_timeout));
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Transport: Unexpected failure sending " << message.message_id
                             << " to " << target.to_string() << ": " << e.what();
    remove_pending_ack(message.message_id);
    return NetworkError::UNKNOWN_ERROR;
  }
}

bool Transport::begin_send() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (!is_running_) {
    return false;
  }
  ++active_sends_;
  return true;
}

void Transport::end_send() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  --active_sends_;
  lifecycle_cv_.notify_all();
}

NetworkError Transport::deliver(const NodeAddress& target, const WireMessage& message,
                                std::chrono::milliseconds timeout) {
  std::string frame;
  try {
    frame = codec_.encode(message);
  } catch (const CodecError& e) {
    BOOST_LOG_TRIVIAL(error) << "Transport: Cannot encode message " << message.message_id << ": " << e.what();
    return NetworkError::INVALID_MESSAGE;
  }

  auto deadline = Clock::now() + timeout;

  // Recorded before the write so an inline ack always finds its entry
  if (message.requires_ack) {
    record_pending_ack(message);
  }

  BOOST_LOG_TRIVIAL(debug) << "Transport: Node " << node_id_ << " sending " << to_string(message.message_type)
                           << " (" << frame.size() << " bytes) to " << target.to_string();

  auto socket = std::make_shared<Socket>(io_context_);
  NetworkError result = connect_socket(socket, target, deadline);
  if (result == NetworkError::SUCCESS) {
    result = write_frame(socket, frame, deadline);
  }

  if (result != NetworkError::SUCCESS) {
    BOOST_LOG_TRIVIAL(error) << "Transport: Error sending message to " << target.to_string()
                             << " - " << network_error_to_string(result);
    if (message.requires_ack) {
      remove_pending_ack(message.message_id);
    }
    close_socket(*socket);
    return result;
  }

  if (expects_inline_reply(message)) {
    WireMessage reply;
    auto reply_deadline = std::min(deadline, Clock::now() + config_.reply_timeout);
    if (read_frame(socket, reply, reply_deadline) == NetworkError::SUCCESS) {
      process_message(reply, nullptr);
    } else {
      BOOST_LOG_TRIVIAL(debug) << "Transport: No inline reply from " << target.to_string()
                               << " for " << to_string(message.message_type);
    }
  }

  close_socket(*socket);
  return NetworkError::SUCCESS;
}

bool Transport::expects_inline_reply(const WireMessage& message) {
  return message.message_type == MessageType::HEARTBEAT ||
         (message.message_type == MessageType::DATA_TRANSFER && message.requires_ack);
}


//==============================================
// SOCKET OPERATIONS WITH DEADLINES
//==============================================

template <typename T>
bool Transport::await(std::future<T>& operation, const SocketPtr& socket, Clock::time_point deadline) {
  if (operation.wait_until(deadline) == std::future_status::ready) {
    return true;
  }

  // Closing on the io thread aborts the pending operation
  boost::asio::post(io_context_, [socket]() { close_socket(*socket); });
  operation.wait();
  return false;
}

NetworkError Transport::connect_socket(const SocketPtr& socket, const NodeAddress& target,
                                       Clock::time_point deadline) {
  try {
    boost::asio::ip::tcp::resolver resolver(io_context_);
    auto endpoints = resolver.resolve(target.host, std::to_string(target.port));

    auto connected = boost::asio::async_connect(*socket, endpoints, boost::asio::use_future);
    if (!await(connected, socket, deadline)) {
      BOOST_LOG_TRIVIAL(warning) << "Transport: Connect to " << target.to_string() << " timed out";
      return NetworkError::TIMEOUT;
    }
    connected.get();
    return NetworkError::SUCCESS;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(debug) << "Transport: Connection to " << target.to_string() << " failed: " << e.what();
    return NetworkError::CONNECTION_FAILED;
  }
}

NetworkError Transport::write_frame(const SocketPtr& socket, const std::string& frame,
                                    Clock::time_point deadline) {
  try {
    auto written = boost::asio::async_write(*socket, boost::asio::buffer(frame), boost::asio::use_future);
    if (!await(written, socket, deadline)) {
      return NetworkError::TIMEOUT;
    }
    if (written.get() != frame.size()) {
      return NetworkError::CONNECTION_LOST;
    }
    return NetworkError::SUCCESS;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(debug) << "Transport: Write failed: " << e.what();
    return NetworkError::CONNECTION_LOST;
  }
}

NetworkError Transport::read_frame(const SocketPtr& socket, WireMessage& message,
                                   Clock::time_point deadline) {
  try {
    std::array<uint8_t, Codec::HEADER_SIZE> header{};
    auto header_read = boost::asio::async_read(*socket, boost::asio::buffer(header), boost::asio::use_future);
    if (!await(header_read, socket, deadline)) {
      return NetworkError::TIMEOUT;
    }
    header_read.get();

    std::string body(codec_.decode_header(header), '\0');
    auto body_read = boost::asio::async_read(*socket, boost::asio::buffer(&body[0], body.size()),
                                             boost::asio::use_future);
    if (!await(body_read, socket, deadline)) {
      return NetworkError::TIMEOUT;
    }
    body_read.get();

    message = codec_.decode_body(body);
    return NetworkError::SUCCESS;
  } catch (const CodecError& e) {
    BOOST_LOG_TRIVIAL(error) << "Transport: Invalid frame on node " << node_id_ << ": " << e.what();
    return NetworkError::INVALID_MESSAGE;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(debug) << "Transport: Read failed: " << e.what();
    return NetworkError::CONNECTION_LOST;
  }
}

void Transport::close_socket(Socket& socket) {
  if (!socket.is_open()) {
    return;
  }
  boost::system::error_code ec;
  socket.shutdown(Socket::shutdown_both, ec);
  socket.close(ec);
}


//==============================================
// HANDLER REGISTRATION
//==============================================

void Transport::register_handler(MessageType type, MessageHandler handler) {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  if (handlers_.count(type) > 0) {
    BOOST_LOG_TRIVIAL(warning) << "Transport: Replacing handler for " << to_string(type)
                               << " on node " << node_id_;
  }
  handlers_[type] = std::move(handler);
  BOOST_LOG_TRIVIAL(debug) << "Transport: Registered handler for " << to_string(type) << " on node " << node_id_;
}

void Transport::unregister_handler(MessageType type) {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  handlers_.erase(type);
}

bool Transport::has_handler(MessageType type) const {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  return handlers_.count(type) > 0;
}


//==============================================
// ACKNOWLEDGMENT TRACKING
//==============================================

void Transport::record_pending_ack(const WireMessage& message) {
  std::lock_guard<std::mutex> lock(acks_mutex_);
  pending_acks_[message.message_id] = PendingAck{message, Clock::now()};
}

void Transport::remove_pending_ack(const std::string& message_id) {
  std::lock_guard<std::mutex> lock(acks_mutex_);
  pending_acks_.erase(message_id);
}

void Transport::handle_ack(const WireMessage& ack) {
  std::string original_id = ack.payload.value("original_message_id", std::string());

  std::lock_guard<std::mutex> lock(acks_mutex_);
  if (pending_acks_.erase(original_id) > 0) {
    BOOST_LOG_TRIVIAL(debug) << "Transport: Node " << node_id_ << " received ACK for message " << original_id;
  } else {
    BOOST_LOG_TRIVIAL(warning) << "Transport: Dropping unmatched ACK for message " << original_id;
  }
}

std::size_t Transport::pending_ack_count() const {
  std::lock_guard<std::mutex> lock(acks_mutex_);
  return pending_acks_.size();
}

bool Transport::has_pending_ack(const std::string& message_id) const {
  std::lock_guard<std::mutex> lock(acks_mutex_);
  return pending_acks_.count(message_id) > 0;
}

void Transport::ack_expiry_loop() {
  BOOST_LOG_TRIVIAL(debug) << "Transport: ACK expiry loop started for node " << node_id_;

  std::unique_lock<std::mutex> lock(lifecycle_mutex_);
  while (is_running_) {
    lifecycle_cv_.wait_for(lock, config_.ack_sweep_interval, [this]() { return !is_running_; });
    if (!is_running_) {
      break;
    }

    lock.unlock();
    expire_pending_acks();
    lock.lock();
  }

  BOOST_LOG_TRIVIAL(debug) << "Transport: ACK expiry loop stopped for node " << node_id_;
}

std::size_t Transport::expire_pending_acks() {
  auto now = Clock::now();
  std::size_t expired = 0;

  std::lock_guard<std::mutex> lock(acks_mutex_);
  for (auto it = pending_acks_.begin(); it != pending_acks_.end();) {
    if (now - it->second.sent_at > config_.ack_timeout) {
      BOOST_LOG_TRIVIAL(warning) << "Transport: ACK timeout for message " << it->first
                                 << " (" << to_string(it->second.message.message_type) << ")";
      it = pending_acks_.erase(it);
      ++expired;
    } else {
      ++it;
    }
  }
  return expired;
}

} // namespace network
} // namespace cloudsim
