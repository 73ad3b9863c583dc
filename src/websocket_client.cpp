#include "enginebridge/websocket.hpp"

#include "enginebridge/error.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/ssl.h>

#include <atomic>
#include <exception>
#include <string>
#include <string_view>
#include <thread>

namespace enginebridge {
namespace {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

struct SocketTarget {
  std::string host;
  std::string port;
  std::string path;
};

SocketTarget parse_socket_url(const std::string& url) {
  constexpr std::string_view kScheme = "wss://";
  if (url.compare(0, kScheme.size(), kScheme) != 0) {
    throw ConnectionError("Unsupported socket URL, expected wss://: " + url);
  }
  const std::string rest = url.substr(kScheme.size());
  const auto path_pos = rest.find_first_of("/?");
  const std::string authority = rest.substr(0, path_pos);

  SocketTarget target;
  target.path = path_pos == std::string::npos ? "/" : rest.substr(path_pos);
  if (target.path.front() == '?') {
    target.path.insert(target.path.begin(), '/');
  }

  const auto colon = authority.rfind(':');
  if (colon == std::string::npos) {
    target.host = authority;
    target.port = "443";
  } else {
    target.host = authority.substr(0, colon);
    target.port = authority.substr(colon + 1);
  }
  if (target.host.empty() || target.port.empty()) {
    throw ConnectionError("Invalid socket URL: " + url);
  }
  return target;
}

class BeastWebSocketConnection : public WebSocketConnection {
public:
  BeastWebSocketConnection()
      : ssl_context_(ssl::context::tlsv12_client),
        ws_(io_context_, ssl_context_) {}

  ~BeastWebSocketConnection() override {
    close();
    if (reader_.joinable()) {
      reader_.join();
    }
  }

  void open(const SocketTarget& target, const std::map<std::string, std::string>& headers) {
    try {
      ssl_context_.set_default_verify_paths();
      ssl_context_.set_verify_mode(ssl::verify_peer);

      tcp::resolver resolver(io_context_);
      auto results = resolver.resolve(target.host, target.port);
      beast::get_lowest_layer(ws_).connect(results);

      if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), target.host.c_str())) {
        throw ConnectionError("Failed to set SNI hostname for " + target.host);
      }
      ws_.next_layer().set_verify_callback(ssl::host_name_verification(target.host));
      ws_.next_layer().handshake(ssl::stream_base::client);

      beast::get_lowest_layer(ws_).expires_never();
      ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
      ws_.set_option(websocket::stream_base::decorator([headers](websocket::request_type& request) {
        for (const auto& [name, value] : headers) {
          request.set(name, value);
        }
      }));

      const std::string host = target.port == "443" ? target.host : target.host + ":" + target.port;
      ws_.handshake(host, target.path);
    } catch (const boost::system::system_error& ex) {
      throw ConnectionError(std::string("WebSocket connection failed: ") + ex.what());
    }
  }

  void start(SocketHandlers handlers) {
    handlers_ = std::move(handlers);
    reader_ = std::thread([this] {
      try {
        read_next();
        io_context_.run();
      } catch (const std::exception& ex) {
        if (handlers_.on_error) {
          handlers_.on_error(ex.what());
        }
      }
    });
  }

  void close() override {
    bool expected = false;
    if (!closing_.compare_exchange_strong(expected, true)) {
      return;
    }
    net::post(io_context_, [this] {
      if (!ws_.is_open()) {
        return;
      }
      ws_.async_close(websocket::close_code::normal, [](beast::error_code) {});
    });
  }

private:
  void read_next() {
    ws_.async_read(buffer_, [this](beast::error_code ec, std::size_t) { on_read(ec); });
  }

  void on_read(beast::error_code ec) {
    if (ec) {
      const bool clean = closing_.load() || ec == websocket::error::closed || ec == net::ssl::error::stream_truncated;
      if (clean) {
        if (handlers_.on_close) {
          handlers_.on_close();
        }
      } else if (handlers_.on_error) {
        handlers_.on_error(ec.message());
      }
      return;
    }

    std::string message = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());
    if (handlers_.on_message) {
      handlers_.on_message(std::move(message));
    }
    read_next();
  }

  net::io_context io_context_;
  ssl::context ssl_context_;
  websocket::stream<beast::ssl_stream<beast::tcp_stream>> ws_;
  beast::flat_buffer buffer_;
  SocketHandlers handlers_;
  std::atomic<bool> closing_{false};
  std::thread reader_;
};

class BeastWebSocketConnector : public WebSocketConnector {
public:
  std::unique_ptr<WebSocketConnection> connect(const std::string& url,
                                               const std::map<std::string, std::string>& headers,
                                               SocketHandlers handlers) override {
    const auto target = parse_socket_url(url);
    auto connection = std::make_unique<BeastWebSocketConnection>();
    connection->open(target, headers);
    connection->start(std::move(handlers));
    return connection;
  }
};

}  // namespace

std::unique_ptr<WebSocketConnector> make_default_websocket_connector() {
  return std::make_unique<BeastWebSocketConnector>();
}

}  // namespace enginebridge
