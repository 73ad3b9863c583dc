#include "enginebridge/chat_bridge.hpp"

#include "enginebridge/error.hpp"
#include "enginebridge/event_queue.hpp"
#include "enginebridge/stream_translator.hpp"

#include <exception>
#include <optional>
#include <utility>
#include <vector>

namespace enginebridge {

ChatBridge::ChatBridge(BridgeOptions options,
                       std::unique_ptr<HttpClient> http_client,
                       std::unique_ptr<WebSocketConnector> connector)
    : options_(apply_environment(std::move(options))),
      logger_(options_.log_level, options_.logger),
      http_client_(http_client ? std::move(http_client) : make_default_http_client()),
      connector_(connector ? std::move(connector) : make_default_websocket_connector()),
      initiator_(options_, *http_client_, *connector_, logger_) {}

std::unique_ptr<CompletionStream> ChatBridge::stream(Session session) const {
  return std::make_unique<CompletionStream>(std::move(session), initiator_, logger_);
}

std::string ChatBridge::complete(const Session& session) const {
  SocketEventQueue events;
  auto connection = initiator_.open(session, events.handlers());

  const std::optional<std::string> trigger_failure = initiator_.trigger_and_log(session);

  StreamTranslator translator(logger_);
  std::string content;
  std::vector<Frame> frames;
  try {
    while (auto event = events.next()) {
      frames.clear();
      bool done = false;
      if (event->type == SocketEvent::Type::Message) {
        done = translator.consume(event->data, frames);
      } else if (event->type == SocketEvent::Type::Close) {
        translator.finish(frames);
        done = true;
      } else {
        std::string message = "WebSocket error: " + event->data;
        if (trigger_failure) {
          message += " (" + *trigger_failure + ")";
        }
        logger_.log(LogLevel::Error, "websocket error", {{"session_id", session.session_id}, {"error", event->data}});
        throw UnhandledPipelineError(message);
      }

      for (const auto& frame : frames) {
        content += frame.text;
      }
      if (done) {
        break;
      }
    }
  } catch (const BridgeError&) {
    connection->close();
    throw;
  } catch (const std::exception& ex) {
    connection->close();
    throw UnhandledPipelineError(std::string("Failed to process request: ") + ex.what());
  }

  connection->close();
  logger_.log(LogLevel::Info,
              "aggregate completion finished",
              {{"session_id", session.session_id}, {"length", content.size()}});
  return content;
}

std::future<std::string> ChatBridge::complete_async(Session session) const {
  return std::async(std::launch::async, [this, session = std::move(session)] { return complete(session); });
}

}  // namespace enginebridge
