#pragma once

#include <stdexcept>
#include <string>

namespace enginebridge {

class BridgeError : public std::runtime_error {
public:
  explicit BridgeError(const std::string& message)
      : std::runtime_error(message) {}
};

/** The backend socket failed before reaching the open state. */
class ConnectionError : public BridgeError {
public:
  explicit ConnectionError(const std::string& message)
      : BridgeError(message) {}
};

/** A socket frame or its nested buffer payload could not be decoded. */
class ProtocolError : public BridgeError {
public:
  explicit ProtocolError(const std::string& message)
      : BridgeError(message) {}
};

class UpstreamTriggerError : public BridgeError {
public:
  UpstreamTriggerError(std::string message, long status_code, std::string body_excerpt)
      : BridgeError(std::move(message)),
        status_code_(status_code),
        body_excerpt_(std::move(body_excerpt)) {}

  /** Zero when the request never produced a response. */
  long status_code() const { return status_code_; }
  const std::string& body_excerpt() const { return body_excerpt_; }

private:
  long status_code_;
  std::string body_excerpt_;
};

class UnhandledPipelineError : public BridgeError {
public:
  explicit UnhandledPipelineError(const std::string& message)
      : BridgeError(message) {}
};

class InvalidRequestError : public BridgeError {
public:
  explicit InvalidRequestError(const std::string& message)
      : BridgeError(message) {}
};

class AuthenticationError : public BridgeError {
public:
  explicit AuthenticationError(const std::string& message)
      : BridgeError(message) {}
};

}  // namespace enginebridge
