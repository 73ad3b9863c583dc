#include "enginebridge/chat_bridge.hpp"
#include "enginebridge/completion_format.hpp"
#include "enginebridge/error.hpp"
#include "enginebridge/utils/env.hpp"
#include "enginebridge/utils/uuid.hpp"

#include <iostream>
#include <optional>
#include <string>

namespace
{

void print_log(enginebridge::LogLevel level, const std::string& message, const nlohmann::json& details)
{
  std::cerr << "[" << enginebridge::log_level_name(level) << "] " << message;
  if (!details.is_null() && !details.empty())
  {
    std::cerr << " " << details.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  }
  std::cerr << std::endl;
}

}  // namespace

int main(int argc, char** argv)
{
  auto auth_token = enginebridge::utils::read_env("ENGINEBRIDGE_AUTH_TOKEN");
  auto user_id = enginebridge::utils::read_env("ENGINEBRIDGE_USER_ID");
  if (!auth_token || !user_id)
  {
    std::cerr << "ENGINEBRIDGE_AUTH_TOKEN and ENGINEBRIDGE_USER_ID environment variables must be set\n";
    return 1;
  }

  bool aggregate = false;
  std::string prompt;
  for (int i = 1; i < argc; ++i)
  {
    const std::string arg = argv[i];
    if (arg == "--aggregate")
    {
      aggregate = true;
      continue;
    }
    if (!prompt.empty())
    {
      prompt += " ";
    }
    prompt += arg;
  }

  if (prompt.empty())
  {
    std::cerr << "Usage: bridge_demo [--aggregate] <prompt>\n";
    return 1;
  }

  try
  {
    enginebridge::BridgeOptions options;
    options.log_level = enginebridge::LogLevel::Info;
    options.logger = print_log;

    enginebridge::ChatBridge bridge(options);

    enginebridge::Session session;
    session.request_id = "chatcmpl-" + enginebridge::utils::uuid4();
    session.model = enginebridge::utils::read_env_or("ENGINEBRIDGE_MODEL", "ClaudeSonnet4_5");
    session.session_id = enginebridge::utils::read_env_or("ENGINEBRIDGE_SESSION_ID", enginebridge::utils::uuid4());
    session.identity_token = *user_id;
    session.auth_token = *auth_token;
    session.prompt = prompt;

    if (aggregate)
    {
      const std::string content = bridge.complete(session);
      std::cout << enginebridge::make_completion_response(session.request_id, session.model, content).dump(2)
                << std::endl;
      return 0;
    }

    auto stream = bridge.stream(session);
    while (auto line = stream->next())
    {
      std::cout << *line << std::flush;
    }
  }
  catch (const enginebridge::ConnectionError& error)
  {
    std::cerr << "Connection error: " << error.what() << std::endl;
    return 1;
  }
  catch (const enginebridge::BridgeError& error)
  {
    std::cerr << "Bridge error: " << error.what() << std::endl;
    return 1;
  }
  catch (const std::exception& error)
  {
    std::cerr << "Unexpected error: " << error.what() << std::endl;
    return 1;
  }

  return 0;
}
