#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace enginebridge {

inline constexpr const char* kStreamDoneSentinel = "data: [DONE]\n\n";

std::int64_t unix_timestamp();

/**
 * Builds a chat.completion.chunk object. Empty content renders an empty
 * delta object.
 */
nlohmann::json make_chunk(const std::string& request_id,
                          const std::string& model,
                          const std::string& content,
                          const std::optional<std::string>& finish_reason = std::nullopt,
                          std::optional<std::int64_t> created = std::nullopt);

/** Encodes a chunk as one server-sent event line: "data: <json>\n\n". */
std::string encode_chunk(const std::string& request_id,
                         const std::string& model,
                         const std::string& content,
                         const std::optional<std::string>& finish_reason = std::nullopt);

nlohmann::json make_completion_response(const std::string& request_id,
                                        const std::string& model,
                                        const std::string& content,
                                        std::optional<std::int64_t> created = std::nullopt);

}  // namespace enginebridge
