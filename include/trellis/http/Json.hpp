#pragma once
#include "trellis/io/StreamWriter.hpp"
#include <nlohmann/json.hpp>
#include <string_view>

namespace trellis {

inline constexpr std::string_view JSON_CONTENT_TYPE = "application/json";

/**
 * 200 head with Content-Type application/json, then `value` serialized
 * compactly as the body.
 *
 * Throws nlohmann::json::type_error when a string in `value` is not valid
 * UTF-8; nothing has been written at that point.
 */
void jsonify(StreamWriter& writer,
             const nlohmann::json& value,
             StreamWriter::DoneCallback on_done,
             StreamWriter::ErrorCallback on_error);

} // namespace trellis
