#include "trellis/http/Json.hpp"
#include "trellis/http/Response.hpp"
#include <string>

namespace trellis {

void jsonify(StreamWriter& writer,
             const nlohmann::json& value,
             StreamWriter::DoneCallback on_done,
             StreamWriter::ErrorCallback on_error) {
    std::string body = value.dump();
    std::string out = formatResponseHead("200", JSON_CONTENT_TYPE);
    out += body;
    writer.write(std::move(out), std::move(on_done), std::move(on_error));
}

} // namespace trellis
