#include "trellis/http/Response.hpp"

namespace trellis {

namespace {

std::string statusAndType(std::string_view status, std::string_view content_type) {
    std::string head;
    head.reserve(64 + content_type.size());
    head += "HTTP/1.0 ";
    head += status;
    head += " NA\r\nContent-Type: ";
    head += content_type;
    head += "\r\n";
    return head;
}

} // namespace

std::string formatResponseHead(std::string_view status,
                               std::string_view content_type,
                               const ResponseHeaders& headers) {
    std::string head = statusAndType(status, content_type);
    for (const auto& [name, value] : headers) {
        head += name;
        head += ": ";
        head += value;
        head += "\r\n";
    }
    head += "\r\n";
    return head;
}

std::string formatResponseHead(std::string_view status,
                               std::string_view content_type,
                               std::string_view raw_headers) {
    std::string head = statusAndType(status, content_type);
    head += raw_headers;
    head += "\r\n";
    return head;
}

void startResponse(StreamWriter& writer,
                   std::string_view content_type,
                   std::string_view status,
                   const ResponseHeaders& headers,
                   StreamWriter::DoneCallback on_done,
                   StreamWriter::ErrorCallback on_error) {
    writer.write(formatResponseHead(status, content_type, headers), std::move(on_done), std::move(on_error));
}

void httpError(StreamWriter& writer,
               std::string_view status,
               StreamWriter::DoneCallback on_done,
               StreamWriter::ErrorCallback on_error) {
    std::string out = formatResponseHead(status);
    out += status;
    writer.write(std::move(out), std::move(on_done), std::move(on_error));
}

void Response::setHeader(const std::string& name, const std::string& value) {
    for (auto& header : headers) {
        if (header.first == name) {
            header.second = value;
            return;
        }
    }
    headers.emplace_back(name, value);
}

std::string Response::serialize() const {
    std::string out = formatResponseHead(status, content_type, headers);
    out += body;
    return out;
}

} // namespace trellis
