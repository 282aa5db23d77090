#pragma once
#include "trellis/io/StreamWriter.hpp"
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace trellis {

using ResponseHeaders = std::vector<std::pair<std::string, std::string>>;

inline constexpr std::string_view DEFAULT_CONTENT_TYPE = "text/html; charset=utf-8";

/**
 * Status line and headers:
 *   HTTP/1.0 <status> NA\r\nContent-Type: <type>\r\n[<name>: <value>\r\n]*\r\n
 *
 * `status` is sent verbatim and the reason phrase is always the placeholder
 * "NA". Clients parse it fine, but it is not a real reason phrase.
 */
std::string formatResponseHead(std::string_view status,
                               std::string_view content_type = DEFAULT_CONTENT_TYPE,
                               const ResponseHeaders& headers = {});

// `raw_headers` is inserted as-is and must carry its own CRLFs
std::string formatResponseHead(std::string_view status,
                               std::string_view content_type,
                               std::string_view raw_headers);

void startResponse(StreamWriter& writer,
                   std::string_view content_type,
                   std::string_view status,
                   const ResponseHeaders& headers,
                   StreamWriter::DoneCallback on_done,
                   StreamWriter::ErrorCallback on_error);

/**
 * Head with the default content type, then the status token as the body.
 */
void httpError(StreamWriter& writer,
               std::string_view status,
               StreamWriter::DoneCallback on_done,
               StreamWriter::ErrorCallback on_error);

/**
 * Fully buffered response for handlers that don't stream.
 */
struct Response {
    std::string status = "200";
    std::string content_type{DEFAULT_CONTENT_TYPE};
    ResponseHeaders headers;
    std::string body;

    void setStatus(std::string code) { status = std::move(code); }

    // Replaces an existing header with the same name
    void setHeader(const std::string& name, const std::string& value);

    void html(const std::string& content) {
        content_type = "text/html";
        body = content;
    }

    void text(const std::string& content) {
        content_type = "text/plain";
        body = content;
    }

    std::string serialize() const;
};

} // namespace trellis
