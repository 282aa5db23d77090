#pragma once
#include "trellis/Config.hpp"
#include "trellis/http/HttpTypes.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace trellis {

/**
 * Line-oriented request parsing.
 *
 * The dispatcher reads the request line itself and hands it to
 * parseRequestLine(); the header block is then consumed according to the
 * matched route's HeaderPolicy by applyHeaderPolicy().
 */
class RequestParser {
  public:
    using HeadersCallback = std::function<void(std::optional<HeaderMap> headers)>;
    using FailureCallback = std::function<void(DispatchError error)>;

    /**
     * "METHOD SP target SP proto" with optional CRLF. The target is split on
     * the first '?' into path and query string. Exactly three
     * whitespace-separated tokens are required.
     */
    static bool parseRequestLine(std::string_view line, Request& out);

    /**
     * "Name: value" split on the first ':'. The name is lower-cased and the
     * value trimmed of surrounding spaces and tabs.
     */
    static bool parseHeaderLine(std::string_view line, std::string& name, std::string& value);

    // "\r\n" or a bare "\n"
    static bool isBlankLine(std::string_view line);

    /**
     * Parse: on_done receives the header map.
     * Skip: lines are read and dropped, on_done receives nullopt.
     * Leave: nothing is read, on_done receives nullopt immediately.
     *
     * End-of-stream before the blank line ends the header block. Under Skip
     * and Parse the header count and line length limits apply.
     */
    static void applyHeaderPolicy(const std::shared_ptr<StreamReader>& reader,
                                  HeaderPolicy policy,
                                  const ParserLimits& limits,
                                  HeadersCallback on_done,
                                  FailureCallback on_error);

    // Maps a reader errno to the error reported to the exception hook
    static DispatchError readError(int error, std::string_view context);

  private:
    static std::string stripLineEnding(std::string_view line);
    static std::string trimHeaderValue(std::string_view value);
    static std::string normalizeHeaderName(std::string_view name);
};

} // namespace trellis
