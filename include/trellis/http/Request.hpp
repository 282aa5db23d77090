#pragma once
#include "trellis/Config.hpp"
#include "trellis/http/DispatchError.hpp"
#include "trellis/http/QueryDecoder.hpp"
#include "trellis/io/StreamReader.hpp"
#include <algorithm>
#include <cctype>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace trellis {

// Header names are stored lower-case
using HeaderMap = std::unordered_map<std::string, std::string>;

template<typename Map>
std::string read_header(const Map& headers, const std::string& name) {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    auto it = headers.find(key);
    return it != headers.end() ? it->second : "";
}

/**
 * One request, owned by the dispatcher for the duration of a single exchange.
 *
 * `path` has every mount prefix already stripped. `headers` is only present
 * when the matched route's header policy was Parse; under Leave the header
 * block is still unread on `reader`.
 */
struct Request {
    std::string method;
    std::string path;
    std::string qs;
    std::string proto;
    std::optional<HeaderMap> headers;
    std::shared_ptr<StreamReader> reader;

    // [0] is the whole match, [1..] the capture groups; empty for exact routes
    std::vector<std::string> url_match;

    // Filled by parseQs() or readFormData()
    std::optional<QueryMap> form;

    // Largest Content-Length readFormData() accepts; the dispatcher copies it from the root limits
    size_t max_body = ParserLimits{}.max_body;

    std::string header(const std::string& name) const {
        return headers ? read_header(*headers, name) : "";
    }

    // Throws std::out_of_range for a group the pattern does not have
    const std::string& group(size_t index) const { return url_match.at(index); }

    void parseQs();

    using FormCallback = std::function<void()>;
    using FailureCallback = std::function<void(DispatchError error)>;

    /**
     * Read a urlencoded body of Content-Length bytes from `reader` and decode
     * it into `form`. Requires the Parse header policy. A Content-Length above
     * `max_body` fails with LimitExceeded before anything is read.
     */
    void readFormData(FormCallback on_done, FailureCallback on_error);
};

} // namespace trellis
