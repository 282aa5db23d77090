#include "trellis/http/RequestParser.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <sstream>

namespace trellis {

namespace {

/**
 * Reads header lines one at a time until the blank line. Keeps itself alive
 * across suspension points through the callbacks it hands to the reader.
 */
class HeaderBlockReader : public std::enable_shared_from_this<HeaderBlockReader> {
  public:
    HeaderBlockReader(std::shared_ptr<StreamReader> reader,
                      HeaderPolicy policy,
                      const ParserLimits& limits,
                      RequestParser::HeadersCallback on_done,
                      RequestParser::FailureCallback on_error)
        : reader_(std::move(reader))
        , policy_(policy)
        , limits_(limits)
        , on_done_(std::move(on_done))
        , on_error_(std::move(on_error)) {}

    void next() {
        auto self = shared_from_this();
        reader_->readLine(
            [self](std::string line) { self->onLine(std::move(line)); },
            [self](int error) { self->on_error_(RequestParser::readError(error, "reading headers")); });
    }

  private:
    void onLine(std::string line) {
        if (line.empty() || RequestParser::isBlankLine(line)) {
            if (policy_ == HeaderPolicy::Parse) {
                on_done_(std::move(headers_));
            } else {
                on_done_(std::nullopt);
            }
            return;
        }

        if (line.size() > limits_.max_header_line) {
            on_error_(DispatchError{ErrorKind::LimitExceeded,
                                    "header line of " + std::to_string(line.size()) + " bytes"});
            return;
        }
        if (++count_ > limits_.max_headers) {
            on_error_(DispatchError{ErrorKind::LimitExceeded,
                                    "more than " + std::to_string(limits_.max_headers) + " headers"});
            return;
        }

        if (policy_ == HeaderPolicy::Parse) {
            std::string name;
            std::string value;
            if (!RequestParser::parseHeaderLine(line, name, value)) {
                on_error_(DispatchError{ErrorKind::MalformedHeaderLine, "no ':' in header line"});
                return;
            }
            headers_[std::move(name)] = std::move(value);
        }

        next();
    }

    std::shared_ptr<StreamReader> reader_;
    HeaderPolicy policy_;
    ParserLimits limits_;
    HeaderMap headers_;
    size_t count_ = 0;
    RequestParser::HeadersCallback on_done_;
    RequestParser::FailureCallback on_error_;
};

} // namespace

bool RequestParser::parseRequestLine(std::string_view line, Request& out) {
    std::istringstream ls{stripLineEnding(line)};
    std::string method;
    std::string target;
    std::string proto;
    std::string extra;
    if (!(ls >> method >> target >> proto) || (ls >> extra)) {
        return false;
    }

    size_t query = target.find('?');
    if (query != std::string::npos) {
        out.qs = target.substr(query + 1);
        target.resize(query);
    } else {
        out.qs.clear();
    }

    out.method = std::move(method);
    out.path = std::move(target);
    out.proto = std::move(proto);
    return true;
}

bool RequestParser::parseHeaderLine(std::string_view line, std::string& name, std::string& value) {
    std::string stripped = stripLineEnding(line);
    size_t colon = stripped.find(':');
    if (colon == std::string::npos) {
        return false;
    }

    name = normalizeHeaderName(std::string_view(stripped).substr(0, colon));
    value = trimHeaderValue(std::string_view(stripped).substr(colon + 1));
    return true;
}

bool RequestParser::isBlankLine(std::string_view line) {
    return line == "\r\n" || line == "\n";
}

void RequestParser::applyHeaderPolicy(const std::shared_ptr<StreamReader>& reader,
                                      HeaderPolicy policy,
                                      const ParserLimits& limits,
                                      HeadersCallback on_done,
                                      FailureCallback on_error) {
    if (policy == HeaderPolicy::Leave) {
        on_done(std::nullopt);
        return;
    }

    auto block = std::make_shared<HeaderBlockReader>(reader, policy, limits,
                                                     std::move(on_done), std::move(on_error));
    block->next();
}

DispatchError RequestParser::readError(int error, std::string_view context) {
    if (error == EMSGSIZE) {
        return DispatchError{ErrorKind::LimitExceeded, std::string(context) + ": line too long"};
    }
    return DispatchError{ErrorKind::ReadFailure, std::string(context), error};
}

std::string RequestParser::stripLineEnding(std::string_view line) {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.remove_suffix(1);
    }
    return std::string(line);
}

std::string RequestParser::trimHeaderValue(std::string_view value) {
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
        value.remove_suffix(1);
    }
    return std::string(value);
}

std::string RequestParser::normalizeHeaderName(std::string_view name) {
    std::string result(name);
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c){ return std::tolower(c); });
    return result;
}

} // namespace trellis
