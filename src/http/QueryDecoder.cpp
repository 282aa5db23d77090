#include "trellis/http/QueryDecoder.hpp"

namespace trellis {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

void QueryValue::append(QueryValue next) {
    std::string incoming = next.isScalar() ? next.scalar() : std::string();

    if (isMulti()) {
        std::get<std::vector<std::string>>(value_).push_back(std::move(incoming));
        return;
    }

    std::vector<std::string> values;
    values.push_back(isScalar() ? scalar() : std::string());
    values.push_back(std::move(incoming));
    value_ = std::move(values);
}

std::string unquotePlus(std::string_view s) {
    std::string out;
    out.reserve(s.size());

    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '+') {
            out.push_back(' ');
            continue;
        }
        if (c != '%') {
            out.push_back(c);
            continue;
        }

        if (i + 2 >= s.size()) {
            // Truncated escape at end of input
            break;
        }

        int hi = hexValue(s[i + 1]);
        int lo = hexValue(s[i + 2]);
        if (hi < 0 || lo < 0) {
            throw DecodeError("invalid percent-escape '%" + std::string(s.substr(i + 1, 2)) + "'");
        }
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }

    return out;
}

QueryMap parseQueryString(std::string_view s) {
    QueryMap result;
    if (s.empty()) {
        return result;
    }

    size_t start = 0;
    while (true) {
        size_t amp = s.find('&', start);
        std::string_view pair = s.substr(start, amp == std::string_view::npos ? std::string_view::npos : amp - start);

        std::string key;
        QueryValue value;
        size_t eq = pair.find('=');
        if (eq == std::string_view::npos) {
            key = unquotePlus(pair);
            value = QueryValue(QueryValue::Flag{});
        } else {
            key = unquotePlus(pair.substr(0, eq));
            value = QueryValue(unquotePlus(pair.substr(eq + 1)));
        }

        auto it = result.find(key);
        if (it == result.end()) {
            result.emplace(std::move(key), std::move(value));
        } else {
            it->second.append(std::move(value));
        }

        if (amp == std::string_view::npos) {
            break;
        }
        start = amp + 1;
    }

    return result;
}

} // namespace trellis
