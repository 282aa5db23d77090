#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace trellis {

/**
 * Raised by unquotePlus() for a '%' followed by two characters that are not
 * both hex digits.
 */
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * One decoded query/form value: a plain string, a bare key with no '='
 * (presence flag), or every value of a repeated key in arrival order.
 */
class QueryValue {
public:
    struct Flag {
        bool operator==(const Flag&) const = default;
    };

    QueryValue() : value_(Flag{}) {}
    QueryValue(std::string scalar) : value_(std::move(scalar)) {}
    QueryValue(Flag flag) : value_(flag) {}
    QueryValue(std::vector<std::string> values) : value_(std::move(values)) {}

    bool isScalar() const { return std::holds_alternative<std::string>(value_); }
    bool isFlag() const { return std::holds_alternative<Flag>(value_); }
    bool isMulti() const { return std::holds_alternative<std::vector<std::string>>(value_); }

    // Throws std::bad_variant_access on the wrong kind
    const std::string& scalar() const { return std::get<std::string>(value_); }
    const std::vector<std::string>& values() const { return std::get<std::vector<std::string>>(value_); }

    /**
     * Add another occurrence of the same key: the first repeat turns the
     * value into a sequence, later ones append. A flag occurrence is
     * recorded as an empty string inside a sequence.
     */
    void append(QueryValue next);

    bool operator==(const QueryValue& other) const = default;

private:
    std::variant<std::string, Flag, std::vector<std::string>> value_;
};

using QueryMap = std::map<std::string, QueryValue>;

/**
 * '+' becomes a space, then each %XX escape is decoded to the single byte
 * 0xXX independently of its neighbours (multi-byte sequences are not
 * reassembled). A '%' with fewer than two characters after it is dropped
 * along with those trailing characters. Throws DecodeError otherwise when
 * XX is not two hex digits.
 */
std::string unquotePlus(std::string_view s);

/**
 * Split on '&', then each pair on the first '='; both sides are unquoted.
 * Empty input yields an empty map.
 */
QueryMap parseQueryString(std::string_view s);

} // namespace trellis
