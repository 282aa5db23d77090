#pragma once
#include "trellis/http/HttpTypes.hpp"
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace trellis {

/**
 * Either an exact path or an ECMAScript pattern. Patterns are anchored at
 * the start of the path only: "^/(static/.+)" and "/(static/.+)" behave the
 * same, and a trailing "$" is needed to reject longer paths.
 */
class RouteMatcher {
  public:
    static RouteMatcher exact(std::string path);

    // Throws std::regex_error for an invalid pattern
    static RouteMatcher pattern(const std::string& regex);

    bool isExact() const { return !regex_.has_value(); }
    const std::string& source() const { return source_; }

    /**
     * On a pattern match `captures` receives the whole match followed by
     * every group (unmatched groups are empty strings).
     */
    bool match(const std::string& path, std::vector<std::string>& captures) const;

  private:
    RouteMatcher(std::string source, std::optional<std::regex> regex)
        : source_(std::move(source)), regex_(std::move(regex)) {}

    std::string source_;
    std::optional<std::regex> regex_;
};

struct RouteEntry {
    RouteMatcher matcher;
    Handler handler;
    RouteOptions options;
};

/**
 * Ordered route list: entries are tried in insertion order and the first
 * match wins.
 */
class RouteTable {
  public:
    void add(RouteEntry entry) { routes_.push_back(std::move(entry)); }

    /**
     * @return The first matching entry, or nullptr. Pattern matching may
     *         throw std::regex_error (e.g. on excessive backtracking).
     */
    const RouteEntry* resolve(const std::string& path, std::vector<std::string>& captures) const;

    size_t size() const { return routes_.size(); }
    bool empty() const { return routes_.empty(); }
    const RouteEntry& at(size_t index) const { return routes_.at(index); }

  private:
    std::vector<RouteEntry> routes_;
};

} // namespace trellis
