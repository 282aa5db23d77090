#include "trellis/http/RouteTable.hpp"

namespace trellis {

RouteMatcher RouteMatcher::exact(std::string path) {
    return RouteMatcher(std::move(path), std::nullopt);
}

RouteMatcher RouteMatcher::pattern(const std::string& regex) {
    return RouteMatcher(regex, std::regex(regex, std::regex::ECMAScript));
}

bool RouteMatcher::match(const std::string& path, std::vector<std::string>& captures) const {
    if (!regex_) {
        return path == source_;
    }

    std::smatch match_results;
    if (!std::regex_search(path, match_results, *regex_, std::regex_constants::match_continuous)) {
        return false;
    }

    captures.clear();
    captures.reserve(match_results.size());
    for (const auto& group : match_results) {
        captures.push_back(group.matched ? group.str() : std::string());
    }
    return true;
}

const RouteEntry* RouteTable::resolve(const std::string& path, std::vector<std::string>& captures) const {
    for (const auto& route : routes_) {
        // Exact entries short-circuit on string equality
        if (route.matcher.isExact()) {
            if (path == route.matcher.source()) {
                captures.clear();
                return &route;
            }
            continue;
        }
        if (route.matcher.match(path, captures)) {
            return &route;
        }
    }
    return nullptr;
}

} // namespace trellis
