#include "mapping.hpp"

#include <boost/beast/core/string.hpp>

#include <stdexcept>

namespace dockapi {

std::string headerValue(const HeaderMap& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (boost::beast::iequals(key, name)) return value;
    }
    return "";
}

const char* toString(ContainerChange::Kind kind) {
    switch (kind) {
        case ContainerChange::Kind::Modified: return "C";
        case ContainerChange::Kind::Added:    return "A";
        case ContainerChange::Kind::Deleted:  return "D";
    }
    return "?";
}

PingResult parsePingHeaders(const HeaderMap& headers) {
    PingResult ping;

    const auto apiVersion = headerValue(headers, "Api-Version");
    if (!apiVersion.empty()) {
        ping.apiVersion = apiVersion;
    }
    ping.osType         = headerValue(headers, "OSType");
    ping.experimental   = headerValue(headers, "Docker-Experimental") == "true";
    ping.builderVersion = headerValue(headers, "Builder-Version");
    return ping;
}

ContainerChange parseChangeNode(const nlohmann::json& node) {
    ContainerChange change;
    change.path = node.value("Path", "");

    const int kind = node.value("Kind", 0);
    switch (kind) {
        case 0: change.kind = ContainerChange::Kind::Modified; break;
        case 1: change.kind = ContainerChange::Kind::Added;    break;
        case 2: change.kind = ContainerChange::Kind::Deleted;  break;
        default:
            throw std::runtime_error("Unknown change kind " +
                                     std::to_string(kind) + " for " +
                                     change.path);
    }
    return change;
}

std::vector<ContainerChange> parseContainerChanges(const std::string& body) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(
            std::string("Failed to parse JSON response: ") + e.what());
    }

    std::vector<ContainerChange> changes;
    if (doc.is_null()) {
        return changes;
    }
    if (!doc.is_array()) {
        throw std::runtime_error("Expected a JSON array of changes");
    }

    try {
        for (const auto& node : doc) {
            changes.push_back(parseChangeNode(node));
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(
            std::string("Malformed change entry: ") + e.what());
    }
    return changes;
}

std::string extractErrorMessage(const std::string& body) {
    auto doc = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (doc.is_object() && doc.contains("message") &&
        doc["message"].is_string()) {
        return doc["message"].get<std::string>();
    }
    return body;
}

} // namespace dockapi
