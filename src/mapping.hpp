#pragma once

#include "models.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace dockapi {

/// Return the value of header @p name, or "" if absent.  Case-insensitive.
std::string headerValue(const HeaderMap& headers, const std::string& name);

/// One-letter change marker: "C", "A" or "D".
const char* toString(ContainerChange::Kind kind);

/// Map the headers of a /_ping response into a PingResult.
/// An absent or empty Api-Version header leaves apiVersion unset.
PingResult parsePingHeaders(const HeaderMap& headers);

/// Map a single change entry ({"Path": ..., "Kind": n}).
/// Throws std::runtime_error on an unknown kind.
ContainerChange parseChangeNode(const nlohmann::json& node);

/// Parse the body of GET /containers/{name}/changes.
/// A JSON null (no changes) yields an empty list.
/// Throws std::runtime_error if the body is not a JSON array.
std::vector<ContainerChange> parseContainerChanges(const std::string& body);

/// Return the daemon's error message from a response body, falling back to
/// the raw body when it is not JSON with a "message" field.
std::string extractErrorMessage(const std::string& body);

} // namespace dockapi
