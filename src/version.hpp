#pragma once

#include <string>

namespace dockapi {

/// API version this client natively speaks.
inline const std::string kDefaultApiVersion = "1.51";

/// Last API version that predates version negotiation.  Used when a daemon
/// answers a ping without reporting any version.
inline const std::string kLegacyFloorVersion = "1.24";

/// An API version such as "1.22".
///
/// The text form is kept verbatim (minus a leading 'v') so that pinned
/// versions round-trip exactly.  Ordering compares major/minor numerically,
/// so "1.9" < "1.10".  A non-numeric component compares as 0.
class ApiVersion {
public:
    ApiVersion() = default;

    /// Accepts "", "1.22" and "v1.22".  "v" alone is the same as "".
    explicit ApiVersion(const std::string& text);

    const std::string& str() const { return mText; }
    bool empty() const { return mText.empty(); }

    int majorPart() const { return mMajor; }
    int minorPart() const { return mMinor; }

    friend bool operator<(const ApiVersion& a, const ApiVersion& b);
    friend bool operator==(const ApiVersion& a, const ApiVersion& b);
    friend bool operator!=(const ApiVersion& a, const ApiVersion& b) { return !(a == b); }
    friend bool operator>(const ApiVersion& a, const ApiVersion& b) { return b < a; }
    friend bool operator<=(const ApiVersion& a, const ApiVersion& b) { return !(b < a); }
    friend bool operator>=(const ApiVersion& a, const ApiVersion& b) { return !(a < b); }

private:
    std::string mText;
    int         mMajor = 0;
    int         mMinor = 0;
};

/// Strip a leading 'v' from a version string.
std::string normalizeVersion(const std::string& text);

} // namespace dockapi
