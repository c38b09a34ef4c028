#pragma once

#include <string>

namespace dockapi {

/// Host used when none is configured.
inline const std::string kDefaultHost = "unix:///var/run/docker.sock";

/// Environment variables read by ClientOptions::fromEnv().
inline const char* const kEnvHost       = "DOCKER_HOST";
inline const char* const kEnvApiVersion = "DOCKER_API_VERSION";
inline const char* const kEnvTlsVerify  = "DOCKER_TLS_VERIFY";
inline const char* const kEnvCertPath   = "DOCKER_CERT_PATH";

/// Everything needed to construct a Client.
struct ClientOptions {
    std::string host       = kDefaultHost;
    std::string apiVersion;              // pinned version; "" = not pinned
    bool        negotiate  = false;      // negotiate when not pinned
    bool        tls        = false;      // TLS over tcp://
    bool        tlsVerify  = true;
    std::string certPath;
    int         timeoutMs  = 30000;
    bool        verbose    = false;

    /// Options taken from DOCKER_HOST, DOCKER_API_VERSION,
    /// DOCKER_TLS_VERIFY and DOCKER_CERT_PATH.  Empty variables count as
    /// unset.  A cert path or TLS-verify flag turns TLS on; a cert path
    /// without TLS-verify disables peer verification.
    static ClientOptions fromEnv();
};

} // namespace dockapi
