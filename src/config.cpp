#include "config.hpp"

#include <cstdlib>

namespace dockapi {

namespace {

std::string getEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

} // namespace

ClientOptions ClientOptions::fromEnv() {
    ClientOptions opts;

    const auto host = getEnv(kEnvHost);
    if (!host.empty()) {
        opts.host = host;
    }

    opts.apiVersion = getEnv(kEnvApiVersion);

    const auto certPath  = getEnv(kEnvCertPath);
    const auto tlsVerify = getEnv(kEnvTlsVerify);
    if (!certPath.empty() || !tlsVerify.empty()) {
        opts.tls       = true;
        opts.certPath  = certPath;
        opts.tlsVerify = !tlsVerify.empty();
    }

    return opts;
}

} // namespace dockapi
