#include "client.hpp"
#include "config.hpp"
#include "context.hpp"
#include "mapping.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

struct Config {
    dockapi::ClientOptions   options = dockapi::ClientOptions::fromEnv();
    std::vector<std::string> command;
};

static void printUsage() {
    std::cout
        << "Usage: dockapi [options] <command>\n\n"
        << "Commands:\n"
        << "  version          Print the API version requests would use\n"
        << "  ping             Ping the daemon and print what it reports\n"
        << "  changes NAME     List filesystem changes of a container\n\n"
        << "Options:\n"
        << "  --host URL         Daemon host        (default: $DOCKER_HOST or "
        << dockapi::kDefaultHost << ")\n"
        << "  --api-version V    Pin the API version (default: $DOCKER_API_VERSION)\n"
        << "  --negotiate        Negotiate the API version with the daemon\n"
        << "  --tls              Use TLS for tcp:// hosts\n"
        << "  --tls-verify       Use TLS and verify the daemon certificate\n"
        << "  --cert-path DIR    Directory with ca.pem, cert.pem, key.pem\n"
        << "  --timeout-ms N     HTTP timeout in ms  (default: 30000)\n"
        << "  --verbose          Enable verbose diagnostics\n"
        << "  --help, -h         Show this message\n";
}

static Config parseArgs(int argc, char* argv[]) {
    Config cfg;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--host" && i + 1 < argc) {
            cfg.options.host = argv[++i];
        } else if (arg == "--api-version" && i + 1 < argc) {
            cfg.options.apiVersion = argv[++i];
        } else if (arg == "--negotiate") {
            cfg.options.negotiate = true;
        } else if (arg == "--tls") {
            cfg.options.tls = true;
            cfg.options.tlsVerify = false;
        } else if (arg == "--tls-verify") {
            cfg.options.tls = true;
            cfg.options.tlsVerify = true;
        } else if (arg == "--cert-path" && i + 1 < argc) {
            cfg.options.certPath = argv[++i];
        } else if (arg == "--timeout-ms" && i + 1 < argc) {
            cfg.options.timeoutMs = std::stoi(argv[++i]);
        } else if (arg == "--verbose") {
            cfg.options.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown argument: " << arg << "\n\n";
            printUsage();
            std::exit(1);
        } else {
            cfg.command.push_back(arg);
        }
    }

    if (cfg.command.empty()) {
        printUsage();
        std::exit(1);
    }
    return cfg;
}

int main(int argc, char* argv[]) {
    try {
        Config cfg = parseArgs(argc, argv);

        dockapi::Client client(cfg.options);
        auto ctx = dockapi::RequestContext::withTimeout(
            std::chrono::milliseconds(cfg.options.timeoutMs));

        const auto& cmd = cfg.command[0];

        if (cmd == "version") {
            if (cfg.options.negotiate) {
                client.negotiateApiVersion(ctx);
            }
            std::cout << client.clientVersion() << "\n";

        } else if (cmd == "ping") {
            const auto ping = client.ping(ctx);
            std::cout
                << "API version:     " << ping.apiVersion.value_or("(none)") << "\n"
                << "OS type:         " << ping.osType << "\n"
                << "Experimental:    " << (ping.experimental ? "yes" : "no") << "\n"
                << "Builder version: " << ping.builderVersion << "\n";

        } else if (cmd == "changes") {
            if (cfg.command.size() < 2) {
                std::cerr << "changes: missing container name\n";
                return 1;
            }
            for (const auto& change : client.containerChanges(ctx, cfg.command[1])) {
                std::cout << dockapi::toString(change.kind) << " "
                          << change.path << "\n";
            }

        } else {
            std::cerr << "Unknown command: " << cmd << "\n\n";
            printUsage();
            return 1;
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
