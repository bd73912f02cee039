#include "agent.h"
#include "command_router.h"
#include "config_manager.h"
#include "interactive_console.h"
#include "local_session.h"
#include "mqtt_client.h"
#include "paste_client.h"
#include "process_supervisor.h"
#include "remote_session.h"
#include "rpc_server.h"
#include "terminal_key_source.h"
#include <cstdlib>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <pwd.h>
#include <stdexcept>
#include <unistd.h>

static std::string defaultSessionId() {
    const char* env = std::getenv("MTDA_SESSION");
    if (env && *env) {
        return env;
    }

    std::string user = "unknown";
    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_name) {
        user = pw->pw_name;
    } else if (const char* login = std::getenv("USER")) {
        user = login;
    }

    char host[256] = {0};
    if (gethostname(host, sizeof(host) - 1) != 0) {
        return user;
    }
    return user + "@" + host;
}

// Splits "host[:port]".
static bool parseEndpoint(const std::string& addr, int default_port, std::string& host, int& port) {
    host = addr;
    port = default_port;

    size_t colon = addr.rfind(':');
    if (colon == std::string::npos || addr.find(':') != colon) {
        return !host.empty();
    }
    host = addr.substr(0, colon);
    try {
        size_t used = 0;
        port = std::stoi(addr.substr(colon + 1), &used);
        if (used != addr.size() - colon - 1 || port <= 0 || port > 65535) {
            return false;
        }
    } catch (const std::logic_error&) {
        return false;
    }
    return !host.empty();
}

static int runDaemon(const ConfigManager& config, bool detach) {
    Agent agent;
    agent.configure(config);

    const int control_port = config.getControlPort();
    ProcessSupervisor supervisor(agent, [control_port](Agent& a) {
        return std::make_unique<RpcServer>(a, control_port);
    });
    if (!supervisor.startDaemon(ProcessSupervisor::DEFAULT_LOG_FILE,
                                ProcessSupervisor::DEFAULT_PID_FILE, detach)) {
        return 1;
    }

    MqttClient publisher(config.getBrokerHost("localhost"), config.getBrokerPort(),
                         "mtda-" + std::to_string(getpid()), config.getBrokerCaCert());
    if (publisher.connect()) {
        agent.setConsoleSink([&publisher](const std::string& data) {
            publisher.publishConsole(data);
        });
    } else {
        std::cerr << "[main] Console output will not be streamed" << std::endl;
    }

    int status = supervisor.serve();
    agent.setConsoleSink(nullptr);
    return status;
}

static int runClient(Session& session, const ConfigManager& config, const std::vector<std::string>& args) {
    PasteClient paste(config.getPastebinEndpoint(), config.getPastebinApiKey());

    CommandContext context{session, std::cout, std::cerr, nullptr};
    context.interactive = [&session, &paste]() {
        TerminalKeySource keys(STDIN_FILENO);
        InteractiveConsole console(session, keys, std::cout, [&paste](const std::string& text) {
            return paste.paste(text);
        });
        return console.run();
    };

    CommandRouter router(context);
    return router.dispatch(args);
}

int main(int argc, char** argv) {
    static const struct option long_options[] = {
        {"daemon", no_argument, nullptr, 'd'},
        {"no-detach", no_argument, nullptr, 'n'},
        {"remote", required_argument, nullptr, 'r'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    bool daemon = false;
    bool detach = true;
    std::string remote;

    int opt;
    while ((opt = getopt_long(argc, argv, "+dnr:h", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'd':
                daemon = true;
                break;
            case 'n':
                daemon = true;
                detach = false;
                break;
            case 'r':
                remote = optarg;
                break;
            case 'h':
                CommandRouter::printUsage(std::cout);
                return 0;
            default:
                CommandRouter::printUsage(std::cerr);
                return 1;
        }
    }
    std::vector<std::string> args(argv + optind, argv + argc);

    try {
        ConfigManager config;

        if (daemon) {
            return runDaemon(config, detach);
        }

        if (remote.empty()) {
            remote = config.getRemoteHost();
        }

        if (!remote.empty()) {
            std::string host;
            int port = 0;
            if (!parseEndpoint(remote, config.getControlPort(), host, port)) {
                std::cerr << "invalid remote address '" << remote << "'" << std::endl;
                return 1;
            }
            BrokerSettings broker{config.getBrokerHost(host), config.getBrokerPort(), config.getBrokerCaCert()};
            RemoteSession session(host, port, defaultSessionId(), broker);
            return runClient(session, config, args);
        }

        Agent agent;
        agent.configure(config);
        ProcessSupervisor supervisor(agent, nullptr);
        if (!supervisor.startForeground()) {
            std::cerr << "failed to start the agent" << std::endl;
            return 1;
        }

        int status;
        {
            LocalSession session(agent, defaultSessionId());
            status = runClient(session, config, args);
        }
        agent.stop();
        return status;

    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }
}
