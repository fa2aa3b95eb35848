#include "utils/cli.h"

#include <cstring>
#include <sstream>

#include "utils/version.h"

namespace chatgw {

namespace {

bool hasHelpFlag(int argc, char* argv[], int start) {
    for (int i = start; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            return true;
        }
    }
    return false;
}

bool parsePort(const char* text, uint16_t& out) {
    try {
        size_t pos = 0;
        int v = std::stoi(text, &pos);
        if (text[pos] != '\0' || v <= 0 || v > 65535) return false;
        out = static_cast<uint16_t>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

CliResult errorResult(const std::string& message, const std::string& help) {
    CliResult result;
    result.should_exit = true;
    result.exit_code = 1;
    result.output = message + "\n\n" + help;
    return result;
}

// Parses serve options starting at argv[start]
CliResult parseServe(int argc, char* argv[], int start, Subcommand subcommand) {
    CliResult result;
    result.subcommand = subcommand;

    if (hasHelpFlag(argc, argv, start)) {
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getServeHelpMessage();
        return result;
    }

    for (int i = start; i < argc; ++i) {
        const bool has_value = i + 1 < argc;
        if (std::strcmp(argv[i], "--port") == 0 && has_value) {
            if (!parsePort(argv[++i], result.serve_options.port)) {
                return errorResult(std::string("Error: invalid port: ") + argv[i], getServeHelpMessage());
            }
        } else if (std::strcmp(argv[i], "--host") == 0 && has_value) {
            result.serve_options.host = argv[++i];
        } else if (std::strcmp(argv[i], "--upstream") == 0 && has_value) {
            result.serve_options.upstream = argv[++i];
        } else if (std::strcmp(argv[i], "--default-model") == 0 && has_value) {
            result.serve_options.default_model = argv[++i];
        } else {
            return errorResult(std::string("Unknown option: ") + argv[i], getServeHelpMessage());
        }
    }
    return result;
}

}  // namespace

std::string getHelpMessage() {
    std::ostringstream oss;
    oss << "chatgw " << CHATGW_VERSION << " - chat gateway for a local Ollama server\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    chatgw [COMMAND] [OPTIONS]\n";
    oss << "\n";
    oss << "COMMANDS:\n";
    oss << "    serve      Start the gateway (default)\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    -h, --help       Print help information\n";
    oss << "    -V, --version    Print version information\n";
    oss << "\n";
    oss << "Run 'chatgw serve --help' for more info.\n";
    return oss.str();
}

std::string getServeHelpMessage() {
    std::ostringstream oss;
    oss << "chatgw serve - Start the gateway\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    chatgw serve [OPTIONS]\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --port <PORT>            Listen port (default: 8080)\n";
    oss << "    --host <HOST>            Bind address (default: 127.0.0.1)\n";
    oss << "    --upstream <URL>         Ollama base URL (default: http://127.0.0.1:11434)\n";
    oss << "    --default-model <NAME>   Model used when a request names none (default: llama3:8b)\n";
    oss << "    -h, --help               Print help\n";
    oss << "\n";
    oss << "ENVIRONMENT VARIABLES:\n";
    oss << "    CHATGW_CONFIG                   Config file (default: ~/.chatgw/config.json)\n";
    oss << "    CHATGW_PORT                     Listen port\n";
    oss << "    CHATGW_BIND_ADDRESS             Bind address\n";
    oss << "    CHATGW_UPSTREAM_URL             Ollama base URL (fallback: OLLAMA_HOST)\n";
    oss << "    CHATGW_UPSTREAM_CHAT_PATH       Upstream chat path (default: /api/chat)\n";
    oss << "    CHATGW_UPSTREAM_CONNECT_TIMEOUT Connect timeout in seconds (default: 10)\n";
    oss << "    CHATGW_UPSTREAM_READ_TIMEOUT    Per-read idle timeout in seconds (default: 86400)\n";
    oss << "    CHATGW_UPSTREAM_TLS_VERIFY      Verify https upstream certificates (default: on)\n";
    oss << "    CHATGW_DEFAULT_MODEL            Default model\n";
    oss << "    CHATGW_STREAM_QUEUE_CAPACITY    Events buffered per stream (default: 16)\n";
    oss << "    CHATGW_WORKER_THREADS           Request workers, one per open stream (default: 64)\n";
    oss << "    CHATGW_GZIP                     Compress JSON responses (default: on)\n";
    oss << "    CHATGW_LOG_LEVEL                Log level (trace|debug|info|warn|error)\n";
    oss << "    CHATGW_LOG_DIR                  Log directory (default: ~/.chatgw/logs)\n";
    oss << "    CHATGW_LOG_RETENTION_DAYS       Log retention days (default: 7)\n";
    return oss.str();
}

std::string getVersionMessage() {
    std::ostringstream oss;
    oss << "chatgw " << CHATGW_VERSION << "\n";
    return oss.str();
}

CliResult parseCliArgs(int argc, char* argv[]) {
    if (argc < 2) {
        return CliResult{};
    }

    const char* command = argv[1];

    if (std::strcmp(command, "-h") == 0 || std::strcmp(command, "--help") == 0) {
        CliResult result;
        result.should_exit = true;
        result.output = getHelpMessage();
        return result;
    }

    if (std::strcmp(command, "-V") == 0 || std::strcmp(command, "--version") == 0) {
        CliResult result;
        result.should_exit = true;
        result.output = getVersionMessage();
        return result;
    }

    if (std::strcmp(command, "serve") == 0) {
        return parseServe(argc, argv, 2, Subcommand::Serve);
    }

    // Bare serve options: chatgw --port 9000
    if (std::strncmp(command, "--", 2) == 0) {
        return parseServe(argc, argv, 1, Subcommand::None);
    }

    return errorResult(std::string("Unknown command: ") + command, getHelpMessage());
}

std::string subcommandToString(Subcommand subcommand) {
    switch (subcommand) {
        case Subcommand::None: return "none";
        case Subcommand::Serve: return "serve";
    }
    return "unknown";
}

}  // namespace chatgw
