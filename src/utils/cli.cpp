#include "utils/cli.h"
#include "utils/version.h"
#include <cstring>
#include <sstream>
#include <stdexcept>

namespace hostgate {

namespace {

void appendOptions(std::ostringstream& oss) {
    oss << "OPTIONS:\n";
    oss << "    --model <ID>                 Model identifier (MODEL_ID)\n";
    oss << "    --tokenizer <ID>             Tokenizer override (TOKENIZER)\n";
    oss << "    --instance-type <TYPE>       Instance type (INSTANCE_TYPE, default: ml.g6.4xlarge)\n";
    oss << "    --host <HOST>                Bind address (API_HOST, default: 0.0.0.0)\n";
    oss << "    --port <PORT>                Server port (API_PORT, default: 8000)\n";
    oss << "    --log-level <LEVEL>          trace|debug|info|warn|error|critical|off\n";
    oss << "    --served-model-name <NAMES>  Comma-separated served model aliases\n";
    oss << "    --engine-url <URL>           Attach to a running engine server\n";
    oss << "    -h, --help                   Print help\n";
    oss << "    -V, --version                Print version information\n";
}

void appendEnvironment(std::ostringstream& oss) {
    oss << "ENVIRONMENT VARIABLES:\n";
    oss << "    MODEL_ID                        Model identifier (required)\n";
    oss << "    TOKENIZER                       Tokenizer override\n";
    oss << "    INSTANCE_TYPE                   Instance type (default: ml.g6.4xlarge)\n";
    oss << "    API_HOST                        Bind address (default: 0.0.0.0)\n";
    oss << "    API_PORT                        Server port (default: 8000)\n";
    oss << "    HOSTGATE_LOG_LEVEL              Log level (default: info)\n";
    oss << "    UVICORN_LOG_LEVEL               Deprecated alias of HOSTGATE_LOG_LEVEL\n";
    oss << "    HOSTGATE_LOG_FILE               JSON lines log file (optional)\n";
    oss << "    HOSTGATE_HTTP_THREADS           HTTP worker threads (default: 512)\n";
    oss << "    SERVED_MODEL_NAME               Comma-separated served model aliases\n";
    oss << "    ENGINE_URL                      Attach to a running engine server\n";
    oss << "    ENGINE_COMMAND                  Engine launcher (default: vllm serve)\n";
    oss << "    ENGINE_PORT                     Loopback port of a launched engine (default: 8081)\n";
    oss << "    ENGINE_STARTUP_TIMEOUT_SECONDS  Engine readiness wait (default: 1800)\n";
}

CliResult failWith(const std::string& message) {
    CliResult result;
    result.should_exit = true;
    result.exit_code = 1;
    result.output = "Error: " + message + "\n\n" + getServeHelpMessage();
    return result;
}

bool isFlag(const char* arg, const char* shortName, const char* longName) {
    return std::strcmp(arg, shortName) == 0 || std::strcmp(arg, longName) == 0;
}

bool parsePortArg(const std::string& value, int& out) {
    try {
        size_t idx = 0;
        int v = std::stoi(value, &idx);
        if (idx != value.size() || v <= 0 || v > 65535) {
            return false;
        }
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

// Parses serve options starting at argv[start]. Returns false on error.
bool parseServeOptions(int argc, char* argv[], int start, ServeOptions& opts, std::string& error) {
    for (int i = start; i < argc; ++i) {
        const std::string arg = argv[i];
        auto takeValue = [&](std::optional<std::string>& slot) {
            if (i + 1 >= argc) {
                error = arg + " requires a value";
                return false;
            }
            slot = argv[++i];
            return true;
        };

        if (arg == "--port") {
            if (i + 1 >= argc) {
                error = "--port requires a value";
                return false;
            }
            int port = 0;
            if (!parsePortArg(argv[++i], port)) {
                error = std::string("invalid port: ") + argv[i];
                return false;
            }
            opts.port = port;
        } else if (arg == "--host") {
            if (!takeValue(opts.host)) return false;
        } else if (arg == "--model") {
            if (!takeValue(opts.model)) return false;
        } else if (arg == "--tokenizer") {
            if (!takeValue(opts.tokenizer)) return false;
        } else if (arg == "--instance-type") {
            if (!takeValue(opts.instance_type)) return false;
        } else if (arg == "--served-model-name") {
            if (!takeValue(opts.served_model_name)) return false;
        } else if (arg == "--log-level") {
            if (!takeValue(opts.log_level)) return false;
        } else if (arg == "--engine-url") {
            if (!takeValue(opts.engine_url)) return false;
        } else {
            error = "unknown option: " + arg;
            return false;
        }
    }
    return true;
}

}  // namespace

std::string getHelpMessage() {
    std::ostringstream oss;
    oss << "hostgate " << HOSTGATE_VERSION << " - inference engine hosting gateway\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    hostgate [serve] [OPTIONS]\n";
    oss << "\n";
    oss << "COMMANDS:\n";
    oss << "    serve      Start the server (foreground, default)\n";
    oss << "\n";
    appendOptions(oss);
    oss << "\n";
    oss << "Command line options override the environment.\n";
    oss << "Run 'hostgate serve --help' for the environment variables.\n";
    return oss.str();
}

std::string getServeHelpMessage() {
    std::ostringstream oss;
    oss << "hostgate serve - Start the server\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    hostgate serve [OPTIONS]\n";
    oss << "\n";
    appendOptions(oss);
    oss << "\n";
    appendEnvironment(oss);
    return oss.str();
}

std::string getVersionMessage() {
    std::ostringstream oss;
    oss << "hostgate " << HOSTGATE_VERSION << "\n";
    return oss.str();
}

CliResult parseCliArgs(int argc, char* argv[]) {
    CliResult result;

    if (argc < 2) {
        result.subcommand = Subcommand::None;
        return result;
    }

    const char* command = argv[1];

    if (isFlag(command, "-h", "--help")) {
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getHelpMessage();
        return result;
    }
    if (isFlag(command, "-V", "--version")) {
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getVersionMessage();
        return result;
    }

    int options_start = 1;
    if (std::strcmp(command, "serve") == 0) {
        result.subcommand = Subcommand::Serve;
        options_start = 2;
    } else if (command[0] != '-') {
        result.should_exit = true;
        result.exit_code = 1;
        std::ostringstream oss;
        oss << "Unknown command: " << command << "\n\n";
        oss << getHelpMessage();
        result.output = oss.str();
        return result;
    }

    for (int i = options_start; i < argc; ++i) {
        if (isFlag(argv[i], "-h", "--help")) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getServeHelpMessage();
            return result;
        }
        if (isFlag(argv[i], "-V", "--version")) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getVersionMessage();
            return result;
        }
    }

    std::string error;
    if (!parseServeOptions(argc, argv, options_start, result.serve_options, error)) {
        return failWith(error);
    }
    return result;
}

void applyServeOptions(const ServeOptions& options, DeploymentParams& params) {
    if (options.model) params.model_id = *options.model;
    if (options.tokenizer) {
        if (options.tokenizer->empty()) {
            params.tokenizer.reset();
        } else {
            params.tokenizer = *options.tokenizer;
        }
    }
    if (options.instance_type) params.instance_type = *options.instance_type;
    if (options.host) params.host = *options.host;
    if (options.port) params.port = *options.port;
    if (options.log_level) params.log_level = *options.log_level;
    if (options.served_model_name) {
        params.served_model_names = splitServedModelNames(*options.served_model_name);
    }
    if (options.engine_url) params.engine_url = *options.engine_url;
}

std::string subcommandToString(Subcommand subcommand) {
    switch (subcommand) {
        case Subcommand::None: return "none";
        case Subcommand::Serve: return "serve";
        default: return "unknown";
    }
}

}  // namespace hostgate
