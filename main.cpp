#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "app/GatewayApp.hpp"
#include "infrastructure/ConfigLoader.hpp"

using namespace promptwarden;

namespace {

void PrintUsage() {
    std::cerr <<
        "Usage: promptwarden [--config FILE] <command>\n"
        "\n"
        "Commands:\n"
        "  serve                                   Run the HTTP gateway (/api/query, /api/models)\n"
        "  ask <prompt> [--file PATH] [--type MEDIA] [--model NAME]\n"
        "                                          Run one guarded exchange and print the reply\n"
        "  models                                  List models known to the backend\n"
        "  redteam <prompts.json> [--out FILE]     Run attack prompts and write a CSV log\n";
}

struct CliArgs {
    std::string configPath;
    std::string command;
    std::vector<std::string> positional;
    std::string file;
    std::string type;
    std::string model;
    std::string out;
};

std::optional<CliArgs> ParseArgs(int argc, char** argv) {
    CliArgs args;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        auto takeValue = [&](std::string& target) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return false;
            }
            target = argv[++i];
            return true;
        };

        if (std::strcmp(arg, "--config") == 0) {
            if (!takeValue(args.configPath)) return std::nullopt;
        } else if (std::strcmp(arg, "--file") == 0) {
            if (!takeValue(args.file)) return std::nullopt;
        } else if (std::strcmp(arg, "--type") == 0) {
            if (!takeValue(args.type)) return std::nullopt;
        } else if (std::strcmp(arg, "--model") == 0) {
            if (!takeValue(args.model)) return std::nullopt;
        } else if (std::strcmp(arg, "--out") == 0) {
            if (!takeValue(args.out)) return std::nullopt;
        } else if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            return std::nullopt;
        } else if (args.command.empty()) {
            args.command = arg;
        } else {
            args.positional.push_back(arg);
        }
    }
    if (args.command.empty()) return std::nullopt;
    return args;
}

} // namespace

int main(int argc, char** argv) {
    auto args = ParseArgs(argc, argv);
    if (!args) {
        PrintUsage();
        return 1;
    }

    infrastructure::GatewayConfig config;
    try {
        auto path = infrastructure::ConfigLoader::ResolvePath(args->configPath);
        config = path ? infrastructure::ConfigLoader::Load(*path) : infrastructure::ConfigLoader::Defaults();
        infrastructure::ConfigLoader::ApplyEnvironment(config);
    } catch (const std::exception& e) {
        std::cerr << "[main] Configuration error: " << e.what() << std::endl;
        return 1;
    }

    app::GatewayApp gateway(std::move(config));
    if (!gateway.Init()) {
        return 1;
    }

    int rc = 1;
    if (args->command == "serve") {
        rc = gateway.Serve();
    } else if (args->command == "ask") {
        if (args->positional.empty() && args->file.empty()) {
            PrintUsage();
            return 1;
        }
        std::string prompt;
        for (const auto& word : args->positional) {
            if (!prompt.empty()) prompt += " ";
            prompt += word;
        }
        rc = gateway.Ask(prompt, args->file, args->type, args->model);
    } else if (args->command == "models") {
        rc = gateway.ListModels();
    } else if (args->command == "redteam") {
        if (args->positional.empty()) {
            PrintUsage();
            return 1;
        }
        rc = gateway.RedTeam(args->positional.front(), args->out);
    } else {
        std::cerr << "Unknown command: " << args->command << std::endl;
        PrintUsage();
    }

    gateway.Shutdown();
    return rc;
}
