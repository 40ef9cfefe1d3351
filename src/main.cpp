#include <iostream>
#include <vector>
#include <string>
#include <core/config.hpp>
#include <core/constants.hpp>
#include "cli/solo_cli.hpp"
#include "cli/theme.hpp"

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    solo status"
              << theme::color::RESET << theme::color::DIM
              << "                 Check whether an instance is running" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    solo hold"
              << theme::color::RESET << theme::color::DIM
              << "                   Claim the instance lock until Ctrl-C" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    solo run -- "
              << theme::color::RESET << theme::color::BROWN << "<cmd...>"
              << theme::color::RESET << theme::color::DIM
              << "      Run a command as the only instance" << theme::color::RESET << "\n";
    std::cout << theme::section("Options");
    std::cout << theme::color::DIM
              << "    --config <file>             Load settings from a YAML file\n"
              << "    --strategy <s>              auto, byte-range or pid\n"
              << "    --data-dir <dir>            Where the lock file and log live\n"
              << "    --version                   Show version\n"
              << "    --help                      Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);

        std::string config_path;
        std::string strategy;
        std::string data_dir;
        size_t i = 0;
        for (; i < args.size(); ++i) {
            const std::string& a = args[i];
            if (a == "--version") {
                std::cout << theme::color::BLUE << theme::color::BOLD << "solo"
                          << theme::color::RESET << theme::color::DIM
                          << " version " << SOLO_VERSION << theme::color::RESET << "\n";
                return 0;
            } else if (a == "--help" || a == "-h") {
                print_usage();
                return 0;
            } else if (a == "--config" || a == "--strategy" || a == "--data-dir") {
                if (i + 1 >= args.size()) {
                    std::cout << theme::fail("Missing value for " + a);
                    return 1;
                }
                std::string& target = a == "--config" ? config_path
                                    : a == "--strategy" ? strategy : data_dir;
                target = args[++i];
            } else {
                break;
            }
        }

        if (i >= args.size()) {
            print_usage();
            return 1;
        }

        auto loaded = config_path.empty() ? Config::load() : Config::load_file(config_path);
        if (loaded.is_err()) {
            std::cout << theme::fail(loaded.error);
            return 1;
        }
        Config config = loaded.value;
        if (!strategy.empty()) {
            auto s = parse_lock_strategy(strategy);
            if (s.is_err()) {
                std::cout << theme::fail(s.error);
                return 1;
            }
            config.set_strategy(s.value);
        }
        if (!data_dir.empty()) config.set_data_dir(data_dir);

        SoloCLI cli(config);
        std::string cmd = args[i++];

        if (cmd == "status") {
            return cli.run_status();
        } else if (cmd == "hold") {
            return cli.run_hold();
        } else if (cmd == "run") {
            if (i < args.size() && args[i] == "--") ++i;
            return cli.run_command(std::vector<std::string>(args.begin() + i, args.end()));
        }

        std::cout << theme::fail("Unknown command: " + cmd);
        print_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
