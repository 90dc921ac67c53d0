#include <iostream>
#include <vector>
#include <string>
#include <set>
#include <fmt/format.h>
#include "cli/theme.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <inputs/file_args.hpp>
#include <run/command.hpp>
#include <run/idempotency.hpp>

void print_usage() {
    std::cout << theme::section("Usage");
    std::cout << "    " << theme::blue("txrun run") << " -o <out> [-e <ext>]... [-c <config>] -- <command...>\n"
              << theme::dim("        Run a command producing <out>, skipped if <out> exists and is non-empty.\n"
                            "        Occurrences of <out> in the command are written in a transaction directory\n"
                            "        and moved into place only if the command succeeds.\n\n");
    std::cout << "    " << theme::blue("txrun check") << " <file>...\n"
              << theme::dim("        Exit 0 if every file exists and is non-empty, 1 otherwise.\n\n");
    std::cout << "    " << theme::blue("txrun inputs") << " <file>...\n"
              << theme::dim("        Expand VCF/BAM arguments and list files into concrete paths.\n\n");
    std::cout << theme::dim("    Options for run:\n"
                            "      -o, --out <path>      output file (required)\n"
                            "      -e, --ext <ext>       side file extension promoted with the output, e.g. .bai\n"
                            "      -c, --config <file>   YAML config (default ~/.txrun/config.yaml)\n"
                            "      -l, --log <file>      append log lines to this file\n"
                            "      -q, --quiet           do not echo command output to stderr\n\n"
                            "    txrun --version        Show version\n"
                            "    txrun --help           Show this help\n\n");
}

struct RunOptions {
    std::set<std::string> given;
    std::string out;
    std::vector<std::string> exts;
    std::string config;
    std::string log_file;
    bool quiet = false;
    std::vector<std::string> command;
};

static bool parse_run_options(int argc, char** argv, RunOptions& opts,
                              std::vector<std::string>& errors) {
    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        auto value = [&](const std::string& name) -> std::string {
            if (i + 1 >= argc) {
                errors.push_back("Option " + a + " requires a value");
                return "";
            }
            opts.given.insert(name);
            return argv[++i];
        };

        if (a == "--") {
            for (int j = i + 1; j < argc; j++) opts.command.push_back(argv[j]);
            if (!opts.command.empty()) opts.given.insert("command");
            break;
        } else if (a == "-o" || a == "--out") {
            opts.out = value("out");
        } else if (a == "-e" || a == "--ext") {
            std::string ext = value("ext");
            if (!ext.empty()) opts.exts.push_back(ext);
        } else if (a == "-c" || a == "--config") {
            opts.config = value("config");
        } else if (a == "-l" || a == "--log") {
            opts.log_file = value("log");
        } else if (a == "-q" || a == "--quiet") {
            opts.quiet = true;
        } else {
            errors.push_back("Unknown option: " + a);
        }
    }

    for (auto& msg : check_missing(opts.given, {"out", "command"})) {
        errors.push_back(msg);
    }
    return errors.empty();
}

static int cmd_run(int argc, char** argv) {
    RunOptions opts;
    std::vector<std::string> errors;
    if (!parse_run_options(argc, argv, opts, errors)) {
        std::cout << theme::fail(error_msg(errors));
        return 1;
    }

    auto cfg = opts.config.empty() ? load_default_config() : load_config(opts.config);
    if (cfg.is_err()) {
        std::cout << theme::fail(cfg.error);
        return 1;
    }
    RunnerConfig config = cfg.value;
    if (!opts.log_file.empty()) config.log.file = opts.log_file;
    if (opts.quiet) config.log.console = false;

    Logger logger(config.log);
    ProcessRunner runner(logger, config);
    CommandRunner commands(runner);

    auto result = commands.run_cmd(opts.out, join(opts.command, " "), opts.exts);
    if (result.is_err()) {
        std::cout << theme::fail(fmt::format("[{}] {}", error_kind_name(result.kind), result.error));
        return 1;
    }
    std::cout << result.value << "\n";
    return 0;
}

static int cmd_check(int argc, char** argv) {
    std::vector<std::string> files(argv + 2, argv + argc);
    if (files.empty()) {
        std::cout << theme::fail(error_msg({"Missing required option: file"}));
        return 1;
    }
    for (const auto& f : files) {
        bool done = !needs_run(f);
        std::cout << (done ? theme::ok(f) : theme::step(f + theme::dim("  needs run")));
    }
    return needs_run(files) ? 1 : 0;
}

static int cmd_inputs(int argc, char** argv) {
    std::vector<std::string> files(argv + 2, argv + argc);
    if (files.empty()) {
        std::cout << theme::fail(error_msg({"Missing required option: file"}));
        return 1;
    }
    auto by_type = vcf_bam_args(files);
    for (const auto& [type, paths] : by_type) {
        for (const auto& p : paths) {
            if (type == FileType::Missing) {
                std::cout << theme::fail("missing  " + p);
            } else {
                std::cout << theme::kv(file_type_name(type), p);
            }
        }
    }
    return by_type.count(FileType::Missing) ? 1 : 0;
}

int main(int argc, char** argv) {
    try {
        if (argc < 2) {
            print_usage();
            return 1;
        }

        std::string cmd = argv[1];
        if (cmd == "--version") {
            std::cout << theme::bold("txrun") << theme::dim(std::string(" version ") + TXRUN_VERSION) << "\n";
            return 0;
        } else if (cmd == "--help" || cmd == "-h") {
            print_usage();
            return 0;
        } else if (cmd == "run") {
            return cmd_run(argc, argv);
        } else if (cmd == "check") {
            return cmd_check(argc, argv);
        } else if (cmd == "inputs") {
            return cmd_inputs(argc, argv);
        }

        std::cout << theme::fail("Unknown command: " + cmd);
        print_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
