#include "orchestra/cli/commands.hpp"

#include <cstdlib>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <vector>

namespace {

using namespace orchestra::cli;

void print_usage(const char* prog) {
  std::println("Orchestra - A pipeline orchestrator for containerized tasks");
  std::println("Usage: {} <command> [OPTIONS]", prog);
  std::println("");
  std::println("Commands:");
  std::println("  validate <pipeline>    Check a pipeline file");
  std::println("  run <pipeline>         Submit a run and drive it to the end");
  std::println("  submit <pipeline>      Create a run for a serving process");
  std::println("  serve                  Drive every incomplete run");
  std::println("  status [run_id]        Show a run, or list recent runs");
  std::println("  cancel <run_id>        Request cancellation of a run");
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>    Config file (YAML)");
  std::println("  --db <file>            Database file (default: orchestra.db)");
  std::println("  -i, --input <k=v>      Pipeline input, repeatable (run, submit)");
  std::println("  --run-id <id>          Use this run id (run, submit)");
  std::println("  --memory               Keep state in memory (run)");
  std::println("  -d, --daemon           Run as daemon (serve)");
  std::println("  --log-file <file>      Log file (serve)");
  std::println("  -v, --version          Show version and exit");
  std::println("  -h, --help             Show this help message");
  std::println("");
  std::println("Examples:");
  std::println("  {} validate pipeline.yaml", prog);
  std::println("  {} run pipeline.yaml -i text=hello", prog);
  std::println("  {} serve -c orchestra.yaml", prog);
}

void print_version() {
  std::println("Orchestra v0.1.0");
}

struct Args {
  std::string command;
  std::string positional;
  CommonOptions common;
  std::vector<std::string> inputs;
  std::string run_id;
  std::optional<std::string> log_file;
  bool memory{false};
  bool daemon{false};
};

auto require_value(int& i, int argc, char* argv[], std::string_view flag)
    -> std::string {
  if (++i >= argc) {
    std::println(stderr, "Error: {} requires an argument", flag);
    std::exit(1);
  }
  return argv[i];
}

auto parse_args(int argc, char* argv[]) -> Args {
  Args args;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      args.common.config_file = require_value(i, argc, argv, "--config");
    } else if (arg == "--db") {
      args.common.db_file = require_value(i, argc, argv, "--db");
    } else if (arg == "-i" || arg == "--input") {
      args.inputs.push_back(require_value(i, argc, argv, "--input"));
    } else if (arg == "--run-id") {
      args.run_id = require_value(i, argc, argv, "--run-id");
    } else if (arg == "--log-file") {
      args.log_file = require_value(i, argc, argv, "--log-file");
    } else if (arg == "--memory") {
      args.memory = true;
    } else if (arg == "-d" || arg == "--daemon") {
      args.daemon = true;
    } else if (arg.starts_with("-")) {
      std::println(stderr, "Unknown option: {}", arg);
      print_usage(argv[0]);
      std::exit(1);
    } else if (args.command.empty()) {
      args.command = arg;
    } else if (args.positional.empty()) {
      args.positional = arg;
    } else {
      std::println(stderr, "Unexpected argument: {}", arg);
      std::exit(1);
    }
  }

  return args;
}

auto require_positional(const Args& args, std::string_view what) -> bool {
  if (args.positional.empty()) {
    std::println(stderr, "Error: {} requires {}", args.command, what);
    return false;
  }
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto args = parse_args(argc, argv);

  if (args.command.empty()) {
    print_usage(argv[0]);
    return 1;
  }

  if (args.command == "validate") {
    if (!require_positional(args, "a pipeline file")) return 1;
    return cmd_validate({.pipeline_file = args.positional});
  }
  if (args.command == "run") {
    if (!require_positional(args, "a pipeline file")) return 1;
    return cmd_run({.common = args.common,
                    .pipeline_file = args.positional,
                    .inputs = args.inputs,
                    .run_id = args.run_id,
                    .memory = args.memory});
  }
  if (args.command == "submit") {
    if (!require_positional(args, "a pipeline file")) return 1;
    return cmd_submit({.common = args.common,
                       .pipeline_file = args.positional,
                       .inputs = args.inputs,
                       .run_id = args.run_id});
  }
  if (args.command == "serve") {
    return cmd_serve({.common = args.common,
                      .daemon = args.daemon,
                      .log_file = args.log_file});
  }
  if (args.command == "status") {
    return cmd_status({.common = args.common, .run_id = args.positional});
  }
  if (args.command == "cancel") {
    if (!require_positional(args, "a run id")) return 1;
    return cmd_cancel({.common = args.common, .run_id = args.positional});
  }

  std::println(stderr, "Unknown command: {}", args.command);
  print_usage(argv[0]);
  return 1;
}
