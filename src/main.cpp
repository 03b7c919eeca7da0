#include "trm/loader.hpp"
#include "trm/machine.hpp"
#include "trm/model.hpp"
#include "trm/report.hpp"

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

void PrintUsage(const char* prog) {
  std::cerr << "TRM - Turing Machine Simulator\n\n";
  std::cerr << "Usage: " << prog << " [options] <model-file>\n";
  std::cerr << "\nOptions:\n";
  std::cerr << "  -e <format>   Model format: json, yaml, toml (default: from extension)\n";
  std::cerr << "  -i <string>   Input string (default: one line from stdin)\n";
  std::cerr << "  -n <steps>    Stop after this many steps\n";
  std::cerr << "  -v            Verbose output, print every step\n";
  std::cerr << "  --dump        Print the normalized model and exit\n";
}

int main(int argc, char* argv[]) {
  if (argc < 2) {
    PrintUsage(argv[0]);
    return 1;
  }

  std::string model_file;
  std::string format_name;
  std::optional<std::string> input;
  std::optional<std::int64_t> step_limit;
  bool verbose = false;
  bool dump = false;

  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "-e" && i + 1 < argc) {
        format_name = argv[++i];
      } else if (arg == "-i" && i + 1 < argc) {
        input = argv[++i];
      } else if (arg == "-n" && i + 1 < argc) {
        step_limit = std::stoll(argv[++i]);
      } else if (arg == "-v") {
        verbose = true;
      } else if (arg == "--dump") {
        dump = true;
      } else if (arg[0] != '-') {
        model_file = arg;
      } else {
        std::cerr << "Unknown option: " << arg << "\n";
        PrintUsage(argv[0]);
        return 1;
      }
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: Invalid number: " << e.what() << "\n";
    return 1;
  }

  if (model_file.empty()) {
    std::cerr << "Error: No model file specified\n";
    PrintUsage(argv[0]);
    return 1;
  }

  trm::Format format = trm::Format::kInferred;
  if (!format_name.empty()) {
    format = trm::FormatFromName(format_name);
    if (format == trm::Format::kInferred) {
      std::cerr << "Error: Unknown model format: " << format_name << "\n";
      return 1;
    }
  }

  try {
    if (verbose) std::cerr << "Loading " << model_file << "...\n";
    trm::Model model = trm::LoadModelFile(model_file, format);

    if (dump) {
      trm::CheckModel(model);
      std::cout << trm::ToJSON(model);
      return 0;
    }

    trm::Machine machine(std::move(model));

    if (!input) {
      std::string line;
      std::getline(std::cin, line);
      while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
      }
      input = line;
    }

    if (verbose) std::cerr << "Running on input: \"" << *input << "\"\n";
    machine.Input(*input);

    if (verbose) {
      std::cout << trm::FormatIdentifier(machine.CurrentIdentifier());
      while (!machine.Halted()) {
        if (step_limit && machine.steps() >= *step_limit) break;
        auto record = machine.Step();
        if (record) {
          std::cout << trm::FormatStep(*record) << "\n";
          std::cout << trm::FormatIdentifier(machine.CurrentIdentifier());
        }
      }
    }

    // Settles the step-limit status when the verbose loop stopped early
    trm::RunResult result = machine.Run(step_limit);

    if (!verbose) {
      std::cout << trm::FormatIdentifier(machine.CurrentIdentifier());
    }
    std::cout << trm::FormatResult(result);

    if (verbose) {
      std::cerr << "Stats:\n";
      std::cerr << "  States: " << machine.model().states.size() << "\n";
      size_t transitions = 0;
      for (const auto& state : machine.model().states) {
        transitions += state.transitions.size();
      }
      std::cerr << "  Transitions: " << transitions << "\n";
      std::cerr << "  Final tape: " << machine.tape().Contents() << "\n";
    }

  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
