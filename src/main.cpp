#include <charconv>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

#include "common/diagnostic.h"
#include "harness/config.h"
#include "harness/harness.h"
#include "harness/observer.h"
#include "model/alu_model.h"
#include "model/alu_op.h"

namespace {

struct CliOptions {
  alucheck::HarnessConfig config;
  std::string observer = "model";
  std::string fault_op;
  bool werror = false;
  bool show_version = false;
  bool show_help = false;
};

void PrintVersion() {
  std::cout << "alucheck 0.1.0\n";
  std::cout << "ALU golden model and self-checking verification harness\n";
}

void PrintHelp() {
  PrintVersion();
  std::cout << "\nUsage: alucheck [options]\n\n"
            << "Options:\n"
            << "  --variant flat|mips     ALU control encoding (default flat)\n"
            << "  --width <n>             Operand width: 8, 16, 32 or 64\n"
            << "  --count <n>             Random transactions (default 20)\n"
            << "  --seed <n>              Random seed\n"
            << "  --report <file>         Write PASS/FAIL log to file\n"
            << "  --observer <name>       model or bitserial\n"
            << "  --inject-fault <op>     Flip result bit 0 for op\n"
            << "  --threaded              Run stages on worker threads\n"
            << "  --join drain|first-finish\n"
            << "  --channel-bound <n>     Stage channel depth (0: unbounded)\n"
            << "  --max-time <ms>         Maximum run time\n"
            << "  --grace <ms>            Flush period after the run ends\n"
            << "  -Werror                 Treat warnings as errors\n"
            << "  --version / --help      Info\n";
}

template <typename T>
bool ParseNumber(std::string_view text, T& out) {
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
  return ec == std::errc() && ptr == text.data() + text.size();
}

bool ParseMillis(std::string_view text, std::chrono::milliseconds& out) {
  int64_t ms = 0;
  if (!ParseNumber(text, ms)) return false;
  out = std::chrono::milliseconds(ms);
  return true;
}

bool TryParseNumericArg(std::string_view arg, std::string_view val,
                        CliOptions& opts, bool& ok) {
  auto& cfg = opts.config;
  if (arg == "--width") {
    ok = ParseNumber(val, cfg.width);
  } else if (arg == "--count") {
    ok = ParseNumber(val, cfg.count);
  } else if (arg == "--seed") {
    uint32_t seed = 0;
    ok = ParseNumber(val, seed);
    cfg.seed = seed;
  } else if (arg == "--channel-bound") {
    ok = ParseNumber(val, cfg.channel_bound);
  } else if (arg == "--max-time") {
    ok = ParseMillis(val, cfg.max_run);
  } else if (arg == "--grace") {
    ok = ParseMillis(val, cfg.grace);
  } else {
    return false;
  }
  return true;
}

bool TryParseValuedArg(std::string_view arg, int& i, int argc,
                       const char* const argv[], CliOptions& opts, bool& ok) {
  if (!arg.starts_with("--") || i + 1 >= argc) return false;
  std::string_view val = argv[i + 1];
  ok = true;
  if (TryParseNumericArg(arg, val, opts, ok)) {
    ++i;
  } else if (arg == "--variant") {
    ok = alucheck::ParseVariant(val, opts.config.variant);
    ++i;
  } else if (arg == "--join") {
    ok = alucheck::ParseJoinPolicy(val, opts.config.join);
    ++i;
  } else if (arg == "--report") {
    opts.config.report_path = std::string(val);
    ++i;
  } else if (arg == "--observer") {
    opts.observer = std::string(val);
    ++i;
  } else if (arg == "--inject-fault") {
    opts.fault_op = std::string(val);
    ++i;
  } else {
    return false;
  }
  if (!ok) std::cerr << "invalid value for " << arg << ": " << val << "\n";
  return true;
}

bool TryParseFlag(std::string_view arg, CliOptions& opts) {
  if (arg == "--version") {
    opts.show_version = true;
    return true;
  }
  if (arg == "--help") {
    opts.show_help = true;
    return true;
  }
  if (arg == "--threaded") {
    opts.config.mode = alucheck::PipelineMode::kThreaded;
    return true;
  }
  if (arg == "-Werror") {
    opts.werror = true;
    return true;
  }
  return false;
}

bool ParseArgs(int argc, char* argv[], CliOptions& opts) {
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (TryParseFlag(arg, opts)) {
      continue;
    }
    bool ok = true;
    if (TryParseValuedArg(arg, i, argc, argv, opts, ok)) {
      if (!ok) return false;
      continue;
    }
    std::cerr << "unknown option: " << arg << "\n";
    return false;
  }
  return true;
}

std::unique_ptr<alucheck::Observer> MakeObserver(
    const CliOptions& opts, const alucheck::AluModel& model,
    alucheck::DiagEngine& diag) {
  std::unique_ptr<alucheck::Observer> observer;
  if (opts.observer == "model") {
    observer = std::make_unique<alucheck::ModelObserver>(model);
  } else if (opts.observer == "bitserial") {
    observer = std::make_unique<alucheck::BitSerialObserver>();
  } else {
    diag.Error("cli", "unknown observer '" + opts.observer + "'");
    return nullptr;
  }
  if (opts.fault_op.empty()) return observer;

  alucheck::AluOp op;
  if (!alucheck::ParseOpName(opts.fault_op, op)) {
    diag.Error("cli", "unknown operation '" + opts.fault_op + "'");
    return nullptr;
  }
  return std::make_unique<alucheck::FaultInjectingObserver>(
      std::move(observer), op, alucheck::FaultKind::kFlip, 0);
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
  CliOptions opts;
  if (!ParseArgs(argc, argv, opts)) {
    return 1;
  }
  if (opts.show_version) {
    PrintVersion();
    return 0;
  }
  if (opts.show_help) {
    PrintHelp();
    return 0;
  }

  alucheck::DiagEngine diag;
  if (opts.werror) {
    diag.SetWarningsAsErrors(true);
  }

  auto model = alucheck::AluModel::Create(opts.config.variant,
                                          opts.config.width, diag);
  if (!model) {
    return 1;
  }
  auto observer = MakeObserver(opts, *model, diag);
  if (!observer) {
    return 1;
  }

  auto harness = alucheck::Harness::Create(opts.config, *observer, diag,
                                           std::cout);
  if (!harness) {
    return 1;
  }
  auto summary = harness->Run();
  return (summary.Green() && !diag.HasErrors()) ? 0 : 1;
}
