#include "app/runtime_runner.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <signal.h>

#include <argparse/argparse.hpp>

#include "app/parse_utils.hpp"
#include "dedupgen/baseline/baseline.hpp"
#include "dedupgen/core/error.hpp"
#include "dedupgen/generator/edit_generator.hpp"
#include "dedupgen/probe/compressibility.hpp"
#include "dedupgen/report/report.hpp"
#include "dedupgen/sink/hash_sink.hpp"
#include "dedupgen/source/byte_source.hpp"

namespace {

using Clock = std::chrono::steady_clock;

using AppError = dedupgen::Error;

template <typename T>
using Result = dedupgen::Expected<T>;

using dedupgen::CodecId;
using dedupgen::ErrorCode;
using dedupgen::ExhaustionPolicy;
using dedupgen::SelectorPolicy;
using dedupgen::app::Config;
using dedupgen::app::Mode;
using dedupgen::app::parse_size;

constexpr int kExitRunError = 1;
constexpr int kExitConfigError = 2;
constexpr int kExitInterrupted = 130;

std::atomic<bool> g_stop_requested{false};

void on_stop_signal(int) { g_stop_requested.store(true, std::memory_order_relaxed); }

void install_stop_handlers() {
  struct sigaction sa {};
  sa.sa_handler = on_stop_signal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  ::sigaction(SIGINT, &sa, nullptr);
  ::sigaction(SIGTERM, &sa, nullptr);
}

double seconds_since(Clock::time_point start) {
  return std::chrono::duration<double>(Clock::now() - start).count();
}

Result<Mode> parse_mode(const std::string& s) {
  if (s == "baseline") {
    return Mode::Baseline;
  }
  if (s == "derive") {
    return Mode::Derive;
  }
  return std::unexpected(AppError{ErrorCode::InvalidConfig, "invalid --mode"});
}

Result<SelectorPolicy> parse_policy(const std::string& s) {
  if (s == "balanced") {
    return SelectorPolicy::Balanced;
  }
  if (s == "cycle") {
    return SelectorPolicy::Cycle;
  }
  return std::unexpected(AppError{ErrorCode::InvalidConfig, "invalid --policy"});
}

Result<ExhaustionPolicy> parse_exhaustion(const std::string& s) {
  if (s == "pad") {
    return ExhaustionPolicy::Pad;
  }
  if (s == "stop") {
    return ExhaustionPolicy::Stop;
  }
  return std::unexpected(AppError{ErrorCode::InvalidConfig, "invalid --on-exhaustion"});
}

Result<CodecId> parse_codec(const std::string& s) {
  if (s == "none") {
    return CodecId::None;
  }
  if (s == "lz4") {
    return CodecId::Lz4;
  }
  if (s == "zstd") {
    return CodecId::Zstd;
  }
  return std::unexpected(AppError{ErrorCode::InvalidConfig, "invalid --probe"});
}

Result<uint64_t> parse_size_option(const argparse::ArgumentParser& program, const char* name) {
  auto v = parse_size(program.get<std::string>(name));
  if (!v) {
    return std::unexpected(AppError{ErrorCode::InvalidConfig,
                                    std::string(name) + ": " + v.error().message()});
  }
  return *v;
}

bool has_help_flag(int argc, char** argv) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      return true;
    }
  }
  return false;
}

void print_cli_help(const std::string& exe_path) {
  const std::string exe = exe_path.empty() ? "dedupgen" : exe_path;
  std::cout << "Usage:\n"
            << "  " << exe << " --mode baseline --output <path> --length <size> [options]\n"
            << "  " << exe << " --mode derive --input <path> --output <path> [options]\n\n"
            << "Sizes accept k, m and g suffixes (powers of 1024).\n\n"
            << "Baseline:\n"
            << "  --length <size>                 Baseline length; checked against --input in derive\n"
            << "  --seed <u64>                    Seed for baseline bytes and edit decisions (default: 1)\n\n"
            << "Edit sequence:\n"
            << "  --mean <size>                   Mean segment length (default: 512k)\n"
            << "  --ratio <double>                Target duplication ratio in (0,1) (default: 0.5)\n"
            << "  --delete-prob <double>          Per-step DELETE probability (default: 0.02)\n"
            << "  --policy <balanced|cycle>       Operation selector (default: balanced)\n"
            << "  --insert-mean <size>            Cycle policy INSERT mean, 0 for none (default: --mean)\n"
            << "  --delete-mean <size>            Cycle policy DELETE mean, 0 for none\n"
            << "                                  (default: --insert-mean)\n"
            << "  --max-segment <size>            Per-segment length cap (default: 64 x largest mean)\n"
            << "  --target-length <size>          Exact output length (default: until baseline ends)\n"
            << "  --on-exhaustion <pad|stop>      With --target-length, pad or stop when the\n"
            << "                                  baseline runs out (default: pad)\n\n"
            << "Output:\n"
            << "  --block-size <size>             I/O block size (default: 1m)\n"
            << "  --manifest <path>               Write per-segment CSV manifest\n"
            << "  --json <path>                   Write JSON summary to file\n"
            << "  --sync                          fdatasync the output before exit\n"
            << "  --quiet                         Do not print the summary\n\n"
            << "Compressibility probe:\n"
            << "  --probe <none|lz4|zstd>         Probe written files with a codec\n"
            << "  --probe-bytes <size>            Bytes sampled per file (default: 64m)\n"
            << "  --zstd-level <int>              Zstd level for the probe (default: 1)\n\n"
            << "Help:\n"
            << "  -h, --help                      Show this help and exit\n\n"
            << "Examples:\n"
            << "  " << exe << " --mode baseline --output oldfile.dat --length 1g\n"
            << "  " << exe << " --mode derive --input oldfile.dat --output newfile.dat --mean 512k\n";
}

void print_probe(const std::filesystem::path& path, const dedupgen::ProbeReport& r) {
  std::cout << "probe file=" << path.string() << " algo=" << dedupgen::codec_name(r.codec)
            << " blocks=" << r.blocks << " raw=" << r.raw_bytes << " comp=" << r.compressed_bytes
            << " CR=" << std::fixed << std::setprecision(4) << r.ratio() << "\n";
}

void maybe_probe(const Config& cfg, const std::filesystem::path& path) {
  if (!cfg.probe_enabled) {
    return;
  }
  auto source = dedupgen::make_file_source(path);
  const auto report = dedupgen::probe_compressibility(
      *source, dedupgen::CodecParams{cfg.probe, cfg.zstd_level}, cfg.probe_bytes,
      cfg.generator.io_block_size);
  print_probe(path, report);
}

Result<int> run_baseline(const Config& cfg) {
  try {
    dedupgen::BaselineConfig bc{};
    bc.length = *cfg.baseline_length;
    bc.seed = cfg.generator.seed;
    bc.io_block_size = cfg.generator.io_block_size;

    auto file = dedupgen::make_file_sink(dedupgen::FileSinkParams{cfg.output, true});
    dedupgen::HashSink sink(0, file.get());

    const auto start = Clock::now();
    const auto result = dedupgen::write_baseline(bc, sink, &g_stop_requested);
    if (cfg.sync) {
      sink.sync();
    }
    sink.close();
    const double wall = seconds_since(start);

    if (!cfg.quiet) {
      std::cout << "baseline bytes=" << result.bytes_written << " seed=" << bc.seed
                << " wall_sec=" << std::fixed << std::setprecision(3) << wall
                << " MiBps=" << dedupgen::to_mibps(result.bytes_written, wall)
                << " xxh64=" << dedupgen::format_digest(sink.digest()) << "\n";
    }
    if (result.cancelled) {
      std::cerr << "[warn] interrupted after " << result.bytes_written
                << " bytes; baseline is truncated\n";
      return kExitInterrupted;
    }
    maybe_probe(cfg, cfg.output);
  } catch (const dedupgen::Error& e) {
    return std::unexpected(e);
  }
  return 0;
}

Result<int> run_derive(Config cfg) {
  try {
    auto baseline = dedupgen::make_file_source(cfg.input);
    if (cfg.baseline_length.has_value() && *cfg.baseline_length != baseline->length()) {
      return std::unexpected(AppError{
          ErrorCode::InvalidConfig,
          "--length " + std::to_string(*cfg.baseline_length) + " does not match " +
              cfg.input.string() + " size " + std::to_string(baseline->length())});
    }
    cfg.generator.baseline_length = baseline->length();
    dedupgen::validate(cfg.generator);

    auto file = dedupgen::make_file_sink(dedupgen::FileSinkParams{cfg.output, true});
    dedupgen::HashSink sink(0, file.get());

    std::unique_ptr<dedupgen::ManifestWriter> manifest;
    if (cfg.manifest.has_value()) {
      manifest = std::make_unique<dedupgen::ManifestWriter>(*cfg.manifest);
    }

    dedupgen::EditSequenceGenerator gen(cfg.generator, *baseline, sink);
    gen.set_observer(manifest.get());

    const auto start = Clock::now();
    const auto summary = gen.run(&g_stop_requested);
    try {
      if (cfg.sync) {
        sink.sync();
      }
      sink.close();
      if (manifest) {
        manifest->close();
      }
    } catch (const dedupgen::Error& e) {
      throw gen.annotate(e);
    }

    dedupgen::RunInfo info{};
    info.wall_sec = seconds_since(start);
    info.output_digest = sink.digest();

    if (!cfg.quiet) {
      std::cout << dedupgen::format_summary_line(summary, info) << "\n"
                << dedupgen::format_length_stats(summary);
    }
    if (cfg.json_output.has_value()) {
      dedupgen::write_summary_json(*cfg.json_output, cfg.generator, summary, info);
    }
    if (cfg.generator.target_output_length.has_value() &&
        summary.state.bytes_emitted < *cfg.generator.target_output_length && !summary.cancelled) {
      std::cerr << "[warn] baseline exhausted at " << summary.state.bytes_emitted
                << " bytes, short of --target-length\n";
    }
    if (summary.cancelled) {
      std::cerr << "[warn] interrupted after " << summary.state.steps
                << " segments; derivative is truncated\n";
      return kExitInterrupted;
    }

    maybe_probe(cfg, cfg.input);
    maybe_probe(cfg, cfg.output);
  } catch (const dedupgen::Error& e) {
    return std::unexpected(e);
  }
  return 0;
}

}  // namespace

namespace dedupgen::app {

Expected<Config> parse_args(int argc, char** argv) {
  Config cfg{};

  argparse::ArgumentParser program("dedupgen", "1.0", argparse::default_arguments::none);
  program.add_argument("--mode").default_value(std::string("derive"));
  program.add_argument("--input").default_value(std::string(""));
  program.add_argument("--output").default_value(std::string(""));
  program.add_argument("--length");
  program.add_argument("--seed").scan<'u', uint64_t>().default_value(uint64_t{1});
  program.add_argument("--mean").default_value(std::string("512k"));
  program.add_argument("--ratio").scan<'g', double>().default_value(0.5);
  program.add_argument("--delete-prob").scan<'g', double>().default_value(0.02);
  program.add_argument("--policy").default_value(std::string("balanced"));
  program.add_argument("--insert-mean");
  program.add_argument("--delete-mean");
  program.add_argument("--max-segment").default_value(std::string("0"));
  program.add_argument("--target-length");
  program.add_argument("--on-exhaustion").default_value(std::string("pad"));
  program.add_argument("--block-size").default_value(std::string("1m"));
  program.add_argument("--manifest");
  program.add_argument("--json");
  program.add_argument("--sync").default_value(false).implicit_value(true);
  program.add_argument("--quiet").default_value(false).implicit_value(true);
  program.add_argument("--probe").default_value(std::string("none"));
  program.add_argument("--probe-bytes").default_value(std::string("64m"));
  program.add_argument("--zstd-level").scan<'i', int>().default_value(1);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << "\n";
    std::cerr << program;
    return std::unexpected(AppError{ErrorCode::InvalidConfig, "argument parsing failed"});
  }

  auto mode = parse_mode(program.get<std::string>("--mode"));
  if (!mode) {
    return std::unexpected(mode.error());
  }
  cfg.mode = *mode;

  cfg.input = program.get<std::string>("--input");
  cfg.output = program.get<std::string>("--output");
  if (cfg.output.empty()) {
    return std::unexpected(AppError{ErrorCode::InvalidConfig, "--output is required"});
  }
  if (cfg.mode == Mode::Derive && cfg.input.empty()) {
    return std::unexpected(AppError{ErrorCode::InvalidConfig, "--input is required for derive"});
  }

  if (const auto length = program.present("--length")) {
    auto v = parse_size(*length);
    if (!v) {
      return std::unexpected(v.error());
    }
    cfg.baseline_length = *v;
  } else if (cfg.mode == Mode::Baseline) {
    return std::unexpected(AppError{ErrorCode::InvalidConfig, "--length is required for baseline"});
  }

  auto& g = cfg.generator;
  g.seed = program.get<uint64_t>("--seed");
  g.target_duplication_ratio = program.get<double>("--ratio");
  g.delete_probability = program.get<double>("--delete-prob");

  auto mean = parse_size_option(program, "--mean");
  if (!mean) {
    return std::unexpected(mean.error());
  }
  g.mean_segment_length = *mean;

  if (program.is_used("--insert-mean")) {
    auto insert_mean = parse_size_option(program, "--insert-mean");
    if (!insert_mean) {
      return std::unexpected(insert_mean.error());
    }
    g.insert_mean_length = *insert_mean;
  }

  if (program.is_used("--delete-mean")) {
    auto delete_mean = parse_size_option(program, "--delete-mean");
    if (!delete_mean) {
      return std::unexpected(delete_mean.error());
    }
    g.delete_mean_length = *delete_mean;
  }

  auto max_segment = parse_size_option(program, "--max-segment");
  if (!max_segment) {
    return std::unexpected(max_segment.error());
  }
  g.max_segment_length = *max_segment;

  auto block = parse_size_option(program, "--block-size");
  if (!block) {
    return std::unexpected(block.error());
  }
  g.io_block_size = static_cast<size_t>(*block);

  auto policy = parse_policy(program.get<std::string>("--policy"));
  if (!policy) {
    return std::unexpected(policy.error());
  }
  g.selector = *policy;

  auto exhaustion = parse_exhaustion(program.get<std::string>("--on-exhaustion"));
  if (!exhaustion) {
    return std::unexpected(exhaustion.error());
  }
  g.on_exhaustion = *exhaustion;

  if (const auto target = program.present("--target-length")) {
    auto v = parse_size(*target);
    if (!v) {
      return std::unexpected(v.error());
    }
    g.target_output_length = *v;
  }

  if (const auto manifest = program.present("--manifest")) {
    cfg.manifest = std::filesystem::path(*manifest);
  }
  if (const auto json = program.present("--json")) {
    cfg.json_output = std::filesystem::path(*json);
  }
  cfg.sync = program.get<bool>("--sync");
  cfg.quiet = program.get<bool>("--quiet");

  auto codec = parse_codec(program.get<std::string>("--probe"));
  if (!codec) {
    return std::unexpected(codec.error());
  }
  cfg.probe = *codec;
  cfg.probe_enabled = program.is_used("--probe");
  cfg.zstd_level = program.get<int>("--zstd-level");
  auto probe_bytes = parse_size_option(program, "--probe-bytes");
  if (!probe_bytes) {
    return std::unexpected(probe_bytes.error());
  }
  cfg.probe_bytes = *probe_bytes;

  if (cfg.mode == Mode::Derive) {
    // baseline_length is taken from the input file later; validate the rest now.
    GeneratorConfig probe_cfg = g;
    probe_cfg.baseline_length = cfg.baseline_length.value_or(0);
    try {
      validate(probe_cfg);
    } catch (const Error& e) {
      return std::unexpected(e);
    }
  } else if (g.io_block_size == 0) {
    return std::unexpected(AppError{ErrorCode::InvalidConfig, "--block-size must be > 0"});
  }
  return cfg;
}

}  // namespace dedupgen::app

int run_cli_impl(int argc, char** argv) {
  if (has_help_flag(argc, argv)) {
    print_cli_help(argc > 0 ? std::string(argv[0]) : std::string("dedupgen"));
    return 0;
  }

  auto cfg = dedupgen::app::parse_args(argc, argv);
  if (!cfg) {
    std::cerr << "error: " << cfg.error().message() << "\n";
    return kExitConfigError;
  }

  install_stop_handlers();

  auto run = cfg->mode == Mode::Baseline ? run_baseline(*cfg) : run_derive(*cfg);
  if (!run) {
    std::cerr << "error: [" << dedupgen::error_code_name(run.error().code()) << "] "
              << run.error().message() << "\n";
    return run.error().code() == ErrorCode::InvalidConfig ? kExitConfigError : kExitRunError;
  }
  return *run;
}
