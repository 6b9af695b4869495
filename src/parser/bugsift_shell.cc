/*
 * Copyright (C) 2026 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <getopt.h>
#include <stdio.h>
#include <stdlib.h>

#include <optional>
#include <string>

#include "bugsift/base/logging.h"
#include "bugsift/base/status.h"
#include "bugsift/ext/base/status_macros.h"
#include "bugsift/ext/base/status_or.h"
#include "bugsift/ext/base/string_utils.h"
#include "bugsift/parser/basic_types.h"
#include "bugsift/parser/metrics.h"
#include "bugsift/parser/parse.h"

namespace bugsift {
namespace {

const char kUsage[] = R"(Usage: %s [options] --<input kind> FILE

Parses an Android diagnostic dump and prints a key=value summary.

Input kind (exactly one):
  --bugreport FILE             Full bugreport (dumpstate output).
  --logcat FILE                Logcat in the threadtime or time format.
  --monkey FILE                Output of a monkey run.
  --procrank FILE              Output of procrank.
Files may be gzip-compressed.

Options:
  --year YEAR                  Year of the logcat timestamps. Defaults to the
                               current year (bugreports use their header).
  --ring-buffer-size N         Logcat lines kept for preambles (default 500).
  --last-preamble-size N       Lines in the last preamble (default 15).
  --process-preamble-size N    Lines in the process preamble (default 15).
  -h, --help                   Prints this message.
)";

enum class InputKind {
  kNone = 0,
  kBugreport,
  kLogcat,
  kMonkey,
  kProcrank,
};

struct CommandLineOptions {
  InputKind kind = InputKind::kNone;
  std::string path;
  parser::Config config;
};

void PrintUsage(char** argv) {
  fprintf(stderr, kUsage, argv[0]);
}

base::StatusOr<size_t> ParseSize(const char* name, const char* value) {
  std::optional<int64_t> size = base::StringToInt64(value);
  if (!size || *size < 0)
    return base::ErrStatus("Invalid value for --%s: %s", name, value);
  return static_cast<size_t>(*size);
}

base::Status SetInput(CommandLineOptions* options,
                      InputKind kind,
                      const char* path) {
  if (options->kind != InputKind::kNone)
    return base::ErrStatus("Only one input file can be parsed at a time");
  options->kind = kind;
  options->path = path;
  return base::OkStatus();
}

base::StatusOr<CommandLineOptions> ParseCommandLineOptions(int argc,
                                                           char** argv) {
  enum LongOption {
    OPT_BUGREPORT = 1000,
    OPT_LOGCAT,
    OPT_MONKEY,
    OPT_PROCRANK,
    OPT_YEAR,
    OPT_RING_BUFFER_SIZE,
    OPT_LAST_PREAMBLE_SIZE,
    OPT_PROCESS_PREAMBLE_SIZE,
  };

  static const option long_options[] = {
      {"help", no_argument, nullptr, 'h'},
      {"bugreport", required_argument, nullptr, OPT_BUGREPORT},
      {"logcat", required_argument, nullptr, OPT_LOGCAT},
      {"monkey", required_argument, nullptr, OPT_MONKEY},
      {"procrank", required_argument, nullptr, OPT_PROCRANK},
      {"year", required_argument, nullptr, OPT_YEAR},
      {"ring-buffer-size", required_argument, nullptr, OPT_RING_BUFFER_SIZE},
      {"last-preamble-size", required_argument, nullptr,
       OPT_LAST_PREAMBLE_SIZE},
      {"process-preamble-size", required_argument, nullptr,
       OPT_PROCESS_PREAMBLE_SIZE},
      {nullptr, 0, nullptr, 0}};

  CommandLineOptions options;
  for (;;) {
    int option = getopt_long(argc, argv, "h", long_options, nullptr);
    if (option == -1)
      break;

    switch (option) {
      case OPT_BUGREPORT:
        RETURN_IF_ERROR(SetInput(&options, InputKind::kBugreport, optarg));
        break;
      case OPT_LOGCAT:
        RETURN_IF_ERROR(SetInput(&options, InputKind::kLogcat, optarg));
        break;
      case OPT_MONKEY:
        RETURN_IF_ERROR(SetInput(&options, InputKind::kMonkey, optarg));
        break;
      case OPT_PROCRANK:
        RETURN_IF_ERROR(SetInput(&options, InputKind::kProcrank, optarg));
        break;
      case OPT_YEAR: {
        std::optional<int32_t> year = base::StringToInt32(optarg);
        if (!year)
          return base::ErrStatus("Invalid value for --year: %s", optarg);
        options.config.logcat_year = *year;
        break;
      }
      case OPT_RING_BUFFER_SIZE: {
        ASSIGN_OR_RETURN(options.config.logcat_ring_buffer_size,
                         ParseSize("ring-buffer-size", optarg));
        break;
      }
      case OPT_LAST_PREAMBLE_SIZE: {
        ASSIGN_OR_RETURN(options.config.last_preamble_size,
                         ParseSize("last-preamble-size", optarg));
        break;
      }
      case OPT_PROCESS_PREAMBLE_SIZE: {
        ASSIGN_OR_RETURN(options.config.process_preamble_size,
                         ParseSize("process-preamble-size", optarg));
        break;
      }
      case 'h':
        PrintUsage(argv);
        exit(0);
      default:
        PrintUsage(argv);
        exit(1);
    }
  }

  if (optind < argc)
    return base::ErrStatus("Unexpected argument: %s", argv[optind]);
  if (options.kind == InputKind::kNone) {
    PrintUsage(argv);
    exit(1);
  }
  return options;
}

base::StatusOr<parser::Metrics> ParseInput(const CommandLineOptions& options) {
  switch (options.kind) {
    case InputKind::kBugreport: {
      ASSIGN_OR_RETURN(parser::BugreportItem bugreport,
                       parser::ParseBugreportFile(options.path, options.config));
      return parser::ToMetrics(bugreport);
    }
    case InputKind::kLogcat: {
      ASSIGN_OR_RETURN(parser::LogcatItem logcat,
                       parser::ParseLogcatFile(options.path, options.config));
      return parser::ToMetrics(logcat);
    }
    case InputKind::kMonkey: {
      ASSIGN_OR_RETURN(parser::MonkeyLogItem monkey_log,
                       parser::ParseMonkeyLogFile(options.path));
      return parser::ToMetrics(monkey_log);
    }
    case InputKind::kProcrank: {
      ASSIGN_OR_RETURN(parser::ProcrankItem procrank,
                       parser::ParseProcrankFile(options.path));
      parser::Metrics metrics;
      metrics["procrank_processes"] = std::to_string(procrank.rows.size());
      for (const auto& row : procrank.rows) {
        auto pss = row.second.stats_kb.find("pss");
        if (pss == row.second.stats_kb.end())
          continue;
        metrics["pss_kb." + row.second.process_name] =
            std::to_string(pss->second);
      }
      return metrics;
    }
    case InputKind::kNone:
      break;
  }
  BUGSIFT_FATAL("For GCC");
}

base::Status BugsiftMain(int argc, char** argv) {
  ASSIGN_OR_RETURN(CommandLineOptions options,
                   ParseCommandLineOptions(argc, argv));
  ASSIGN_OR_RETURN(parser::Metrics metrics, ParseInput(options));
  for (const auto& it : metrics)
    printf("%s=%s\n", it.first.c_str(), it.second.c_str());
  return base::OkStatus();
}

}  // namespace
}  // namespace bugsift

int main(int argc, char** argv) {
  auto status = bugsift::BugsiftMain(argc, argv);
  if (!status.ok()) {
    fprintf(stderr, "%s\n", status.c_message());
    return 1;
  }
  return 0;
}
