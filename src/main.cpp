#define _FILE_OFFSET_BITS 64

#include "gzinspect/inspector.hpp"
#include "gzinspect/progress_sinks.hpp"
#include "io/file_reader.hpp"
#include "system/signals.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"
#include "util/window_spec.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <unistd.h>

namespace {

enum : int {
    kOptNoProgress = 1000,
};

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [options] <file>\n"
        "\n"
        "Inspect the members of a (possibly concatenated) gzip file.\n"
        "\n"
        "Options:\n"
        "  -o, --output-format    human or json (default human)\n"
        "  -p, --preview          HEAD[:TAIL] preview lines of each chunk, e.g. '5:3'\n"
        "  -e, --encoding         Encoding for preview (default utf-8)\n"
        "  -c, --chunks           HEAD[:TAIL] chunks to display, e.g. '5:3'\n"
        "  -C, --config           JSON config file with defaults\n"
        "      --no-progress      Do not draw the progress bar\n"
        "  -v, --verbose          Debug logging\n"
        "  -q, --quiet            Only log errors\n"
        "  -h, --help             Show this help\n",
        argv);
}

} // namespace

int main(int argc, char **argv) {
    gzinspect::InstallSignalHandlers();

    const char *output_format = nullptr;
    const char *preview = nullptr;
    const char *chunks = nullptr;
    const char *config_path = nullptr;
    std::string encoding = "utf-8";
    std::optional<bool> progress_cli;
    std::optional<gzinspect::LogLevel> level_cli;

    static option long_opts[] = {
        {"output-format", required_argument, nullptr, 'o'},
        {"preview", required_argument, nullptr, 'p'},
        {"encoding", required_argument, nullptr, 'e'},
        {"chunks", required_argument, nullptr, 'c'},
        {"config", required_argument, nullptr, 'C'},
        {"no-progress", no_argument, nullptr, kOptNoProgress},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "ho:p:e:c:C:vq", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'o':
                output_format = optarg;
                break;

            case 'p':
                preview = optarg;
                break;

            case 'e':
                encoding = optarg;
                break;

            case 'c':
                chunks = optarg;
                break;

            case 'C':
                config_path = optarg;
                break;

            case kOptNoProgress:
                progress_cli = false;
                break;

            case 'v':
                level_cli = gzinspect::LogLevel::Debug;
                break;

            case 'q':
                level_cli = gzinspect::LogLevel::Error;
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (optind + 1 != argc) {
        PrintUsage(argv[0]);
        return 2;
    }
    const std::string path = argv[optind];

    gzinspect::config::InspectConfigFromFile cfg;
    if (config_path) {
        if (auto r = cfg.LoadFile(config_path); !r.ok) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            return 2;
        }
    }

    auto &logger = gzinspect::Logger::Instance();
    if (level_cli) {
        logger.SetLevel(*level_cli);
    } else if (cfg.log_level) {
        logger.SetLevel(*cfg.log_level);
    }

    gzinspect::InspectOptions opt;
    if (cfg.block_size) opt.scan.block_size = static_cast<std::size_t>(*cfg.block_size);
    if (cfg.max_member_bytes) opt.scan.max_member_bytes = static_cast<std::size_t>(*cfg.max_member_bytes);

    const std::string format_name = output_format ? output_format : cfg.output_format.value_or("human");
    auto format = gzinspect::ParseOutputFormat(format_name);
    if (!format) {
        std::fprintf(stderr, "Invalid --output-format: %s (expected human or json)\n", format_name.c_str());
        return 2;
    }
    opt.format = *format;
    if (preview) opt.preview = gzinspect::ParseWindowSpec(preview);
    if (chunks) opt.chunk_filter = gzinspect::ParseWindowSpec(chunks);
    opt.encoding = encoding;

    gzinspect::FileReader reader;
    if (auto r = gzinspect::FileReader::Open(path, reader); !r.ok) {
        std::fprintf(stderr, "Error: %s\n", r.msg.c_str());
        return 1;
    }

    std::unique_ptr<gzinspect::IProgress> progress;
    const bool want_progress = progress_cli.value_or(cfg.progress.value_or(true));
    if (want_progress && ::isatty(STDERR_FILENO)) {
        progress = std::make_unique<gzinspect::ConsoleProgressSink>();
    }

    gzinspect::Inspector inspector(opt, std::cout);
    const auto outcome = inspector.Run(reader, progress.get());

    if (outcome.error) {
        LogError("scan stopped after %zu chunks: %s", outcome.summary.total_chunks,
                 gzinspect::ToString(outcome.error->kind));
        std::fprintf(stderr, "Error: %s (offset %llu)\n", outcome.error->message.c_str(),
                     static_cast<unsigned long long>(outcome.error->offset));
        return 1;
    }
    if (outcome.cancelled) {
        return 130;
    }
    return 0;
}
