/*
 * main.cpp - DiagStream command line front end
 * This file is part of DiagStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * DiagStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Permission to use, copy, modify, and/or distribute this software for
 * any purpose with or without fee is hereby granted, provided that
 * the above copyright notice and this permission notice appear in all
 * copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL
 * WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE
 * AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL
 * DAMAGES OR ANY DAMAGES WHATSOEVER RESULTING FROM LOSS OF USE, DATA
 * OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER
 * TORTIOUS ACTION, ARISING OUT OF OR IN CONNECTION WITH THE USE OR
 * PERFORMANCE OF THIS SOFTWARE.
 */

#include "diagstream.h"
#include <getopt.h>

using DiagStream::Ingest::IngestConfig;
using DiagStream::Ingest::IngestionPipeline;
using DiagStream::Ingest::IngestBridge;

static void about_console()
{
    std::cout << "This is DiagStream version " DIAGSTREAM_VERSION ".\n"
                 "Reads cellular modem diagnostic captures (raw, .gz or .bz2) and\n"
                 "reports the HDLC frames they contain as JSON.\n"
                 "Maintainer: " DIAGSTREAM_MAINTAINER << std::endl;
}

static void usage(const char *progname)
{
    std::cerr << "Usage: " << progname << " [options] FILE...\n"
                 "       " << progname << " [options] --list DIR\n"
                 "\n"
                 "  -c, --config FILE      read key=value settings from FILE\n"
                 "  -m, --min-size SIZE    skip captures smaller than SIZE (default 20m)\n"
                 "  -s, --chunk-size N     read N bytes per chunk (default 4096)\n"
                 "  -C, --chain            read all FILEs as one continuous capture\n"
                 "  -e, --extension EXT    capture extension for --list (default .qmdl)\n"
                 "  -d, --debug CHANNELS   enable debug channels (comma separated, or \"all\")\n"
                 "  -l, --logfile FILE     write debug output to FILE instead of stderr\n"
                 "  -L, --list DIR         list captures in DIR\n"
                 "  -v, --version          print version information\n"
                 "  -h, --help             print this help\n";
}

// Print one outcome; returns the exit status it contributes
static int print_outcome(const DiagStream::Ingest::IngestOutcome& outcome)
{
    std::cout << DiagStream::JSON::JSONUtil::generateJSON(IngestBridge::outcomeToJSON(outcome), 2) << std::endl;
    return std::holds_alternative<DiagStream::Ingest::IngestReport>(outcome) ? 0 : 2;
}

int main(int argc, char *argv[]) {
    // Command line values are applied on top of the config file, whatever
    // order they were given in.
    std::string config_file;
    std::string list_directory;
    std::vector<std::pair<std::string, std::string>> overrides;

    static const struct option long_options[] = {
        {"config", required_argument, 0, 'c'},
        {"min-size", required_argument, 0, 'm'},
        {"chunk-size", required_argument, 0, 's'},
        {"chain", no_argument, 0, 'C'},
        {"extension", required_argument, 0, 'e'},
        {"debug", required_argument, 0, 'd'},
        {"logfile", required_argument, 0, 'l'},
        {"list", required_argument, 0, 'L'},
        {"version", no_argument, 0, 'v'},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "c:m:s:Ce:d:l:L:vh", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'c':
                config_file = optarg;
                break;
            case 'm':
                overrides.emplace_back("min_file_size", optarg);
                break;
            case 's':
                overrides.emplace_back("chunk_size", optarg);
                break;
            case 'C':
                overrides.emplace_back("chain_files", "true");
                break;
            case 'e':
                overrides.emplace_back("capture_extension", optarg);
                break;
            case 'd':
                overrides.emplace_back("debug_channels", optarg);
                break;
            case 'l':
                overrides.emplace_back("log_file", optarg);
                break;
            case 'L':
                list_directory = optarg;
                break;
            case 'v':
                about_console();
                return 0;
            case 'h':
                usage(argv[0]);
                return 0;
            case '?': // Invalid option
            default:
                return 1; // getopt_long already prints an error message.
        }
    }

    std::vector<std::string> files;
    for (int i = optind; i < argc; ++i) {
        files.push_back(argv[i]);
    }

    if (files.empty() && list_directory.empty()) {
        usage(argv[0]);
        return 1;
    }

    IngestConfig config;
    try {
        if (!config_file.empty()) {
            config.readConfigFile(config_file);
        }
        for (const auto& kv : overrides) {
            config.set(kv.first, kv.second);
        }
        config.validate();
    } catch (const std::exception& e) {
        std::cerr << argv[0] << ": " << e.what() << std::endl;
        return 1;
    }

    Debug::init(config.log_file, DiagStream::Core::Utility::splitList(config.debug_channels));

    DiagStream::Decoder::CommandCodeDecoder decoder;
    IngestionPipeline pipeline(decoder, config);
    IngestBridge bridge(pipeline);

    int status = 0;

    if (!list_directory.empty()) {
        std::cout << bridge.listCaptureFiles(list_directory, 2) << std::endl;
    }

    if (config.chain_files && !files.empty()) {
        status = print_outcome(pipeline.ingestFiles(files));
    } else {
        for (const auto& file : files) {
            status = std::max(status, print_outcome(pipeline.ingestFile(file)));
        }
    }

    Debug::shutdown();
    return status;
}
