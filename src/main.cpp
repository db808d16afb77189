/*
 * main.cpp - badgebaker command line tool
 * This file is part of BadgeBaker.
 * Copyright © 2026 The BadgeBaker Authors
 *
 * BadgeBaker is free software. You may redistribute and/or modify it under
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

#include "badgebaker.h"
#include <getopt.h>

using BadgeBaker::Baker::BakerOptions;
using BadgeBaker::Baker::DuplicatePolicy;
using BadgeBaker::PNG::PNGException;

namespace {

enum ExitStatus {
    EXIT_OK = 0,
    EXIT_USAGE = 1,
    EXIT_CODEC = 2,
    EXIT_NO_PAYLOAD = 3
};

struct CommandLine {
    std::string command;
    std::string config_file;
    std::string input;
    std::string payload_file;
    std::string output;
    std::string keyword;
    std::string debug_channels;
    std::string logfile;
    bool strict = false;
    bool replace = false;
};

void print_version() {
    std::cout << "badgebaker " << BADGEBAKER_VERSION << "\n"
              << "Embeds Open Badges assertions in PNG images." << std::endl;
}

void print_help() {
    std::cout << "Usage: badgebaker COMMAND [OPTION]...\n";
    std::cout << "Bake an Open Badges assertion into a PNG image, or extract one.\n\n";

    std::cout << "Commands:\n";
    std::cout << "  bake      -i IN.png -p PAYLOAD -o OUT.png\n";
    std::cout << "  unbake    -i IN.png [-o PAYLOAD]   (payload goes to stdout without -o)\n";
    std::cout << "  list      -i IN.png\n\n";

    std::cout << "Options:\n";
    std::cout << "  -h, --help              display this help and exit\n";
    std::cout << "  -v, --version           output version information and exit\n";
    std::cout << "  -c, --config=FILE       read settings from FILE (key=value)\n";
    std::cout << "  -i, --input=FILE        input PNG image\n";
    std::cout << "  -p, --payload=FILE      assertion to bake\n";
    std::cout << "  -o, --output=FILE       output file\n";
    std::cout << "  -k, --keyword=WORD      iTXt keyword (default: openbadges)\n";
    std::cout << "  -s, --strict            reject chunks with a bad CRC\n";
    std::cout << "  -r, --replace           replace an existing assertion instead of adding one\n";
    std::cout << "  -d, --debug=CHANNELS    enable debug output for specified channels\n";
    std::cout << "                          (comma-separated list or 'all')\n";
    std::cout << "  -l, --logfile=FILE      write debug output to specified file\n\n";

    std::cout << "Available debug channels:\n";
    std::cout << "  baker, cli, compression, config, png\n\n";

    std::cout << "Exit status: 0 success, 1 usage error, 2 codec failure,\n";
    std::cout << "3 no assertion found (unbake).\n";
}

std::vector<std::string> split_channels(const std::string& list) {
    std::vector<std::string> channels;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            channels.push_back(item);
        }
    }
    return channels;
}

std::vector<uint8_t> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open " + path);
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw std::runtime_error("Error reading " + path);
    }
    Debug::log("cli", "Read ", data.size(), " bytes from ", path);
    return data;
}

void write_file(const std::string& path, const uint8_t* data, size_t size) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot create " + path);
    }
    out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    if (!out) {
        throw std::runtime_error("Error writing " + path);
    }
    Debug::log("cli", "Wrote ", size, " bytes to ", path);
}

int run_bake(const BadgeBaker::Baker::BadgeBaker& baker, const CommandLine& cmd) {
    if (cmd.input.empty() || cmd.payload_file.empty() || cmd.output.empty()) {
        std::cerr << "badgebaker: bake needs --input, --payload and --output" << std::endl;
        return EXIT_USAGE;
    }
    std::vector<uint8_t> image = read_file(cmd.input);
    std::vector<uint8_t> payload = read_file(cmd.payload_file);
    std::vector<uint8_t> baked = baker.bake(image, std::string(payload.begin(), payload.end()));
    write_file(cmd.output, baked.data(), baked.size());
    return EXIT_OK;
}

int run_unbake(const BadgeBaker::Baker::BadgeBaker& baker, const CommandLine& cmd) {
    if (cmd.input.empty()) {
        std::cerr << "badgebaker: unbake needs --input" << std::endl;
        return EXIT_USAGE;
    }
    std::optional<std::string> payload = baker.unbake(read_file(cmd.input));
    if (!payload) {
        std::cerr << "badgebaker: no '" << baker.options().keyword << "' assertion in "
                  << cmd.input << std::endl;
        return EXIT_NO_PAYLOAD;
    }
    if (cmd.output.empty()) {
        std::cout << *payload << std::endl;
    } else {
        write_file(cmd.output, reinterpret_cast<const uint8_t*>(payload->data()), payload->size());
    }
    return EXIT_OK;
}

int run_list(const BadgeBaker::Baker::BadgeBaker& baker, const CommandLine& cmd) {
    if (cmd.input.empty()) {
        std::cerr << "badgebaker: list needs --input" << std::endl;
        return EXIT_USAGE;
    }
    for (const auto& info : baker.listChunks(read_file(cmd.input))) {
        std::cout << std::left << std::setw(6) << info.type << std::right
                  << " offset " << std::setw(10) << info.offset
                  << " length " << std::setw(10) << info.length
                  << " crc " << std::hex << std::setw(8) << std::setfill('0') << info.crc
                  << std::dec << std::setfill(' ')
                  << (info.crc_valid ? "" : " (bad crc)") << "\n";
    }
    std::cout.flush();
    return EXIT_OK;
}

} // namespace

int main(int argc, char *argv[]) {
    CommandLine cmd;

    if (argc < 2) {
        print_help();
        return EXIT_USAGE;
    }

    static const struct option long_options[] = {
        {"help", no_argument, 0, 'h'},
        {"version", no_argument, 0, 'v'},
        {"config", required_argument, 0, 'c'},
        {"input", required_argument, 0, 'i'},
        {"payload", required_argument, 0, 'p'},
        {"output", required_argument, 0, 'o'},
        {"keyword", required_argument, 0, 'k'},
        {"strict", no_argument, 0, 's'},
        {"replace", no_argument, 0, 'r'},
        {"debug", required_argument, 0, 'd'},
        {"logfile", required_argument, 0, 'l'},
        {0, 0, 0, 0}
    };

    // argv[1] is the command unless it is an option
    int first = 1;
    if (argv[1][0] != '-') {
        cmd.command = argv[1];
        first = 2;
    }

    optind = first;
    int opt;
    while ((opt = getopt_long(argc, argv, "hvc:i:p:o:k:srd:l:", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'h':
                print_help();
                return EXIT_OK;
            case 'v':
                print_version();
                return EXIT_OK;
            case 'c':
                cmd.config_file = optarg;
                break;
            case 'i':
                cmd.input = optarg;
                break;
            case 'p':
                cmd.payload_file = optarg;
                break;
            case 'o':
                cmd.output = optarg;
                break;
            case 'k':
                cmd.keyword = optarg;
                break;
            case 's':
                cmd.strict = true;
                break;
            case 'r':
                cmd.replace = true;
                break;
            case 'd':
                cmd.debug_channels = optarg;
                break;
            case 'l':
                cmd.logfile = optarg;
                break;
            case '?': // Invalid option
                return EXIT_USAGE; // getopt_long already prints an error message.
        }
    }

    if (optind < argc) {
        std::cerr << "badgebaker: unexpected argument '" << argv[optind] << "'" << std::endl;
        return EXIT_USAGE;
    }
    if (cmd.command != "bake" && cmd.command != "unbake" && cmd.command != "list") {
        std::cerr << "badgebaker: unknown command '" << cmd.command << "'" << std::endl;
        print_help();
        return EXIT_USAGE;
    }

    Debug::init(cmd.logfile, split_channels(cmd.debug_channels));

    int status = EXIT_OK;
    try {
        BakerOptions options;
        if (!cmd.config_file.empty()) {
            options = BakerOptions::fromFile(cmd.config_file);
        }
        if (!cmd.keyword.empty()) options.keyword = cmd.keyword;
        if (cmd.strict) options.verify_checksums = true;
        if (cmd.replace) options.duplicate_policy = DuplicatePolicy::Replace;

        BadgeBaker::Baker::BadgeBaker baker(options);
        Debug::log("cli", "Running '", cmd.command, "'");

        if (cmd.command == "bake") {
            status = run_bake(baker, cmd);
        } else if (cmd.command == "unbake") {
            status = run_unbake(baker, cmd);
        } else {
            status = run_list(baker, cmd);
        }
    } catch (const PNGException& e) {
        std::cerr << "badgebaker: " << e.getErrorName() << ": " << e.what() << std::endl;
        status = EXIT_CODEC;
    } catch (const std::runtime_error& e) {
        std::cerr << "badgebaker: " << e.what() << std::endl;
        status = EXIT_CODEC;
    }

    Debug::shutdown();
    return status;
}
