//
// Main routine of the terminal host.
//
// Copyright (c) 2025 Serge Vakulenko
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.
//
#include <getopt.h>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>

#include "sdl_interface.h"

static void print_usage(const char *progname)
{
    std::cout << "Usage: " << progname << " [options]\n"
              << "Options:\n"
              << "  -s, --shell PATH      Shell to run (default " << DEFAULT_SHELL << ")\n"
              << "  -f, --font PATH       TrueType font file\n"
              << "  -p, --font-size N     Font size in points (default 16)\n"
              << "  -g, --geometry WxH    Window size in pixels (default 800x600)\n"
              << "  -d, --dpi N           Screen resolution for layout (default 300)\n"
              << "  -k, --keyboard        Reserve space for the on-screen keyboard\n"
              << "  -v, --verbose         Print session events\n"
              << "  -h, --help            Show this help\n";
}

// Parse a positive decimal number, or return -1.
static int parse_positive(const char *str)
{
    char *end;
    long value = std::strtol(str, &end, 10);
    if (end == str || *end != '\0' || value <= 0 || value > 100000)
        return -1;
    return static_cast<int>(value);
}

static bool parse_geometry(const char *str, int &width, int &height)
{
    int w, h;
    char tail;
    if (std::sscanf(str, "%dx%d%c", &w, &h, &tail) != 2 || w <= 0 || h <= 0)
        return false;
    width  = w;
    height = h;
    return true;
}

int main(int argc, char *argv[])
{
    static const struct option long_options[] = {
        { "shell", required_argument, nullptr, 's' },
        { "font", required_argument, nullptr, 'f' },
        { "font-size", required_argument, nullptr, 'p' },
        { "geometry", required_argument, nullptr, 'g' },
        { "dpi", required_argument, nullptr, 'd' },
        { "keyboard", no_argument, nullptr, 'k' },
        { "verbose", no_argument, nullptr, 'v' },
        { "help", no_argument, nullptr, 'h' },
        { nullptr, 0, nullptr, 0 },
    };

    HostOptions options;
    int opt;
    while ((opt = getopt_long(argc, argv, "s:f:p:g:d:kvh", long_options, nullptr)) != -1) {
        switch (opt) {
        case 's':
            options.shell = optarg;
            break;
        case 'f':
            options.font_path = optarg;
            break;
        case 'p':
            options.font_size = parse_positive(optarg);
            if (options.font_size < 0) {
                std::cerr << "Invalid font size: " << optarg << std::endl;
                return 1;
            }
            break;
        case 'g':
            if (!parse_geometry(optarg, options.width, options.height)) {
                std::cerr << "Invalid geometry: " << optarg << std::endl;
                return 1;
            }
            break;
        case 'd':
            options.dpi = parse_positive(optarg);
            if (options.dpi < 0) {
                std::cerr << "Invalid dpi: " << optarg << std::endl;
                return 1;
            }
            break;
        case 'k':
            options.show_keyboard = true;
            break;
        case 'v':
            options.verbose = true;
            break;
        case 'h':
            print_usage(argv[0]);
            return 0;
        default:
            print_usage(argv[0]);
            return 1;
        }
    }
    if (optind < argc) {
        std::cerr << "Unexpected argument: " << argv[optind] << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    try {
        SdlInterface host(options);
        host.run();
    } catch (const std::exception &e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
