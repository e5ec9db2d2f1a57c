// CLI for preparing header images: ratio check, resize, shave + border
// Build via CMake target: header_image

#include "header_image.hpp"
#include "models/HeaderSettings.hpp"

#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <string>

static void usage(const char* prog)
{
    std::cerr << "Usage: " << prog << " <in> <out> [--ratio 2.6] [--size 1200] [--shave 5]"
              << " [--border 5] [--color #8F3D3A] [--verbose]\n";
}

// Larger values only serve to exhaust memory
static constexpr int kMaxPixels = 65535;

static int parsePixels(const std::string& flag, const std::string& value)
{
    std::size_t pos = 0;
    int v = std::stoi(value, &pos);
    if (pos != value.size()) throw std::invalid_argument(flag + " expects a whole number, got " + value);
    if (v < 0 || v > kMaxPixels)
        throw std::out_of_range(flag + " must be between 0 and " + std::to_string(kMaxPixels));
    return v;
}

int main(int argc, char** argv)
{
    if (argc < 3)
    {
        usage(argv[0]);
        return 1;
    }
    std::string inP  = argv[1];
    std::string outP = argv[2];

    HeaderSettings settings;
    try
    {
        for (int i = 3; i < argc; ++i)
        {
            std::string arg = argv[i];
            if (arg == "--verbose") { settings.verbose = true; continue; }
            if (i + 1 >= argc) throw std::invalid_argument("missing value for " + arg);
            if (arg == "--ratio") settings.expectedRatio = argv[++i];
            else if (arg == "--size") settings.longestSide = parsePixels(arg, argv[++i]);
            else if (arg == "--shave") settings.shave = parsePixels(arg, argv[++i]);
            else if (arg == "--border") settings.border = parsePixels(arg, argv[++i]);
            else if (arg == "--color") settings.borderColor = argv[++i];
            else throw std::invalid_argument("unknown option " + arg);
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << "Bad arguments: " << e.what() << "\n";
        usage(argv[0]);
        return 1;
    }
    if (settings.longestSide == 0) { std::cerr << "--size must be positive\n"; return 1; }

    if (!renderHeaderImage(inP, outP, settings)) return 1;
    if (settings.verbose) std::cout << "Saved to " << outP << "\n";
    return 0;
}
