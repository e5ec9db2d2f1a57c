/**
 * @file HeaderSettings.hpp
 * Fixed parameters of the header image pipeline. The CLI may override them.
 */
#pragma once
#include <string>

struct HeaderSettings
{
    std::string expectedRatio {"2.6"};   // prefix the width/height text must start with
    int longestSide {1200};
    int shave {5};
    int border {5};
    std::string borderColor {"#8F3D3A"};
    bool verbose {false};
};
