#include "util/ImageOps.hpp"
#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdint>
#include <cmath>
#include <cstdio>
#include <sstream>

namespace util {

bool parseHexColor(const std::string& hex, cv::Scalar& bgr)
{
    std::string digits = (!hex.empty() && hex[0] == '#') ? hex.substr(1) : hex;
    if (digits.size() != 6) return false;
    if (!std::all_of(digits.begin(), digits.end(), [](unsigned char c){ return std::isxdigit(c) != 0; }))
        return false;
    unsigned int r, g, b;
    if (std::sscanf(digits.c_str(), "%02x%02x%02x", &r, &g, &b) != 3) return false;
    bgr = cv::Scalar(b, g, r); // OpenCV uses BGR
    return true;
}

std::string formatRatio(double ratio)
{
    std::ostringstream os;
    os.precision(6);
    os << ratio;
    return os.str();
}

bool ratioInSpec(const std::string& ratioText, const std::string& expectedPrefix)
{
    return ratioText.compare(0, expectedPrefix.size(), expectedPrefix) == 0;
}

cv::Size fitLongestSide(const cv::Size& src, int longestSide)
{
    if (src.width <= 0 || src.height <= 0 || longestSide <= 0) return cv::Size();
    double scale = static_cast<double>(longestSide) / std::max(src.width, src.height);
    if (src.width >= src.height)
    {
        int h = static_cast<int>(std::lround(src.height * scale));
        return cv::Size(longestSide, std::max(1, h));
    }
    int w = static_cast<int>(std::lround(src.width * scale));
    return cv::Size(std::max(1, w), longestSide);
}

cv::Mat shaveAndBorder(const cv::Mat& img, int shave, int border, const cv::Scalar& color)
{
    const int64_t s = std::max(0, shave);
    const int64_t b = std::max(0, border);
    const int64_t innerW = img.cols - 2 * s;
    const int64_t innerH = img.rows - 2 * s;
    if (innerW <= 0 || innerH <= 0)
        CV_Error(cv::Error::StsBadArg, "shave geometry does not contain image");
    if (innerW + 2 * b > INT_MAX || innerH + 2 * b > INT_MAX)
        CV_Error(cv::Error::StsOutOfRange, "bordered image too large");

    cv::Mat inner = img(cv::Rect(static_cast<int>(s), static_cast<int>(s),
                                 static_cast<int>(innerW), static_cast<int>(innerH)));
    cv::Mat out;
    cv::copyMakeBorder(inner, out, static_cast<int>(b), static_cast<int>(b),
                       static_cast<int>(b), static_cast<int>(b), cv::BORDER_CONSTANT, color);
    return out;
}

}
