#pragma once
#include <opencv2/opencv.hpp>
#include <string>

namespace util {

// Parse "#RRGGBB" or "RRGGBB" into an OpenCV BGR scalar
bool parseHexColor(const std::string& hex, cv::Scalar& bgr);

// Ratio as text, general format with 6 significant digits (13/5 -> "2.6")
std::string formatRatio(double ratio);

bool ratioInSpec(const std::string& ratioText, const std::string& expectedPrefix);

// Scale so the larger side becomes longestSide, keeping the aspect ratio
cv::Size fitLongestSide(const cv::Size& src, int longestSide);

// Crop `shave` px from every edge, then pad `border` px of a solid color.
// Throws cv::Exception when the shave leaves no interior or the result overflows int.
cv::Mat shaveAndBorder(const cv::Mat& img, int shave, int border, const cv::Scalar& color);

}
