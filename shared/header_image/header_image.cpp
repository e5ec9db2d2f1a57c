// Shared header_image implementation
#include "header_image.hpp"
#include "util/ImageOps.hpp"

#include <opencv2/opencv.hpp>

using namespace cv;

namespace
{
    inline int interpolationFor(const Size &from, const Size &to)
    {
        return (static_cast<double>(to.width) * to.height < static_cast<double>(from.width) * from.height)
            ? INTER_AREA : INTER_LANCZOS4;
    }

    // IMREAD_IGNORE_ORIENTATION: ratio and pixels follow the stored layout, not EXIF rotation
    Mat readImage(const std::string &path)
    {
        return imread(path, IMREAD_COLOR | IMREAD_IGNORE_ORIENTATION);
    }

    bool writeImage(const char *who, const std::string &path, const Mat &img)
    {
        bool ok = false;
        try { ok = imwrite(path, img); }
        catch (const cv::Exception &e) { std::cerr << "[" << who << "] " << e.what() << "\n"; }
        if (!ok) std::cerr << "[" << who << "] cannot write: " << path << "\n";
        return ok;
    }
}

bool queryRatio(const std::string &inPath, double &ratio)
{
    Mat img;
    try { img = readImage(inPath); }
    catch (const cv::Exception &e) { std::cerr << "[queryRatio] " << e.what() << "\n"; }
    if (img.empty()) { std::cerr << "[queryRatio] cannot open: " << inPath << "\n"; return false; }
    ratio = static_cast<double>(img.cols) / img.rows;
    return true;
}

bool reportRatio(double ratio, const std::string &expectedPrefix, std::ostream &out)
{
    const std::string text = util::formatRatio(ratio);
    if (util::ratioInSpec(text, expectedPrefix)) return true;
    out << "Ratio is out of spec: ratio=" << text << "\n";
    return false;
}

bool resizeImage(const std::string &inPath, const std::string &outPath, int longestSide)
{
    Mat resized;
    try
    {
        Mat img = readImage(inPath);
        if (img.empty()) { std::cerr << "[resizeImage] cannot open: " << inPath << "\n"; return false; }

        Size target = util::fitLongestSide(img.size(), longestSide);
        if (target.empty()) { std::cerr << "[resizeImage] invalid size: " << longestSide << "\n"; return false; }

        if (target == img.size()) resized = img;
        else resize(img, resized, target, 0, 0, interpolationFor(img.size(), target));
    }
    catch (const cv::Exception &e)
    {
        std::cerr << "[resizeImage] " << e.what() << "\n";
        return false;
    }
    return writeImage("resizeImage", outPath, resized);
}

bool applyBorder(const std::string &path, int shave, int border, const std::string &hexColor)
{
    Scalar color;
    if (!util::parseHexColor(hexColor, color)) { std::cerr << "[applyBorder] bad color: " << hexColor << "\n"; return false; }

    Mat framed;
    try
    {
        Mat img = readImage(path);
        if (img.empty()) { std::cerr << "[applyBorder] cannot open: " << path << "\n"; return false; }
        framed = util::shaveAndBorder(img, shave, border, color);
    }
    catch (const cv::Exception &e)
    {
        std::cerr << "[applyBorder] " << e.what() << "\n";
        return false;
    }
    return writeImage("applyBorder", path, framed);
}

bool renderHeaderImage(const std::string &inPath, const std::string &outPath,
                       const HeaderSettings &settings, std::ostream &out)
{
    double ratio = 0.0;
    if (!queryRatio(inPath, ratio)) return false;
    reportRatio(ratio, settings.expectedRatio, out);

    if (!resizeImage(inPath, outPath, settings.longestSide)) return false;
    return applyBorder(outPath, settings.shave, settings.border, settings.borderColor);
}
