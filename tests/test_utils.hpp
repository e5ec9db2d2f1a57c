// Fixture helpers shared by the unit tests. Images are written as PNG so
// pixel values survive the round trip through disk.
#pragma once

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <opencv2/opencv.hpp>

namespace test_utils {

inline std::filesystem::path fresh_dir(const std::string &name) {
    std::filesystem::path dir = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

inline std::string write_solid(const std::filesystem::path &dir, const std::string &file, int w, int h,
                               const cv::Scalar &bgr = cv::Scalar(255, 255, 255)) {
    const std::string path = (dir / file).string();
    cv::Mat img(h, w, CV_8UC3, bgr);
    cv::imwrite(path, img);
    return path;
}

// JPEG whose EXIF block says "rotate 90 CW" (orientation 6). The stored pixels stay w x h.
inline std::string write_rotated_jpeg(const std::filesystem::path &dir, const std::string &file, int w, int h) {
    std::vector<uchar> jpeg;
    cv::imencode(".jpg", cv::Mat(h, w, CV_8UC3, cv::Scalar(255, 255, 255)), jpeg);
    const std::vector<uchar> app1 = {
        0xFF, 0xE1, 0x00, 0x22,                    // APP1, length 34
        'E', 'x', 'i', 'f', 0x00, 0x00,
        'M', 'M', 0x00, 0x2A, 0x00, 0x00, 0x00, 0x08,  // big-endian TIFF, IFD0 at 8
        0x00, 0x01,                                // one entry
        0x01, 0x12, 0x00, 0x03, 0x00, 0x00, 0x00, 0x01, 0x00, 0x06, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00,                    // no next IFD
    };
    jpeg.insert(jpeg.begin() + 2, app1.begin(), app1.end());
    const std::string path = (dir / file).string();
    std::ofstream f(path, std::ios::binary);
    f.write(reinterpret_cast<const char *>(jpeg.data()), static_cast<std::streamsize>(jpeg.size()));
    return path;
}

// True if every pixel within `width` of the edge equals `expected`.
inline bool frame_is(const cv::Mat &img, int width, const cv::Vec3b &expected) {
    for (int y = 0; y < img.rows; ++y) {
        for (int x = 0; x < img.cols; ++x) {
            bool edge = x < width || y < width || x >= img.cols - width || y >= img.rows - width;
            if (edge && img.at<cv::Vec3b>(y, x) != expected) {
                return false;
            }
        }
    }
    return true;
}

}  // namespace test_utils
