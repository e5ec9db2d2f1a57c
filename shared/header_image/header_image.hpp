/*========================  header_image.hpp  ========================

   Interface for the header-image utility.
   --------------------------------------------------------------------
   • ratio check, resize, shave + border, and the driver that chains them
   • callable from the CLI and the tests alike
   • no OpenCV headers leak into dependers

=====================================================================*/
#pragma once
#include <iostream>
#include <string>
#include "models/HeaderSettings.hpp"

/**
 * @brief Reads the image at inPath and stores width / height in ratio.
 * @return false if the file is missing, unreadable or not a supported image.
 */
bool queryRatio(const std::string &inPath, double &ratio);

/**
 * @brief Prints "Ratio is out of spec: ratio=<value>" to out unless the ratio
 *        text starts with expectedPrefix. Advisory only.
 * @return true when the ratio is in spec.
 */
bool reportRatio(double ratio, const std::string &expectedPrefix, std::ostream &out = std::cout);

/**
 * @brief Resizes inPath so its larger side equals longestSide and writes outPath,
 *        replacing any existing file. The format follows outPath's extension.
 */
bool resizeImage(const std::string &inPath, const std::string &outPath, int longestSide);

/**
 * @brief Shaves `shave` px from each edge of the image at path, adds a `border` px
 *        frame of hexColor, and rewrites path in place.
 */
bool applyBorder(const std::string &path, int shave, int border, const std::string &hexColor);

/**
 * @brief Runs ratio check, resize and border in order.
 *
 * @param inPath    Source image.
 * @param outPath   Destination, written by the resize and rewritten by the border step.
 * @param settings  Pipeline parameters.
 * @param out       Stream receiving the ratio warning.
 * @return true on success. A failed border step leaves the resized image at outPath.
 */
bool renderHeaderImage(const std::string &inPath,
                       const std::string &outPath,
                       const HeaderSettings &settings = HeaderSettings{},
                       std::ostream &out = std::cout);
