/*
 * Rmbg Command Line Tool
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <filesystem>

#include <Rmbg/Image/Mask.hpp>
#include <Rmbg/Image/PackedImage.hpp>

namespace Rmbg::Cli {

/**
 * @brief Decodes any OpenCV-readable file into a BGRA image, keeping alpha when present.
 * @throw std::runtime_error
 */
Image::PackedImage readImage(const std::filesystem::path &path);

/**
 * @throw std::runtime_error
 */
void writeImage(const std::filesystem::path &path, const Image::PackedImage &image);

/**
 * @throw std::runtime_error
 */
void writeMask(const std::filesystem::path &path, const Image::Mask &mask);

} // namespace Rmbg::Cli
