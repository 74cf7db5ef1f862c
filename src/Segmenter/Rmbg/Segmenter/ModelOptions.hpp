/*
 * Rmbg Segmenter Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace Rmbg::Segmenter {

/**
 * @brief Describes an ncnn model pair and how to run it.
 *
 * With more than one output blob the logit field is the mean of all outputs.
 */
struct ModelOptions {
	std::filesystem::path paramPath;
	std::filesystem::path binPath;
	std::string inputBlob = "in0";
	std::vector<std::string> outputBlobs = {"out0"};
	std::size_t inputSize = 320;
	int numThreads = 1;
	bool useLocalPoolAllocator = true;
	bool lightMode = true;
};

} // namespace Rmbg::Segmenter
