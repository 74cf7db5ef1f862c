/*
 * Rmbg Config Library
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

#include <yaml-cpp/yaml.h>

#include <Rmbg/Crop/CropConfig.hpp>
#include <Rmbg/Image/Color.hpp>
#include <Rmbg/Logger/ILogger.hpp>
#include <Rmbg/Segmenter/ModelOptions.hpp>
#include <Rmbg/Segmenter/Normalization.hpp>

namespace Rmbg::Config {

/**
 * @brief Every tunable of a BackgroundRemover and the command line front-end.
 *
 * YAML layout:
 *
 *   model:
 *     param: u2netp.param
 *     bin: u2netp.bin
 *     input_blob: in0
 *     output_blobs: [out0]
 *     input_size: 320
 *     threads: 4
 *     local_pool_allocator: true
 *     light_mode: true
 *   normalization:
 *     mean: [0.485, 0.456, 0.406]
 *     std: [0.229, 0.224, 0.225]
 *   crop:
 *     margin: 20
 *     margin_percent: 0.0
 *     min_threshold: 10
 *     square: false
 *   pool:
 *     max_idle: 8
 *   compositor:
 *     workers: 0
 *     background: [255, 255, 255]
 *   log_level: info
 */
struct RemoverConfig {
	Segmenter::ModelOptions model;
	Segmenter::NormalizationParams normalization;
	Crop::CropConfig crop = Crop::CropConfig::defaults();
	std::size_t poolMaxIdle = 8;
	std::size_t compositorWorkers = 0;
	Image::ColorRGBA background = Image::kWhite;
	Logger::LogLevel logLevel = Logger::LogLevel::Info;

	/**
	 * @brief Reads a YAML file. Relative model paths resolve against the file's directory.
	 * @throw Rmbg::Core::ConfigError
	 */
	static RemoverConfig load(const std::filesystem::path &path);

	/**
	 * @brief Absent keys keep their defaults.
	 * @throw Rmbg::Core::ConfigError
	 */
	static RemoverConfig fromYaml(const YAML::Node &node);
};

/**
 * @throw Rmbg::Core::ConfigError On an unknown level name.
 */
Logger::LogLevel parseLogLevel(const std::string &name);

} // namespace Rmbg::Config
