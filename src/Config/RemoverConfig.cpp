/*
 * Rmbg Config Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "Rmbg/Config/RemoverConfig.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <string>
#include <vector>

#include <fmt/format.h>

#include <Rmbg/Core/Errors.hpp>

using Rmbg::Core::ConfigError;

namespace Rmbg::Config {

namespace {

void readFloatTriple(const YAML::Node &n, const char *name, std::array<float, 3> &out)
{
	if (!n) {
		return;
	}
	if (!n.IsSequence() || n.size() != 3) {
		throw ConfigError(fmt::format("{} must be a list of 3 numbers", name));
	}
	for (std::size_t i = 0; i < 3; ++i) {
		out[i] = n[i].as<float>();
	}
}

Image::ColorRGBA readColor(const YAML::Node &n)
{
	if (!n.IsSequence() || (n.size() != 3 && n.size() != 4)) {
		throw ConfigError("compositor.background must be [r, g, b] or [r, g, b, a]");
	}
	std::array<int, 4> c = {0, 0, 0, Image::kOpaque};
	for (std::size_t i = 0; i < n.size(); ++i) {
		c[i] = n[i].as<int>();
		if (c[i] < 0 || c[i] > 255) {
			throw ConfigError("compositor.background channels must be in [0, 255]");
		}
	}
	return {static_cast<std::uint8_t>(c[0]), static_cast<std::uint8_t>(c[1]), static_cast<std::uint8_t>(c[2]),
		static_cast<std::uint8_t>(c[3])};
}

void validate(const RemoverConfig &cfg)
{
	if (cfg.model.inputSize == 0) {
		throw ConfigError("model.input_size must be positive");
	}
	if (cfg.model.outputBlobs.empty()) {
		throw ConfigError("model.output_blobs must not be empty");
	}
	if (cfg.model.numThreads < 1) {
		throw ConfigError("model.threads must be at least 1");
	}
	for (float s : cfg.normalization.std) {
		if (!(s > 0.0f)) {
			throw ConfigError("normalization.std entries must be positive");
		}
	}
	if (cfg.crop.margin < 0) {
		throw ConfigError("crop.margin must not be negative");
	}
	if (cfg.crop.marginPercent < 0.0) {
		throw ConfigError("crop.margin_percent must not be negative");
	}
	if (cfg.poolMaxIdle == 0) {
		throw ConfigError("pool.max_idle must be positive");
	}
}

} // anonymous namespace

Logger::LogLevel parseLogLevel(const std::string &name)
{
	std::string lower = name;
	std::transform(lower.begin(), lower.end(), lower.begin(),
		       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

	if (lower == "debug")
		return Logger::LogLevel::Debug;
	if (lower == "info")
		return Logger::LogLevel::Info;
	if (lower == "warn" || lower == "warning")
		return Logger::LogLevel::Warn;
	if (lower == "error")
		return Logger::LogLevel::Error;
	throw ConfigError("unknown log level: " + name);
}

RemoverConfig RemoverConfig::load(const std::filesystem::path &path)
{
	if (!std::filesystem::exists(path)) {
		throw ConfigError("config file not found: " + path.string());
	}

	YAML::Node node;
	try {
		node = YAML::LoadFile(path.string());
	} catch (const YAML::Exception &e) {
		throw ConfigError(fmt::format("cannot parse {}: {}", path.string(), e.what()));
	}

	RemoverConfig cfg = fromYaml(node);

	const std::filesystem::path base = path.parent_path();
	if (!cfg.model.paramPath.empty() && cfg.model.paramPath.is_relative()) {
		cfg.model.paramPath = base / cfg.model.paramPath;
	}
	if (!cfg.model.binPath.empty() && cfg.model.binPath.is_relative()) {
		cfg.model.binPath = base / cfg.model.binPath;
	}
	return cfg;
}

RemoverConfig RemoverConfig::fromYaml(const YAML::Node &node)
{
	RemoverConfig cfg;

	if (!node || node.IsNull()) {
		return cfg;
	}
	if (!node.IsMap()) {
		throw ConfigError("top level must be a mapping");
	}

	try {
		if (auto m = node["model"]) {
			if (m["param"]) {
				cfg.model.paramPath = m["param"].as<std::string>();
			}
			if (m["bin"]) {
				cfg.model.binPath = m["bin"].as<std::string>();
			}
			if (m["input_blob"]) {
				cfg.model.inputBlob = m["input_blob"].as<std::string>();
			}
			if (m["output_blobs"]) {
				cfg.model.outputBlobs = m["output_blobs"].as<std::vector<std::string>>();
			}
			if (m["input_size"]) {
				cfg.model.inputSize = m["input_size"].as<std::size_t>();
			}
			if (m["threads"]) {
				cfg.model.numThreads = m["threads"].as<int>();
			}
			if (m["local_pool_allocator"]) {
				cfg.model.useLocalPoolAllocator = m["local_pool_allocator"].as<bool>();
			}
			if (m["light_mode"]) {
				cfg.model.lightMode = m["light_mode"].as<bool>();
			}
		}

		if (auto n = node["normalization"]) {
			readFloatTriple(n["mean"], "normalization.mean", cfg.normalization.mean);
			readFloatTriple(n["std"], "normalization.std", cfg.normalization.std);
		}

		if (auto c = node["crop"]) {
			if (c["margin"]) {
				cfg.crop.margin = c["margin"].as<int>();
			}
			if (c["margin_percent"]) {
				cfg.crop.marginPercent = c["margin_percent"].as<double>();
			}
			if (c["min_threshold"]) {
				const int threshold = c["min_threshold"].as<int>();
				if (threshold < 0 || threshold > 255) {
					throw ConfigError("crop.min_threshold must be in [0, 255]");
				}
				cfg.crop.minThreshold = static_cast<std::uint8_t>(threshold);
			}
			if (c["square"]) {
				cfg.crop.squareCrop = c["square"].as<bool>();
			}
		}

		if (auto p = node["pool"]) {
			if (p["max_idle"]) {
				cfg.poolMaxIdle = p["max_idle"].as<std::size_t>();
			}
		}

		if (auto c = node["compositor"]) {
			if (c["workers"]) {
				cfg.compositorWorkers = c["workers"].as<std::size_t>();
			}
			if (c["background"]) {
				cfg.background = readColor(c["background"]);
			}
		}

		if (node["log_level"]) {
			cfg.logLevel = parseLogLevel(node["log_level"].as<std::string>());
		}
	} catch (const YAML::Exception &e) {
		throw ConfigError(e.what());
	}

	validate(cfg);
	return cfg;
}

} // namespace Rmbg::Config
