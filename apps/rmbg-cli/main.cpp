/*
 * Rmbg Command Line Tool
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <cstdint>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include <Rmbg/Config/RemoverConfig.hpp>
#include <Rmbg/Core/Errors.hpp>
#include <Rmbg/Logger/ConsoleLogger.hpp>
#include <Rmbg/Masking/MaskGenerator.hpp>
#include <Rmbg/Pipeline/BackgroundRemover.hpp>
#include <Rmbg/Segmenter/NullSegmenter.hpp>

#include "ImageCodec.hpp"

namespace fs = std::filesystem;

using namespace Rmbg;

namespace {

enum class Command { Remove, Crop, Mask, AutoMask };

struct Options {
	Command command = Command::Remove;
	fs::path input;
	fs::path output;
	std::optional<fs::path> configPath;
	std::optional<fs::path> paramPath;
	std::optional<fs::path> binPath;
	std::optional<int> margin;
	std::optional<double> marginPercent;
	std::optional<int> minThreshold;
	bool square = false;
	bool verbose = false;
};

void printUsage(const char *argv0)
{
	std::fprintf(stderr,
		     "Usage: %s <remove|crop|mask|automask> <input> <output> [options]\n"
		     "\n"
		     "Commands:\n"
		     "  remove     composite the subject over the background color\n"
		     "  crop       crop to the subject found by the model\n"
		     "  mask       write the full-resolution subject mask\n"
		     "  automask   crop using alpha, background or edges; no model needed\n"
		     "\n"
		     "Options:\n"
		     "  --config FILE          YAML configuration\n"
		     "  --param FILE           ncnn .param file (overrides config)\n"
		     "  --bin FILE             ncnn .bin file (overrides config)\n"
		     "  --margin N             crop margin in pixels\n"
		     "  --margin-percent F     crop margin as a fraction of the subject size\n"
		     "  --min-threshold N      mask value counted as subject (0-255)\n"
		     "  --square               expand the crop to a square\n"
		     "  --verbose              debug logging\n",
		     argv0);
}

Command parseCommand(std::string_view name)
{
	if (name == "remove")
		return Command::Remove;
	if (name == "crop")
		return Command::Crop;
	if (name == "mask")
		return Command::Mask;
	if (name == "automask")
		return Command::AutoMask;
	throw std::invalid_argument(fmt::format("unknown command: {}", name));
}

Options parseOptions(int argc, char **argv)
{
	if (argc < 4) {
		throw std::invalid_argument("expected a command, an input and an output");
	}

	Options options;
	options.command = parseCommand(argv[1]);
	options.input = argv[2];
	options.output = argv[3];

	for (int i = 4; i < argc; ++i) {
		const std::string_view arg = argv[i];
		auto value = [&]() -> std::string {
			if (i + 1 >= argc) {
				throw std::invalid_argument(fmt::format("{} needs a value", arg));
			}
			return argv[++i];
		};

		if (arg == "--config") {
			options.configPath = value();
		} else if (arg == "--param") {
			options.paramPath = value();
		} else if (arg == "--bin") {
			options.binPath = value();
		} else if (arg == "--margin") {
			options.margin = std::stoi(value());
		} else if (arg == "--margin-percent") {
			options.marginPercent = std::stod(value());
		} else if (arg == "--min-threshold") {
			options.minThreshold = std::stoi(value());
		} else if (arg == "--square") {
			options.square = true;
		} else if (arg == "--verbose") {
			options.verbose = true;
		} else {
			throw std::invalid_argument(fmt::format("unknown option: {}", arg));
		}
	}
	return options;
}

Config::RemoverConfig buildConfig(const Options &options)
{
	Config::RemoverConfig config =
		options.configPath ? Config::RemoverConfig::load(*options.configPath) : Config::RemoverConfig{};

	if (options.paramPath)
		config.model.paramPath = *options.paramPath;
	if (options.binPath)
		config.model.binPath = *options.binPath;
	if (options.margin) {
		if (*options.margin < 0) {
			throw std::invalid_argument("--margin must not be negative");
		}
		config.crop.margin = *options.margin;
	}
	if (options.marginPercent) {
		if (*options.marginPercent < 0.0) {
			throw std::invalid_argument("--margin-percent must not be negative");
		}
		config.crop.marginPercent = *options.marginPercent;
	}
	if (options.minThreshold) {
		if (*options.minThreshold < 0 || *options.minThreshold > 255) {
			throw std::invalid_argument("--min-threshold must be in [0, 255]");
		}
		config.crop.minThreshold = static_cast<std::uint8_t>(*options.minThreshold);
	}
	if (options.square)
		config.crop.squareCrop = true;
	if (options.verbose)
		config.logLevel = Logger::LogLevel::Debug;
	return config;
}

int run(const Options &options, const std::shared_ptr<Logger::ConsoleLogger> &logger)
{
	Config::RemoverConfig config = buildConfig(options);
	logger->setMinLevel(config.logLevel);

	const Image::PackedImage image = Cli::readImage(options.input);
	logger->info("Read {} ({}x{})", options.input.string(), image.getWidth(), image.getHeight());

	if (options.command == Command::AutoMask) {
		const Pipeline::BackgroundRemover remover(
			logger, std::make_unique<Segmenter::NullSegmenter>(config.model.inputSize), config);
		const Image::PackedImage cropped = remover.smartCropFromMask(image, Masking::autoMask, config.crop);
		Cli::writeImage(options.output, cropped);
	} else {
		const std::unique_ptr<Pipeline::BackgroundRemover> remover =
			Pipeline::BackgroundRemover::create(logger, config);

		switch (options.command) {
		case Command::Remove:
			Cli::writeImage(options.output, remover->removeBackground(image));
			break;
		case Command::Crop:
			Cli::writeImage(options.output, remover->smartCrop(image));
			break;
		case Command::Mask:
			Cli::writeMask(options.output, remover->predictFullMask(image));
			break;
		default:
			break;
		}
	}

	logger->info("Wrote {}", options.output.string());
	return 0;
}

} // anonymous namespace

int main(int argc, char **argv)
{
	auto logger = std::make_shared<Logger::ConsoleLogger>("[rmbg]");

	Options options;
	try {
		options = parseOptions(argc, argv);
	} catch (const std::exception &e) {
		logger->logException(e, "Invalid arguments");
		printUsage(argv[0]);
		return 2;
	}

	try {
		return run(options, logger);
	} catch (const Core::NoObjectDetectedError &e) {
		logger->logException(e, "Nothing to crop");
		return 3;
	} catch (const std::exception &e) {
		logger->logException(e, "Failed");
		return 1;
	}
}
