/*
 * Rmbg Core Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace Rmbg::Core {

/**
 * @brief No mask pixel reached the configured threshold.
 */
class NoObjectDetectedError : public std::runtime_error {
public:
	explicit NoObjectDetectedError(const std::string &message = "no object detected in image")
		: std::runtime_error(message)
	{
	}
};

/**
 * @brief The inference engine failed. Raised by segmenter adapters and never retried.
 */
class InferenceError : public std::runtime_error {
public:
	explicit InferenceError(const std::string &message) : std::runtime_error("inference failed: " + message) {}
};

/**
 * @brief A mask is empty or does not fit the image it is applied to.
 */
class InvalidMaskError : public std::invalid_argument {
public:
	explicit InvalidMaskError(const std::string &message) : std::invalid_argument("invalid mask: " + message) {}
};

class ConfigError : public std::runtime_error {
public:
	explicit ConfigError(const std::string &message) : std::runtime_error("config error: " + message) {}
};

} // namespace Rmbg::Core
