/*
 * Rmbg Logger Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstdio>
#include <mutex>
#include <source_location>
#include <span>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "ILogger.hpp"

namespace Rmbg::Logger {

/**
 * @brief Logger writing one line per message to stderr.
 *
 * Lines from concurrent callers never interleave.
 */
class ConsoleLogger final : public ILogger {
public:
	explicit ConsoleLogger(std::string prefix, LogLevel minLevel = LogLevel::Info) noexcept
		: ILogger(minLevel),
		  prefix_(std::move(prefix))
	{
	}

	~ConsoleLogger() override = default;

protected:
	void log(LogLevel level, std::string_view message) const noexcept override
	{
		std::lock_guard<std::mutex> lock(writeMutex_);
		std::fprintf(stderr, "%.*s %.*s %.*s\n", static_cast<int>(prefix_.size()), prefix_.data(),
			     static_cast<int>(levelName(level).size()), levelName(level).data(),
			     static_cast<int>(message.size()), message.data());
	}

	void log(LogLevel level, std::string_view name, std::source_location loc,
		 std::span<const LogField> context) const noexcept override
	{
		try {
			fmt::basic_memory_buffer<char, 4096> buffer;

			fmt::format_to(std::back_inserter(buffer), "name={}\tlocation={}:{}", name, loc.file_name(),
				       loc.line());
			for (const LogField &field : context) {
				fmt::format_to(std::back_inserter(buffer), "\t{}={}", field.key, field.value);
			}

			log(level, std::string_view(buffer.data(), buffer.size()));
		} catch (...) {
			log(level, "name=LoggerPanic");
		}
	}

private:
	const std::string prefix_;
	mutable std::mutex writeMutex_;
};

} // namespace Rmbg::Logger
