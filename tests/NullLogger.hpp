/*
 * Rmbg
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <Rmbg/Logger/ILogger.hpp>

class NullLogger final : public Rmbg::Logger::ILogger {
public:
	NullLogger() noexcept : ILogger(Rmbg::Logger::LogLevel::Error) {}

protected:
	void log(Rmbg::Logger::LogLevel, std::string_view) const noexcept override {}

	void log(Rmbg::Logger::LogLevel, std::string_view, std::source_location,
		 std::span<const Rmbg::Logger::LogField>) const noexcept override
	{
	}
};
