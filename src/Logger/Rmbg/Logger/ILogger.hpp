/*
 * Rmbg Logger Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <atomic>
#include <exception>
#include <initializer_list>
#include <iterator>
#include <source_location>
#include <span>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace Rmbg::Logger {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

struct LogField {
	std::string_view key;
	std::string_view value;
};

/**
 * @class ILogger
 * @brief A thread-safe, noexcept interface for polymorphic logging.
 *
 * All public logging methods are guaranteed not to throw. Messages below the
 * minimum level are dropped before any formatting takes place. If formatting
 * fails (e.g. std::bad_alloc), a fixed panic line is written instead.
 */
class ILogger {
public:
	explicit ILogger(LogLevel minLevel = LogLevel::Info) noexcept : minLevel_(minLevel) {}

	virtual ~ILogger() = default;

	ILogger(const ILogger &) = delete;
	ILogger &operator=(const ILogger &) = delete;
	ILogger(ILogger &&) = delete;
	ILogger &operator=(ILogger &&) = delete;

	template<typename... Args> void debug(fmt::format_string<Args...> fmt, Args &&...args) const noexcept
	{
		formatAndLog(LogLevel::Debug, fmt, std::forward<Args>(args)...);
	}

	template<typename... Args> void info(fmt::format_string<Args...> fmt, Args &&...args) const noexcept
	{
		formatAndLog(LogLevel::Info, fmt, std::forward<Args>(args)...);
	}

	template<typename... Args> void warn(fmt::format_string<Args...> fmt, Args &&...args) const noexcept
	{
		formatAndLog(LogLevel::Warn, fmt, std::forward<Args>(args)...);
	}

	template<typename... Args> void error(fmt::format_string<Args...> fmt, Args &&...args) const noexcept
	{
		formatAndLog(LogLevel::Error, fmt, std::forward<Args>(args)...);
	}

	void debug(std::string_view name, std::initializer_list<LogField> context,
		   std::source_location loc = std::source_location::current()) const noexcept
	{
		logEvent(LogLevel::Debug, name, loc, context);
	}

	void info(std::string_view name, std::initializer_list<LogField> context,
		  std::source_location loc = std::source_location::current()) const noexcept
	{
		logEvent(LogLevel::Info, name, loc, context);
	}

	void warn(std::string_view name, std::initializer_list<LogField> context,
		  std::source_location loc = std::source_location::current()) const noexcept
	{
		logEvent(LogLevel::Warn, name, loc, context);
	}

	void error(std::string_view name, std::initializer_list<LogField> context,
		   std::source_location loc = std::source_location::current()) const noexcept
	{
		logEvent(LogLevel::Error, name, loc, context);
	}

	/**
	 * @brief Logs an exception with context. Safe to call from within a catch block.
	 */
	void logException(const std::exception &e, std::string_view context) const noexcept
	{
		error("{}: {}", context, e.what());
	}

	bool isEnabled(LogLevel level) const noexcept
	{
		return static_cast<int>(level) >= static_cast<int>(minLevel_.load(std::memory_order_relaxed));
	}

	void setMinLevel(LogLevel level) noexcept { minLevel_.store(level, std::memory_order_relaxed); }

	static std::string_view levelName(LogLevel level) noexcept
	{
		switch (level) {
		case LogLevel::Debug:
			return "DEBUG";
		case LogLevel::Info:
			return "INFO";
		case LogLevel::Warn:
			return "WARN";
		case LogLevel::Error:
			return "ERROR";
		default:
			return "UNKNOWN";
		}
	}

protected:
	virtual void log(LogLevel level, std::string_view message) const noexcept = 0;
	virtual void log(LogLevel level, std::string_view name, std::source_location loc,
			 std::span<const LogField> context) const noexcept = 0;

private:
	template<typename... Args>
	void formatAndLog(LogLevel level, fmt::format_string<Args...> fmt, Args &&...args) const noexcept
	{
		if (!isEnabled(level)) {
			return;
		}

		try {
			fmt::basic_memory_buffer<char, 4096> buffer;
			fmt::vformat_to(std::back_inserter(buffer), fmt, fmt::make_format_args(args...));
			log(level, {buffer.data(), buffer.size()});
		} catch (...) {
			log(LogLevel::Error, "LOGGER PANIC OCCURRED");
		}
	}

	void logEvent(LogLevel level, std::string_view name, std::source_location loc,
		      std::initializer_list<LogField> context) const noexcept
	{
		if (isEnabled(level)) {
			log(level, name, loc, std::span<const LogField>(context.begin(), context.size()));
		}
	}

	std::atomic<LogLevel> minLevel_;
};

} // namespace Rmbg::Logger
