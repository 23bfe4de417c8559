#pragma once

#ifndef MQ_LOGGER_HPP
#define MQ_LOGGER_HPP

#include <iostream>
#include <optional>
#include <string_view>

#include <spdlog/spdlog.h>
#include <spdlog/async.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace mq {

class logger
{
public:
	explicit logger(logger const& other) = delete;
	explicit logger(logger&& other) = delete;

	static logger& get()
	{
		static logger logger_{};
		return logger_;
	}

	enum class level
	{
		trace,
		debug,
		info,
		warn,
		error,
		critical,
		off
	};

	logger::level get_level() const
	{
		switch (stdout_logger_->level())
		{
		case spdlog::level::trace:
			return level::trace;
		case spdlog::level::debug:
			return level::debug;
		case spdlog::level::info:
			return level::info;
		case spdlog::level::warn:
			return level::warn;
		case spdlog::level::err:
			return level::error;
		case spdlog::level::critical:
			return level::critical;
		case spdlog::level::off:
			return level::off;
		default:
			return level::error;
		}
	}

	void set_level(logger::level lvl)
	{
		stdout_logger_->set_level(to_spdlog_level(lvl));
	}

	void set_level(std::string_view lvl)
	{
		if (auto parsed = parse_level(lvl))
		{
			stdout_logger_->set_level(to_spdlog_level(*parsed));
		}
	}

	static void set_default_level(std::string_view lvl)
	{
		if (auto parsed = parse_level(lvl))
		{
			spdlog::set_level(to_spdlog_level(*parsed));
		}
	}

	// unrecognized names leave the level untouched
	static std::optional<logger::level> parse_level(std::string_view lvl)
	{
		if (lvl == "trace") return level::trace;
		if (lvl == "debug") return level::debug;
		if (lvl == "info") return level::info;
		if (lvl == "warn") return level::warn;
		if (lvl == "error") return level::error;
		if (lvl == "critical") return level::critical;
		if (lvl == "off") return level::off;
		return std::nullopt;
	}

	template <class ...Args>
	void trace(spdlog::format_string_t<Args...> message, Args&&... args)
	{
		stdout_logger_->trace(message, std::forward<Args>(args)...);
	}

	template <class ...Args>
	void debug(spdlog::format_string_t<Args...> message, Args&&... args)
	{
		stdout_logger_->debug(message, std::forward<Args>(args)...);
	}

	template <class ...Args>
	void info(spdlog::format_string_t<Args...> message, Args&&... args)
	{
		stdout_logger_->info(message, std::forward<Args>(args)...);
	}

	template <class ...Args>
	void warn(spdlog::format_string_t<Args...> message, Args&&... args)
	{
		stdout_logger_->warn(message, std::forward<Args>(args)...);
	}

	template <class ...Args>
	void error(spdlog::format_string_t<Args...> message, Args&&... args)
	{
		stdout_logger_->error(message, std::forward<Args>(args)...);
	}

	template <class ...Args>
	void critical(spdlog::format_string_t<Args...> message, Args&&... args)
	{
		stdout_logger_->critical(message, std::forward<Args>(args)...);
	}

	template <class ...Args>
	void trace_sync(spdlog::format_string_t<Args...> message, Args&&... args)
	{
		spdlog::trace(message, std::forward<Args>(args)...);
	}

	template <class ...Args>
	void debug_sync(spdlog::format_string_t<Args...> message, Args&&... args)
	{
		spdlog::debug(message, std::forward<Args>(args)...);
	}

	template <class ...Args>
	void info_sync(spdlog::format_string_t<Args...> message, Args&&... args)
	{
		spdlog::info(message, std::forward<Args>(args)...);
	}

	template <class ...Args>
	void warn_sync(spdlog::format_string_t<Args...> message, Args&&... args)
	{
		spdlog::warn(message, std::forward<Args>(args)...);
	}

	template <class ...Args>
	void error_sync(spdlog::format_string_t<Args...> message, Args&&... args)
	{
		spdlog::error(message, std::forward<Args>(args)...);
	}

	template <class ...Args>
	void critical_sync(spdlog::format_string_t<Args...> message, Args&&... args)
	{
		spdlog::critical(message, std::forward<Args>(args)...);
	}

	void flush()
	{
		stdout_logger_->flush();
	}

	virtual ~logger()
	{
		spdlog::drop_all();
	}
private:
	explicit logger()
	{
		try
		{
			stdout_logger_ = spdlog::create_async<spdlog::sinks::stdout_color_sink_st>("mqsub");
			stdout_logger_->set_level(spdlog::level::err);
		}
		catch (spdlog::spdlog_ex const& ex)
		{
			std::cerr << "failed to initialize logger : " << ex.what() << "\n";
			stdout_logger_ = spdlog::default_logger();
		}
	}

	static spdlog::level::level_enum to_spdlog_level(logger::level lvl)
	{
		switch (lvl)
		{
		case level::trace:
			return spdlog::level::trace;
		case level::debug:
			return spdlog::level::debug;
		case level::info:
			return spdlog::level::info;
		case level::warn:
			return spdlog::level::warn;
		case level::error:
			return spdlog::level::err;
		case level::critical:
			return spdlog::level::critical;
		case level::off:
		default:
			return spdlog::level::off;
		}
	}

	std::shared_ptr<spdlog::logger> stdout_logger_;
};

}

#define MQ_TRACE(...) mq::logger::get().trace_sync(__VA_ARGS__)
#define MQ_DEBUG(...) mq::logger::get().debug_sync(__VA_ARGS__)
#define MQ_INFO(...) mq::logger::get().info_sync(__VA_ARGS__)
#define MQ_WARN(...) mq::logger::get().warn_sync(__VA_ARGS__)
#define MQ_ERROR(...) mq::logger::get().error_sync(__VA_ARGS__)
#define MQ_CRITICAL(...) mq::logger::get().critical_sync(__VA_ARGS__)

// uncomment to get async logging
//#define MQ_TRACE(...) mq::logger::get().trace(__VA_ARGS__)
//#define MQ_DEBUG(...) mq::logger::get().debug(__VA_ARGS__)
//#define MQ_INFO(...) mq::logger::get().info(__VA_ARGS__)
//#define MQ_WARN(...) mq::logger::get().warn(__VA_ARGS__)
//#define MQ_ERROR(...) mq::logger::get().error(__VA_ARGS__)
//#define MQ_CRITICAL(...) mq::logger::get().critical(__VA_ARGS__)

#define MQ_TRACE_SYNC(...) mq::logger::get().trace_sync(__VA_ARGS__)
#define MQ_DEBUG_SYNC(...) mq::logger::get().debug_sync(__VA_ARGS__)
#define MQ_INFO_SYNC(...) mq::logger::get().info_sync(__VA_ARGS__)
#define MQ_WARN_SYNC(...) mq::logger::get().warn_sync(__VA_ARGS__)
#define MQ_ERROR_SYNC(...) mq::logger::get().error_sync(__VA_ARGS__)
#define MQ_CRITICAL_SYNC(...) mq::logger::get().critical_sync(__VA_ARGS__)

#define MQ_DEFAULT_LOG_LEVEL(level) mq::logger::get().set_level(level); mq::logger::set_default_level(level);

#endif // MQ_LOGGER_HPP
