#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace rcd::core {

enum class LogLevel : uint8_t { Trace = 0, Debug, Info, Warn, Error, Fatal };

const char *levelName(LogLevel lv);
bool parseLevel(const std::string &s, LogLevel &out);

struct LogRecord {
	uint64_t ts_us{};
	LogLevel level{};
	std::string tag;
	std::string msg;
};

struct ILogSink {
	virtual ~ILogSink() = default;
	virtual void write(const LogRecord &r) = 0;
};

class ConsoleSink final : public ILogSink {
public:
	void write(const LogRecord &r) override;
};

class FileSink final : public ILogSink {
public:
	explicit FileSink(std::string path);
	~FileSink() override;
	void write(const LogRecord &r) override;

	bool isOpen() const { return fp_ != nullptr; }

private:
	std::string path_;
	FILE *fp_ = nullptr;
};

class Logger {
public:
	static Logger &instance();

	void addSink(std::shared_ptr< ILogSink > sink);
	void removeSink(const std::shared_ptr< ILogSink > &sink);
	void setConsoleEnabled(bool enabled);

	void setLevel(LogLevel lv) { level_.store((uint8_t)lv); }
	bool enabled(LogLevel lv) const { return (uint8_t)lv >= level_.load(); }

	void log(LogLevel lv, std::string tag, std::string msg);

	// Blocks until every queued record has been written to the sinks.
	void flush();
	void shutdown();

private:
	Logger();
	~Logger();

	void worker_();

	std::atomic< uint8_t > level_{(uint8_t)LogLevel::Info};
	std::atomic< bool > running_{true};

	std::mutex mtx_;
	std::condition_variable cv_;
	std::condition_variable idle_cv_;
	std::deque< LogRecord > q_;
	bool busy_ = false;
	std::vector< std::shared_ptr< ILogSink > > sinks_;
	std::shared_ptr< ConsoleSink > console_sink_;
	std::atomic< bool > console_enabled_{true};

	std::thread th_;
};

} // namespace rcd::core

#define RCD_LOGT(tag, msg)                                                     \
	::rcd::core::Logger::instance().log(::rcd::core::LogLevel::Trace, (tag),   \
										(msg))
#define RCD_LOGD(tag, msg)                                                     \
	::rcd::core::Logger::instance().log(::rcd::core::LogLevel::Debug, (tag),   \
										(msg))
#define RCD_LOGI(tag, msg)                                                     \
	::rcd::core::Logger::instance().log(::rcd::core::LogLevel::Info, (tag),    \
										(msg))
#define RCD_LOGW(tag, msg)                                                     \
	::rcd::core::Logger::instance().log(::rcd::core::LogLevel::Warn, (tag),    \
										(msg))
#define RCD_LOGE(tag, msg)                                                     \
	::rcd::core::Logger::instance().log(::rcd::core::LogLevel::Error, (tag),   \
										(msg))
#define RCD_LOGF(tag, msg)                                                     \
	::rcd::core::Logger::instance().log(::rcd::core::LogLevel::Fatal, (tag),   \
										(msg))
