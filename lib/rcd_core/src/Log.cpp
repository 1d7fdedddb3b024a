#include <rcd/core/Log.hpp>
#include <rcd/core/Time.hpp>

#include <algorithm>
#include <inttypes.h>

namespace rcd::core {

const char *levelName(LogLevel lv) {
	switch (lv) {
	case LogLevel::Trace:
		return "TRACE";
	case LogLevel::Debug:
		return "DEBUG";
	case LogLevel::Info:
		return "INFO";
	case LogLevel::Warn:
		return "WARN";
	case LogLevel::Error:
		return "ERROR";
	case LogLevel::Fatal:
		return "FATAL";
	}
	return "?";
}

bool parseLevel(const std::string &s, LogLevel &out) {
	static const char *names[] = {"trace", "debug", "info",
								  "warn",  "error", "fatal"};
	for (uint8_t i = 0; i < 6; ++i) {
		if (s == names[i]) {
			out = (LogLevel)i;
			return true;
		}
	}
	return false;
}

static void writeLine(FILE *fp, const LogRecord &r) {
	std::fprintf(fp, "[%10" PRIu64 "us] %-5s %-10s %s\n", r.ts_us,
				 levelName(r.level), r.tag.c_str(), r.msg.c_str());
	std::fflush(fp);
}

void ConsoleSink::write(const LogRecord &r) { writeLine(stderr, r); }

FileSink::FileSink(std::string path) : path_(std::move(path)) {
	fp_ = std::fopen(path_.c_str(), "a");
	if (!fp_)
		std::fprintf(stderr, "FileSink: cannot open '%s'\n", path_.c_str());
}

FileSink::~FileSink() {
	if (fp_)
		std::fclose(fp_);
}

void FileSink::write(const LogRecord &r) {
	if (!fp_)
		return;
	writeLine(fp_, r);
}

Logger &Logger::instance() {
	static Logger logger;
	return logger;
}

Logger::Logger() : console_sink_(std::make_shared< ConsoleSink >()) {
	th_ = std::thread(&Logger::worker_, this);
}

Logger::~Logger() { shutdown(); }

void Logger::addSink(std::shared_ptr< ILogSink > sink) {
	if (!sink)
		return;
	std::lock_guard< std::mutex > lk(mtx_);
	sinks_.push_back(std::move(sink));
}

void Logger::removeSink(const std::shared_ptr< ILogSink > &sink) {
	std::lock_guard< std::mutex > lk(mtx_);
	sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::setConsoleEnabled(bool enabled) {
	console_enabled_.store(enabled);
}

void Logger::log(LogLevel lv, std::string tag, std::string msg) {
	if (!enabled(lv))
		return;

	LogRecord r;
	r.ts_us = Time::us();
	r.level = lv;
	r.tag = std::move(tag);
	r.msg = std::move(msg);

	{
		// running_ は mtx_ の下で見る（shutdown も mtx_ の下で落とす）
		std::lock_guard< std::mutex > lk(mtx_);
		if (running_.load()) {
			q_.push_back(std::move(r));
			cv_.notify_one();
			return;
		}
	}
	// worker 停止後は同期で書く
	writeLine(stderr, r);
}

void Logger::flush() {
	std::unique_lock< std::mutex > lk(mtx_);
	idle_cv_.wait(lk, [this] { return (q_.empty() && !busy_) || !running_; });
}

void Logger::shutdown() {
	{
		std::lock_guard< std::mutex > lk(mtx_);
		if (!running_.exchange(false))
			return;
	}
	cv_.notify_all();
	if (th_.joinable())
		th_.join();
}

void Logger::worker_() {
	std::unique_lock< std::mutex > lk(mtx_);
	for (;;) {
		cv_.wait(lk, [this] { return !q_.empty() || !running_.load(); });
		if (q_.empty() && !running_.load())
			break;

		LogRecord r = std::move(q_.front());
		q_.pop_front();
		busy_ = true;
		std::vector< std::shared_ptr< ILogSink > > sinks = sinks_;
		lk.unlock();

		if (console_enabled_.load())
			console_sink_->write(r);
		for (auto &s : sinks)
			s->write(r);

		lk.lock();
		busy_ = false;
		if (q_.empty())
			idle_cv_.notify_all();
	}
	busy_ = false;
	idle_cv_.notify_all();
}

} // namespace rcd::core
