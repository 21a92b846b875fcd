#include "tracing.hpp"
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <stdexcept>

namespace saberstat {

// Release builds stay quiet unless something needs attention
#ifdef NDEBUG
static constexpr LogLevel kDefaultLevel = LogLevel::WARN;
#else
static constexpr LogLevel kDefaultLevel = LogLevel::INFO;
#endif

std::atomic<LogLevel> Tracer::current_level_ {kDefaultLevel};
std::atomic<bool> Tracer::initialized_ {false};
std::once_flag Tracer::init_flag_;

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
static std::mutex g_tracer_mutex;

LogLevel Tracer::ParseLevel(const std::string &name) {
	std::string lower = name;
	for (auto &c : lower) {
		c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}

	if (lower == "trace") {
		return LogLevel::TRACE;
	}
	if (lower == "debug") {
		return LogLevel::DBG;
	}
	if (lower == "info") {
		return LogLevel::INFO;
	}
	if (lower == "warn" || lower == "warning") {
		return LogLevel::WARN;
	}
	if (lower == "error") {
		return LogLevel::ERR;
	}
	if (lower == "none") {
		return LogLevel::NONE;
	}
	throw std::invalid_argument("Unknown log level: '" + name +
	                            "'. Valid levels are: trace, debug, info, warn, error, none");
}

void Tracer::ReadEnvironment() {
	const char *env_level = std::getenv("SABERSTAT_LOG_LEVEL");
	if (env_level != nullptr) {
		try {
			current_level_.store(ParseLevel(env_level));
		} catch (const std::invalid_argument &) {
			current_level_.store(kDefaultLevel);
			std::lock_guard<std::mutex> lock(g_tracer_mutex);
			std::cerr << "[" << GetTimestamp() << "] [saberstat/WARN] ignoring SABERSTAT_LOG_LEVEL='" << env_level
			          << "'\n";
		}
	}
	initialized_.store(true, std::memory_order_release);
}

void Tracer::Initialize() {
	std::call_once(init_flag_, ReadEnvironment);
}

void Tracer::SetLogLevel(LogLevel level) {
	// Consume the one-time environment read so it cannot run after this store
	std::call_once(init_flag_, [] { initialized_.store(true, std::memory_order_release); });
	current_level_.store(level);
}

LogLevel Tracer::GetLogLevel() {
	if (!initialized_.load(std::memory_order_acquire)) {
		Initialize();
	}
	return current_level_.load();
}

bool Tracer::ShouldLog(LogLevel level) {
	if (level == LogLevel::NONE) {
		return false;
	}
	return level >= GetLogLevel();
}

std::string Tracer::GetLevelName(LogLevel level) {
	switch (level) {
	case LogLevel::TRACE:
		return "TRACE";
	case LogLevel::DBG:
		return "DEBUG";
	case LogLevel::INFO:
		return "INFO";
	case LogLevel::WARN:
		return "WARN";
	case LogLevel::ERR:
		return "ERROR";
	case LogLevel::NONE:
		return "NONE";
	default:
		return "UNKNOWN";
	}
}

std::string Tracer::GetTimestamp() {
	auto now = std::chrono::system_clock::now();
	auto time = std::chrono::system_clock::to_time_t(now);
	auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

	std::tm local_tm {};
	localtime_r(&time, &local_tm);

	std::ostringstream oss;
	oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0') << std::setw(3) << ms.count();
	return oss.str();
}

void Tracer::Log(LogLevel level, const std::string &file, int line, const std::string &message) {
	if (!ShouldLog(level)) {
		return;
	}

	size_t last_slash = file.find_last_of("/\\");
	std::string filename = (last_slash == std::string::npos) ? file : file.substr(last_slash + 1);
	std::string timestamp = GetTimestamp();

	std::lock_guard<std::mutex> lock(g_tracer_mutex);
	std::cerr << "[" << timestamp << "] [saberstat/" << GetLevelName(level) << "] " << filename << ":" << line
	          << " - " << message << '\n';
}

void Tracer::LogDirect(LogLevel level, const std::string &message) {
	if (!ShouldLog(level)) {
		return;
	}

	std::string timestamp = GetTimestamp();

	std::lock_guard<std::mutex> lock(g_tracer_mutex);
	std::cerr << "[" << timestamp << "] [saberstat/" << GetLevelName(level) << "] " << message << '\n';
}

uint64_t Tracer::TimingStart() {
	return static_cast<uint64_t>(
	    std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now().time_since_epoch())
	        .count());
}

double Tracer::TimingEnd(uint64_t handle, const std::string &stage_name) {
	uint64_t end_ns = TimingStart();
	double duration_ms = static_cast<double>(end_ns - handle) / 1000000.0;

	if (ShouldLog(LogLevel::DBG)) {
		std::ostringstream oss;
		oss << std::fixed << std::setprecision(2) << stage_name << " completed in " << duration_ms << " ms";
		LogDirect(LogLevel::DBG, oss.str());
	}
	return duration_ms;
}

} // namespace saberstat
