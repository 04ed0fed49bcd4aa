#include "tracing.hpp"
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace riskscan {

LogLevel Tracer::current_level_ = Tracer::DefaultLevel();
bool Tracer::initialized_ = false;

namespace {

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
std::mutex g_log_mutex;

constexpr size_t SECTION_WIDTH = 60;

const std::pair<const char *, LogLevel> LEVEL_NAMES[] = {{"trace", LogLevel::TRACE}, {"debug", LogLevel::DBG},
                                                         {"info", LogLevel::INFO},   {"warn", LogLevel::WARN},
                                                         {"error", LogLevel::ERR},   {"none", LogLevel::NONE}};

std::string BaseName(const std::string &path) {
	const size_t slash = path.find_last_of("/\\");
	return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace

LogLevel Tracer::DefaultLevel() {
#ifdef NDEBUG
	return LogLevel::WARN;
#else
	return LogLevel::INFO;
#endif
}

bool Tracer::TryParseLevel(const std::string &name, LogLevel &level) {
	std::string lowered = name;
	for (auto &c : lowered) {
		c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}
	for (const auto &entry : LEVEL_NAMES) {
		if (lowered == entry.first) {
			level = entry.second;
			return true;
		}
	}
	return false;
}

LogLevel Tracer::ParseLevel(const std::string &name) {
	LogLevel level = LogLevel::NONE;
	if (!TryParseLevel(name, level)) {
		throw std::invalid_argument("Unknown log level '" + name +
		                            "'. Valid levels are: trace, debug, info, warn, error, none");
	}
	return level;
}

void Tracer::Initialize() {
	if (initialized_) {
		return;
	}
	initialized_ = true;

	LogLevel level = DefaultLevel();
	const char *env_level = std::getenv("RISKSCAN_LOG_LEVEL");
	if (env_level != nullptr && TryParseLevel(env_level, level)) {
		current_level_ = level;
	}
}

void Tracer::SetLogLevel(LogLevel level) {
	initialized_ = true;
	current_level_ = level;
}

LogLevel Tracer::GetLogLevel() {
	Initialize();
	return current_level_;
}

bool Tracer::ShouldLog(LogLevel level) {
	Initialize();
	return level != LogLevel::NONE && level >= current_level_;
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
	}
	return "UNKNOWN";
}

std::string Tracer::GetTimestamp() {
	using std::chrono::system_clock;
	const auto now = system_clock::now();
	const std::time_t seconds = system_clock::to_time_t(now);
	const auto millis =
	    std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

	std::ostringstream oss;
	oss << std::put_time(std::localtime(&seconds), "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
	    << millis;
	return oss.str();
}

void Tracer::Emit(LogLevel level, const std::string &text) {
	const std::string prefix = "[" + GetTimestamp() + "] [riskscan/" + GetLevelName(level) + "] ";
	std::lock_guard<std::mutex> lock(g_log_mutex);
	std::cerr << prefix << text << '\n';
}

void Tracer::Log(LogLevel level, const std::string &file, int line, const std::string &message) {
	if (ShouldLog(level)) {
		Emit(level, BaseName(file) + ":" + std::to_string(line) + " - " + message);
	}
}

void Tracer::LogDirect(LogLevel level, const std::string &message) {
	if (ShouldLog(level)) {
		Emit(level, message);
	}
}

void Tracer::Section(const std::string &title) {
	const std::string rule(SECTION_WIDTH, '=');
	LogDirect(LogLevel::INFO, rule);
	LogDirect(LogLevel::INFO, title);
	LogDirect(LogLevel::INFO, rule);
}

uint64_t Tracer::TimingStart() {
	return static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());
}

double Tracer::TimingEnd(uint64_t handle, const std::string &operation_name) {
	const auto now = static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());
	const std::chrono::steady_clock::duration elapsed(static_cast<std::chrono::steady_clock::rep>(now - handle));
	const double duration_ms = std::chrono::duration<double, std::milli>(elapsed).count();

	if (ShouldLog(LogLevel::DBG)) {
		std::ostringstream oss;
		oss << operation_name << " completed in " << std::fixed << std::setprecision(2) << duration_ms << " ms";
		LogDirect(LogLevel::DBG, oss.str());
	}
	return duration_ms;
}

} // namespace riskscan
