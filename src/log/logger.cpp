#include "logger.hpp"
#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fstream>
#include <mutex>
#include <sys/stat.h>
#include <QtCore/QDebug>

namespace {
std::mutex	g_mu;
std::string g_dir = LOG_DIR;

std::string today(const char* fmt)
{
	const time_t now = time(nullptr);
	tm ltm{};
	localtime_r(&now, &ltm);
	char buf[32];
	strftime(buf, sizeof(buf), fmt, &ltm);
	return buf;
}

std::string fileFor(const std::string& dir)
{
	return dir + "/attendance-" + today("%Y-%m-%d") + ".txt";
}

// 한 단계씩 만들어 내려감 (mkdir -p)
bool ensureDir(const std::string& dir)
{
	std::string cur;
	for (size_t i = 0; i <= dir.size(); ++i) {
		if (i < dir.size() && dir[i] != '/') continue;
		cur = dir.substr(0, i);
		if (cur.empty()) continue;
		if (mkdir(cur.c_str(), 0755) == -1 && errno != EEXIST) {
			qWarning() << "[Logger] mkdir failed:" << cur.c_str() << strerror(errno);
			return false;
		}
	}
	return true;
}
} // namespace

void Logger::setDirectory(const std::string& dir)
{
	std::lock_guard<std::mutex> lk(g_mu);
	g_dir = dir.empty() ? std::string(LOG_DIR) : dir;
}

std::string Logger::directory()
{
	std::lock_guard<std::mutex> lk(g_mu);
	return g_dir;
}

std::string Logger::currentFile()
{
	std::lock_guard<std::mutex> lk(g_mu);
	return fileFor(g_dir);
}

bool Logger::write(const std::string& message)
{
	std::lock_guard<std::mutex> lk(g_mu);
	if (!ensureDir(g_dir)) return false;

	const std::string path = fileFor(g_dir);
	std::ofstream out(path, std::ios::app);
	if (!out.is_open()) {
		qWarning() << "[Logger] open failed:" << path.c_str();
		return false;
	}
	out << "[" << today("%Y-%m-%d %H:%M:%S") << "] " << message << '\n';
	return static_cast<bool>(out);
}

bool Logger::writef(const char* format, ...)
{
	char buffer[1024];
	va_list args;
	va_start(args, format);
	const int n = vsnprintf(buffer, sizeof(buffer), format, args);
	va_end(args);
	if (n < 0) return false;
	return write(buffer);
}
