// Copyright (C) 2023-2025 Marek Zalewski aka Drwalin
//
// This file is part of TermWire project under MIT License
// You should have received a copy of the MIT License along with this program.

#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstring>

#include <mutex>
#include <string>

#include "../include/termwire/Time.hpp"

#include "../include/termwire/Debug.hpp"

#ifdef __unix__
#include <sys/syscall.h>
#include <unistd.h>
#ifdef SYS_gettid
static uint64_t GenThreadId() { return syscall(SYS_gettid); }
#define GEN_THREAD_ID() GenThreadId()
#endif
#endif
#if !defined(GEN_THREAD_ID)
#include <atomic>
static uint64_t GenThreadId()
{
	static std::atomic<uint64_t> globID = 1;
	return globID++;
}
#define GEN_THREAD_ID() GenThreadId()
#endif

#ifndef TERMWIRE_LOG_DATETIME_SUBSECONDS_DIGITS
#define TERMWIRE_LOG_DATETIME_SUBSECONDS_DIGITS 5
#endif

#ifndef TERMWIRE_LOG_DEFAULT_LOG_LEVEL
#define TERMWIRE_LOG_DEFAULT_LOG_LEVEL termwire::log::WARN
#endif

namespace termwire
{
namespace log
{
static LogLevel globalLogLevel = TERMWIRE_LOG_DEFAULT_LOG_LEVEL;
static thread_local LogLevel threadLocalLogLevel = LL_IGNORE;

LogLevel GetGlobalLogLevel() { return globalLogLevel; }

void SetGlobalLogLevel(LogLevel level) { globalLogLevel = level; }

LogLevel GetThreadLocalLogLevel() { return threadLocalLogLevel; }

bool SetThreadLocalLogLevel(LogLevel level)
{
	threadLocalLogLevel = level;
	return true;
}

void RemoveThreadLocalLogLevel() { threadLocalLogLevel = LL_IGNORE; }

bool IsLogLevelApplicable(LogLevel level)
{
	LogLevel tlsl = GetThreadLocalLogLevel();
	if (tlsl != LL_IGNORE) {
		return level <= tlsl;
	}
	return level <= globalLogLevel;
}

const char *LogLevelToName(LogLevel level)
{
	switch (level) {
	case FATAL:
		return "FATAL";
	case LL_ERROR:
		return "ERROR";
	case WARN:
		return "WARN ";
	case INFO:
		return "INFO ";
	case DEBUG:
		return "DEBUG";
	case TRACE:
		return "TRACE";
	default:
		return "UNDEF";
	}
}

LogLevel LogLevelFromName(const char *name)
{
	if (name == nullptr || name[0] == 0) {
		return LL_IGNORE;
	}
	std::string n = name;
	for (char &c : n) {
		c = tolower((unsigned char)c);
	}
	if (n == "fatal" || n == "f") {
		return FATAL;
	} else if (n == "error" || n == "e") {
		return LL_ERROR;
	} else if (n == "warn" || n == "warning" || n == "w") {
		return WARN;
	} else if (n == "info" || n == "i") {
		return INFO;
	} else if (n == "debug" || n == "d") {
		return DEBUG;
	} else if (n == "trace" || n == "t") {
		return TRACE;
	} else if (n == "off") {
		return LL_OFF;
	}
	return LL_IGNORE;
}

static std::string CorrectFilePath(std::string path)
{
#ifdef TERMWIRE_LOG_USE_FILENAME_WITHOUT_PATH
	auto it = path.find_last_of("/\\");
	if (it != std::string::npos) {
		return path.substr(it + 1);
	}
	return path;
#else
	for (char &c : path) {
		if (c == '\\') {
			c = '/';
		}
	}
	while (true) {
		auto pos = path.find("//");
		if (pos == std::string::npos) {
			break;
		}
		path.replace(pos, 2, "/");
	}
	while (true) {
		auto pos = path.find("/./");
		if (pos == std::string::npos) {
			break;
		}
		path.replace(pos, 3, "/");
	}
	while (true) {
		const auto pos = path.find("/../");
		if (pos == std::string::npos || pos == 0) {
			break;
		}
		auto pos2 = path.rfind('/', pos - 1);
		if (pos2 == std::string::npos) {
			pos2 = 0;
		}
		path.replace(pos2, pos + 3 - pos2, "");
	}
	return path;
#endif
}

static thread_local uint64_t threadId = GEN_THREAD_ID();
static std::mutex mutex;

void Log(LogLevel logLevel, bool printTime, bool printFile, const char *file,
		 int line, const char *function, const char *fmt, ...)
{
	if (IsLogLevelApplicable(logLevel) == false) {
		return;
	}

	std::string timestamp;
	if (printTime) {
		timestamp = termwire::time::GetCurrentTimestampString(
			TERMWIRE_LOG_DATETIME_SUBSECONDS_DIGITS);
	}

	va_list va;
	va_start(va, fmt);

	constexpr int BYTES = 16 * 1024;
	char buf[BYTES];
	int offset = 0;

	snprintf(buf + offset, BYTES - offset, "%s ", LogLevelToName(logLevel));

	if (printTime) {
		offset = strlen(buf);
		snprintf(buf + offset, BYTES - offset, "%s [%3lu] ", timestamp.c_str(),
				 (unsigned long)threadId);
	}

	if (printFile && file != nullptr) {
		std::string filePath = CorrectFilePath(file);
		offset = strlen(buf);
		snprintf(buf + offset, BYTES - offset, "%s:%i ", filePath.c_str(),
				 line);
	}
	offset = strlen(buf);
	snprintf(buf + offset, BYTES - offset, "%s() : ", function);
	offset = strlen(buf);
	vsnprintf(buf + offset, BYTES - offset, fmt, va);
	offset = strlen(buf);
	snprintf(buf + offset, BYTES - offset, "\n");
	offset = strlen(buf);

	va_end(va);

	WriteSync(buf, offset);
}

void HexDump(const void *buf, int bytes)
{
	std::lock_guard lock(mutex);
	printf("Hex dump from [%p] bytes %i\n", buf, bytes);
	const uint8_t *ptr = (const uint8_t *)buf;
	for (int i = 0; i < bytes; i += 16) {
		printf("%8.8X:", (unsigned int)i);
		for (int j = 0; j < 16 && j + i < bytes; ++j) {
			printf(" %2.2X", (unsigned int)ptr[i + j]);
		}
		printf("\n");
	}
	fflush(stdout);
}

void WriteSync(const char *buf, int bytes)
{
	std::lock_guard lock(mutex);
	fwrite(buf, 1, bytes, stdout);
	fflush(stdout);
}
} // namespace log
} // namespace termwire
