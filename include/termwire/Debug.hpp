// Copyright (C) 2023-2025 Marek Zalewski aka Drwalin
//
// This file is part of TermWire project under MIT License
// You should have received a copy of the MIT License along with this program.

#ifndef TERMWIRE_DEBUG_HPP
#define TERMWIRE_DEBUG_HPP

#ifdef TERMWIRE_LOG_USE_PRETTY_FUNCTION
#define TERMWIRE_LOG_FUNCTION __PRETTY_FUNCTION__
#else
#define TERMWIRE_LOG_FUNCTION __FUNCTION__
#endif

/*
 * Most verbose level compiled in, by number (1 = FATAL .. 6 = TRACE).
 * Statements above it still type check their arguments but never run.
 */
#ifndef TERMWIRE_LOG_MAX_LEVEL
#define TERMWIRE_LOG_MAX_LEVEL 6
#endif

#define TERMWIRE_LOG_AT(LEVEL, ...)                                            \
	do {                                                                       \
		if constexpr (termwire::log::LEVEL <= TERMWIRE_LOG_MAX_LEVEL) {        \
			if (termwire::log::IsLogLevelApplicable(termwire::log::LEVEL)) {   \
				termwire::log::Log(termwire::log::LEVEL, true, true, __FILE__, \
								   __LINE__, TERMWIRE_LOG_FUNCTION,            \
								   __VA_ARGS__);                               \
			}                                                                  \
		}                                                                      \
	} while (false)

#define LOG_FATAL(...) TERMWIRE_LOG_AT(FATAL, __VA_ARGS__)
#define LOG_ERROR(...) TERMWIRE_LOG_AT(LL_ERROR, __VA_ARGS__)
#define LOG_WARN(...) TERMWIRE_LOG_AT(WARN, __VA_ARGS__)
#define LOG_INFO(...) TERMWIRE_LOG_AT(INFO, __VA_ARGS__)
#define LOG_DEBUG(...) TERMWIRE_LOG_AT(DEBUG, __VA_ARGS__)
#define LOG_TRACE(...) TERMWIRE_LOG_AT(TRACE, __VA_ARGS__)

namespace termwire
{
namespace log
{
enum LogLevel : unsigned char {
	LL_OFF = 0,
	FATAL = 1,
	LL_ERROR = 2,
	WARN = 3,
	INFO = 4,
	DEBUG = 5,
	TRACE = 6,

	LL_IGNORE = 127
};

const char *LogLevelToName(LogLevel level);
/*
 * Accepts full names ("debug", "WARN"), single letters ("d", "W") and
 * "off". Returns LL_IGNORE for anything else.
 */
LogLevel LogLevelFromName(const char *name);

LogLevel GetGlobalLogLevel();
void SetGlobalLogLevel(LogLevel level);

LogLevel GetThreadLocalLogLevel();
bool SetThreadLocalLogLevel(LogLevel level);
void RemoveThreadLocalLogLevel();

bool IsLogLevelApplicable(LogLevel level);

void Log(LogLevel logLevel, bool printTime, bool printFile, const char *file,
		 int line, const char *function, const char *fmt, ...)
	__attribute__((format(printf, 7, 8)));

void HexDump(const void *buf, int bytes);

void WriteSync(const char *buf, int bytes);
} // namespace log
} // namespace termwire

#endif
