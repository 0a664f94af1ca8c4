/******************************************************************************
 *
 *    This file is part of the Marionette project
 *    Copyright (C) 2024-2026 Marionette contributors
 *
 *    This program is free software; you can redistribute it and/or modify
 *    it under the terms of the GNU General Public License as published by
 *    the Free Software Foundation; either version 2 of the License, or
 *    (at your option) any later version.
 *
 *    This program is distributed in the hope that it will be useful,
 *    but WITHOUT ANY WARRANTY; without even the implied warranty of
 *    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *    GNU General Public License for more details.
 *
 *    You should have received a copy of the GNU General Public License
 *    along with this program; if not, write to the Free Software
 *    Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 *
 *****************************************************************************/

#ifndef __LOGGER_H
#define __LOGGER_H

#include <string>
#include <vector>

namespace Marionette {

class LogListener;

/** Central logger. One instance per process; created by the host (or a test)
 * and reached through getSingletonPtr(). Messages below the configured level
 * are dropped before formatting. Listeners receive already formatted lines.
 *
 * The LOG_* macros below are safe to use when no Logger was created, which is
 * the normal case when the engines are embedded as a plain library. */
class Logger {
public:
    enum LogLevel {
        LOG_LEVEL_FATAL = 0,
        LOG_LEVEL_ERROR,
        LOG_LEVEL_INFO,
        LOG_LEVEL_DEBUG,
        LOG_LEVEL_VERBOSE
    };

    Logger();
    ~Logger();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;

    /// printf-style log entry
    void log(LogLevel level, const char *fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;

    void registerLogListener(LogListener *listener);
    void unregisterLogListener(LogListener *listener);

    void setLogLevel(LogLevel level) { mLogLevel = level; }
    LogLevel getLogLevel() const { return mLogLevel; }

    static const char *getLogLevelName(LogLevel level);

    static Logger &getSingleton();
    static Logger *getSingletonPtr();

private:
    void dispatch(LogLevel level, const std::string &msg);

    std::vector<LogListener *> mListeners;
    LogLevel mLogLevel = LOG_LEVEL_ERROR;

    static Logger *msSingleton;
};

/// Receives formatted log lines. Register with Logger::registerLogListener.
class LogListener {
public:
    virtual ~LogListener() = default;
    virtual void logMessage(Logger::LogLevel level, const std::string &msg) = 0;
};

} // namespace Marionette

#define MARIONETTE_LOG(level, ...)                                          \
    do {                                                                    \
        if (::Marionette::Logger *marionetteLogger_ =                       \
                ::Marionette::Logger::getSingletonPtr())                    \
            marionetteLogger_->log(::Marionette::Logger::level, __VA_ARGS__); \
    } while (0)

#define LOG_FATAL(...)   MARIONETTE_LOG(LOG_LEVEL_FATAL, __VA_ARGS__)
#define LOG_ERROR(...)   MARIONETTE_LOG(LOG_LEVEL_ERROR, __VA_ARGS__)
#define LOG_INFO(...)    MARIONETTE_LOG(LOG_LEVEL_INFO, __VA_ARGS__)
#define LOG_DEBUG(...)   MARIONETTE_LOG(LOG_LEVEL_DEBUG, __VA_ARGS__)
#define LOG_VERBOSE(...) MARIONETTE_LOG(LOG_LEVEL_VERBOSE, __VA_ARGS__)

#endif
