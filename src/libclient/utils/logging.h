// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBCLIENT_UTILS_LOGGING_H
#define LIBCLIENT_UTILS_LOGGING_H
#include <QString>

namespace utils {

QString logFilePath();

//! Mirror all log messages to a file in the application's data directory
void enableLogFile(bool enable);

bool isLogFileEnabled();

}

#endif
