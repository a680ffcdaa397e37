// SPDX-License-Identifier: GPL-3.0-or-later
#include "libclient/utils/logging.h"
#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QMessageLogContext>
#include <QMutex>
#include <QMutexLocker>
#include <QStandardPaths>

namespace utils {

static QMutex logmutex;
static QFile *logfile;
static QtMessageHandler defaultLogger;

static void
logToFile(QtMsgType type, const QMessageLogContext &ctx, const QString &msg)
{
	QString label;
	switch(type) {
	case QtDebugMsg:
		label = QStringLiteral("DEBUG");
		break;
	case QtInfoMsg:
		label = QStringLiteral("INFO");
		break;
	case QtWarningMsg:
		label = QStringLiteral("WARNING");
		break;
	case QtCriticalMsg:
		label = QStringLiteral("CRITICAL");
		break;
	case QtFatalMsg:
		label = QStringLiteral("FATAL");
		break;
	default:
		label = QStringLiteral("UNKNOWN");
		break;
	}

	QString ts = QDateTime::currentDateTime().toString(QStringLiteral("hh:mm:ss"));
	QByteArray line =
		QStringLiteral("[%1 %2] %3\n").arg(ts, label, msg).toUtf8();

	{
		QMutexLocker locker(&logmutex);
		if(logfile) {
			logfile->write(line);
			logfile->flush();
		}
	}

	defaultLogger(type, ctx, msg);
}

QString logFilePath()
{
	QDir dir(QStandardPaths::writableLocation(
		QStandardPaths::AppLocalDataLocation));
	dir.mkpath(QStringLiteral("logs"));
	return dir.absoluteFilePath(
		QStringLiteral("logs/inkboard-%1-%2.log")
			.arg(QCoreApplication::applicationVersion())
			.arg(QDateTime::currentDateTime().toString(
				QStringLiteral("yyyy-MM-dd"))));
}

void enableLogFile(bool enable)
{
	if(enable && !logfile) {
		QString logpath = logFilePath();
		qInfo("Opening log file: %s", qUtf8Printable(logpath));
		QFile *f = new QFile(logpath);
		if(f->open(QIODevice::WriteOnly | QIODevice::Append)) {
			{
				QMutexLocker locker(&logmutex);
				logfile = f;
			}
			defaultLogger = qInstallMessageHandler(logToFile);
			qInfo("File logging started.");
		} else {
			qWarning(
				"Unable to open logfile: %s", qUtf8Printable(f->errorString()));
			delete f;
		}
	} else if(!enable && logfile) {
		qInfo("File logging stopped.");
		qInstallMessageHandler(defaultLogger);
		QFile *f;
		{
			QMutexLocker locker(&logmutex);
			f = logfile;
			logfile = nullptr;
		}
		delete f;
	}
}

bool isLogFileEnabled()
{
	QMutexLocker locker(&logmutex);
	return logfile != nullptr;
}

}
