// SPDX-License-Identifier: GPL-3.0-or-later
#include "libclient/canvas/canvasmodel.h"
#include "libclient/canvas/layerlist.h"
#include "libclient/canvas/userlist.h"
#include "libclient/document.h"
#include "libclient/net/client.h"
#include "libclient/settings.h"
#include "libclient/utils/logging.h"
#include "libshared/net/message.h"
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <QUrl>

Q_LOGGING_CATEGORY(lcIbWatch, "net.inkboard.watch", QtInfoMsg)

namespace {

void logMessage(const canvas::CanvasModel *canvas, const net::Message &msg)
{
	switch(msg.type()) {
	case net::MessageType::StrokeStart:
	case net::MessageType::StrokeUpdate:
	case net::MessageType::CursorUpdate:
		// Too noisy to log at info level
		qCDebug(lcIbWatch, "%s", qUtf8Printable(msg.name()));
		break;
	case net::MessageType::StrokeEnd:
		qCInfo(
			lcIbWatch, "Stroke finished, %d stroke(s) on the board",
			int(canvas->strokes().size()));
		break;
	case net::MessageType::ObjectAdded:
	case net::MessageType::ObjectUpdated:
	case net::MessageType::ObjectDeleted:
		qCInfo(
			lcIbWatch, "%s, %d object(s) on the board",
			qUtf8Printable(msg.name()), int(canvas->objects().size()));
		break;
	case net::MessageType::UserJoined:
	case net::MessageType::UserLeft:
		qCInfo(
			lcIbWatch, "%s, %d user(s) present", qUtf8Printable(msg.name()),
			canvas->userlist()->rowCount());
		break;
	case net::MessageType::UserCount:
		qCInfo(
			lcIbWatch, "User count is now %d",
			canvas->userlist()->userCount());
		break;
	default:
		break;
	}
}

}

int main(int argc, char *argv[])
{
	QCoreApplication app(argc, argv);

	QCoreApplication::setOrganizationName("inkboard");
	QCoreApplication::setOrganizationDomain("inkboard.net");
	QCoreApplication::setApplicationName("inkboard-watch");
	QCoreApplication::setApplicationVersion(INKBOARD_VERSION);

	QCommandLineParser parser;
	parser.setApplicationDescription(
		"Join a board as a passive observer and log what happens on it");
	parser.addHelpOption();
	parser.addVersionOption();

	// --server, -s <url>
	QCommandLineOption serverOption(
		QStringList() << "s" << "server", "Relay server address.", "url");
	parser.addOption(serverOption);

	// --board, -b <id>
	QCommandLineOption boardOption(
		QStringList() << "b" << "board", "Board to join.", "id");
	parser.addOption(boardOption);

	// --name, -n <name>
	QCommandLineOption nameOption(
		QStringList() << "n" << "name", "Display name to show to others.",
		"name");
	parser.addOption(nameOption);

	// --log-file
	QCommandLineOption logFileOption(
		"log-file", "Write log messages to a file as well.");
	parser.addOption(logFileOption);

	// --verbose
	QCommandLineOption verboseOption(
		"verbose", "Print debug messages for everything.");
	parser.addOption(verboseOption);

	parser.process(app);

	if(parser.isSet(verboseOption)) {
		QLoggingCategory::setFilterRules(
			QStringLiteral("net.inkboard.*.debug=true"));
	}

	libclient::settings::Settings settings;
	if(parser.isSet(logFileOption) || settings.logFile()) {
		utils::enableLogFile(true);
	}

	QUrl url(
		parser.isSet(serverOption) ? parser.value(serverOption)
								   : settings.serverUrl());
	if(!url.isValid() ||
	   (url.scheme() != QStringLiteral("ws") &&
		url.scheme() != QStringLiteral("wss"))) {
		qCritical(
			"Invalid server address '%s', expected a ws:// or wss:// URL",
			qUtf8Printable(url.toString()));
		return 1;
	}

	QString boardId = parser.isSet(boardOption) ? parser.value(boardOption)
												: settings.boardId();
	if(boardId.trimmed().isEmpty()) {
		qCritical("Board id must not be empty");
		return 1;
	}

	Document doc(settings);
	net::Client *client = doc.client();
	canvas::CanvasModel *canvas = doc.canvas();

	if(parser.isSet(nameOption)) {
		client->setUserInfo(client->userId(), parser.value(nameOption));
	}

	QObject::connect(
		client, &net::Client::connectionStateChanged, &app,
		[](net::Client::ConnectionState state) {
			qCInfo(
				lcIbWatch, "Connection state: %s",
				qUtf8Printable(net::Client::connectionStateName(state)));
			if(state == net::Client::ConnectionState::Error) {
				QCoreApplication::exit(2);
			}
		});
	QObject::connect(
		client, &net::Client::connectionError, [](const QString &message) {
			qCWarning(lcIbWatch, "%s", qUtf8Printable(message));
		});
	QObject::connect(
		client, &net::Client::boardStateReceived,
		[canvas](const QString &board, int strokeCount) {
			qCInfo(
				lcIbWatch,
				"Joined board '%s': %d stroke(s), %d user(s), %d layer(s)",
				qUtf8Printable(board), strokeCount,
				canvas->userlist()->rowCount(),
				canvas->layerlist()->rowCount());
		});
	QObject::connect(client, &net::Client::boardCleared, []() {
		qCInfo(lcIbWatch, "Board was cleared");
	});
	QObject::connect(
		client, &net::Client::messageReceived,
		[canvas](const net::Message &msg) {
			logMessage(canvas, msg);
		});

	qCInfo(
		lcIbWatch, "Watching board '%s' on %s as '%s'",
		qUtf8Printable(boardId), qUtf8Printable(url.toString()),
		qUtf8Printable(client->displayName()));
	doc.connectToServer(url, boardId);

	int result = app.exec();
	utils::enableLogFile(false);
	return result;
}
