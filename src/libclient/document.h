// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBCLIENT_DOCUMENT_H
#define LIBCLIENT_DOCUMENT_H
#include "libclient/canvas/canvasmodel.h"
#include <QObject>
#include <QUrl>

namespace canvas {
class History;
}
namespace net {
class Client;
class MessageQueue;
}
namespace libclient {
namespace settings {
class Settings;
}
}
namespace tools {
class ToolController;
}

/**
 * @brief An open board and everything attached to it, including the network
 * connection
 *
 * This is an UI agnostic class: a front end feeds pointer input into the
 * tool controller and draws the scene.
 */
class Document final : public QObject {
	Q_OBJECT
	Q_PROPERTY(QString boardId READ boardId NOTIFY boardChanged)
public:
	/**
	 * @brief Create a document
	 * @param settings settings to configure the document with
	 * @param queue transport to use, a WebSocket one is made if null
	 */
	Document(
		libclient::settings::Settings &settings,
		net::MessageQueue *queue = nullptr, QObject *parent = nullptr);
	~Document() override;

	canvas::CanvasModel *canvas() const { return m_canvas; }
	canvas::History *history() const { return m_history; }
	net::Client *client() const { return m_client; }
	tools::ToolController *toolController() const { return m_toolctrl; }

	QString boardId() const;

	//! Connect to the configured server and join the configured board
	void connectToServer();
	void connectToServer(const QUrl &url, const QString &boardId);
	void disconnectFromServer();

	//! Switch to another board, dropping the local state of the current one
	void switchBoard(const QString &boardId);

	//! Everything to draw, including the local user's unfinished work
	canvas::Scene scene() const;

	//! Add a layer on top and make it the active one
	QString addLayer();
	bool deleteLayer(const QString &layerId);
	bool reorderLayer(int oldIndex, int newIndex);

	//! Go back to an empty, disconnected document
	void reset();

signals:
	void boardChanged(const QString &boardId);

private:
	void applySettings();
	void applyToolColor(const QString &color);

	libclient::settings::Settings &m_settings;
	canvas::CanvasModel *m_canvas;
	canvas::History *m_history;
	net::Client *m_client;
	tools::ToolController *m_toolctrl;
};

#endif
