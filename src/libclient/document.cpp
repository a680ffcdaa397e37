// SPDX-License-Identifier: GPL-3.0-or-later
#include "libclient/document.h"
#include "libclient/canvas/cursorlist.h"
#include "libclient/canvas/history.h"
#include "libclient/canvas/layerlist.h"
#include "libclient/net/client.h"
#include "libclient/settings.h"
#include "libclient/tools/toolcontroller.h"
#include "libshared/net/websocketmessagequeue.h"
#include "libshared/util/argb.h"
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcIbClient)

Document::Document(
	libclient::settings::Settings &settings, net::MessageQueue *queue,
	QObject *parent)
	: QObject(parent)
	, m_settings(settings)
	, m_canvas(new canvas::CanvasModel(this))
	, m_history(new canvas::History)
	, m_client(nullptr)
	, m_toolctrl(nullptr)
{
	if(!queue) {
		queue = new net::WebSocketMessageQueue;
	}
	m_client = new net::Client(queue, m_canvas, m_history, this);
	m_toolctrl =
		new tools::ToolController(m_client, m_canvas, m_history, this);

	applySettings();

	connect(
		&m_settings, &libclient::settings::Settings::strokeSizeChanged,
		m_toolctrl, &tools::ToolController::setStrokeSize);
	connect(
		&m_settings, &libclient::settings::Settings::colorChanged, this,
		&Document::applyToolColor);
	connect(
		&m_settings, &libclient::settings::Settings::cursorStaleMsChanged,
		m_canvas->cursors(), &canvas::CursorListModel::setStaleMs);
	connect(
		&m_settings, &libclient::settings::Settings::historyDepthChanged, this,
		[this](int depth) {
			m_history->setMaxDepth(depth);
		});

	// A remote clear wipes out whatever was being edited too
	connect(
		m_client, &net::Client::boardCleared, m_toolctrl,
		&tools::ToolController::cancel);
}

Document::~Document()
{
	// The tool controller and client refer to the history
	delete m_toolctrl;
	delete m_client;
	delete m_history;
}

QString Document::boardId() const
{
	return m_client->boardId();
}

void Document::applySettings()
{
	m_settings.ensureIdentity();
	const QString userId = m_settings.userId();
	m_client->setUserInfo(userId, m_settings.displayName());
	m_client->setReconnectPolicy(
		m_settings.reconnectAttempts(), m_settings.reconnectDelayMs());
	m_history->setMaxDepth(m_settings.historyDepth());
	m_canvas->cursors()->setStaleMs(m_settings.cursorStaleMs());
	m_toolctrl->setUserId(userId);
	m_toolctrl->setStrokeSize(m_settings.strokeSize());
	applyToolColor(m_settings.color());
}

void Document::applyToolColor(const QString &color)
{
	std::optional<quint32> argb = utils::argbFromHex(color);
	if(argb.has_value()) {
		m_toolctrl->setColor(*argb);
	} else {
		qCWarning(
			lcIbClient, "Invalid tool color '%s'", qUtf8Printable(color));
	}
}

void Document::connectToServer()
{
	connectToServer(
		QUrl(m_settings.serverUrl()), m_settings.boardId());
}

void Document::connectToServer(const QUrl &url, const QString &boardId)
{
	switchBoard(boardId);
	m_client->connectToServer(url);
}

void Document::disconnectFromServer()
{
	m_client->disconnectFromServer();
}

void Document::switchBoard(const QString &boardId)
{
	if(boardId == m_client->boardId()) {
		return;
	}
	m_toolctrl->cancel();
	m_client->joinBoard(boardId);
	emit boardChanged(boardId);
}

canvas::Scene Document::scene() const
{
	return m_canvas->scene(m_toolctrl->liveStrokes(), m_toolctrl->liveObjects());
}

QString Document::addLayer()
{
	return m_canvas->layerlist()->addLayer();
}

bool Document::deleteLayer(const QString &layerId)
{
	return m_canvas->layerlist()->deleteLayer(layerId);
}

bool Document::reorderLayer(int oldIndex, int newIndex)
{
	return m_canvas->layerlist()->reorder(oldIndex, newIndex);
}

void Document::reset()
{
	m_toolctrl->cancel();
	m_client->leaveBoard();
	m_client->disconnectFromServer();
	m_canvas->reset();
	m_history->clear();
	emit boardChanged(QString());
}
