// SPDX-License-Identifier: GPL-3.0-or-later
#include "libclient/net/client.h"
#include "libclient/canvas/canvasmodel.h"
#include "libclient/canvas/cursorlist.h"
#include "libclient/canvas/history.h"
#include "libclient/canvas/userlist.h"
#include "libclient/net/message.h"
#include "libshared/net/messagequeue.h"
#include <QDateTime>
#include <QJsonArray>
#include <QLoggingCategory>
#include <QTimer>

Q_LOGGING_CATEGORY(lcIbClient, "net.inkboard.client", QtWarningMsg)

namespace net {

Client::Client(
	MessageQueue *queue, canvas::CanvasModel *model, canvas::History *history,
	QObject *parent)
	: QObject(parent)
	, m_queue(queue)
	, m_model(model)
	, m_history(history)
	, m_reconnectTimer(new QTimer(this))
	, m_clock(&QDateTime::currentMSecsSinceEpoch)
{
	Q_ASSERT(queue);
	Q_ASSERT(model);
	Q_ASSERT(history);
	if(!m_queue->parent()) {
		m_queue->setParent(this);
	}

	m_reconnectTimer->setSingleShot(true);
	connect(
		m_reconnectTimer, &QTimer::timeout, this, &Client::attemptReconnect);

	connect(m_queue, &MessageQueue::connected, this, &Client::handleConnected);
	connect(
		m_queue, &MessageQueue::disconnected, this,
		&Client::handleDisconnected);
	connect(
		m_queue, &MessageQueue::connectionFailed, this,
		&Client::handleConnectionFailed);
	connect(
		m_queue, &MessageQueue::messageAvailable, this, &Client::scheduleDrain);
	connect(m_queue, &MessageQueue::badData, this, [](int len) {
		qCWarning(lcIbClient, "Dropped malformed frame of %d bytes", len);
	});
}

void Client::setReconnectPolicy(int maxAttempts, int delayMs)
{
	m_maxReconnectAttempts = qMax(0, maxAttempts);
	m_reconnectDelayMs = qMax(0, delayMs);
}

void Client::setUserInfo(const QString &userId, const QString &displayName)
{
	m_userId = userId;
	m_displayName = displayName;
}

void Client::setClock(const std::function<qint64()> &clock)
{
	m_clock = clock;
}

void Client::connectToServer(const QUrl &url)
{
	qCInfo(lcIbClient) << "Connecting to" << url;
	m_url = url;
	m_localDisconnect = false;
	m_reconnectAttempt = 0;
	m_reconnectTimer->stop();
	setConnectionState(ConnectionState::Connecting);
	m_queue->connectToServer(url);
}

void Client::disconnectFromServer()
{
	m_localDisconnect = true;
	m_reconnectTimer->stop();
	bool wasConnected = m_queue->isConnected();
	// Also aborts a connection attempt that is still in progress
	m_queue->disconnectFromServer();
	if(!wasConnected) {
		setConnectionState(ConnectionState::Disconnected);
	}
}

void Client::joinBoard(const QString &boardId)
{
	if(boardId.isEmpty()) {
		qCWarning(lcIbClient, "Refusing to join a board without an ID");
		return;
	}

	if(boardId != m_boardId) {
		if(!m_boardId.isEmpty()) {
			sendMessage(makeLeaveBoardMessage(m_boardId));
		}
		qCDebug(lcIbClient, "Switching to board %s", qUtf8Printable(boardId));
		m_model->reset();
		m_history->clear();
		m_boardId = boardId;
	}

	m_awaitingBoardState = true;
	if(isConnected()) {
		sendJoin();
	}
}

void Client::leaveBoard()
{
	if(m_boardId.isEmpty()) {
		return;
	}

	qCDebug(lcIbClient, "Leaving board %s", qUtf8Printable(m_boardId));
	sendMessage(makeLeaveBoardMessage(m_boardId));
	m_boardId.clear();
	m_awaitingBoardState = false;
	m_model->cursors()->clear();
	m_model->userlist()->reset();
}

QString Client::connectionStateName(ConnectionState state)
{
	switch(state) {
	case ConnectionState::Disconnected:
		return QStringLiteral("disconnected");
	case ConnectionState::Connecting:
		return QStringLiteral("connecting");
	case ConnectionState::Connected:
		return QStringLiteral("connected");
	case ConnectionState::Reconnecting:
		return QStringLiteral("reconnecting");
	case ConnectionState::Error:
		return QStringLiteral("error");
	}
	return QString();
}

void Client::sendMessage(const net::Message &msg)
{
	sendMessages(1, &msg);
}

void Client::sendMessages(int count, const net::Message *msgs)
{
	if(!isConnected()) {
		qCDebug(lcIbClient, "Not connected, dropping %d message(s)", count);
		return;
	}
	m_queue->sendMultiple(count, msgs);
}

void Client::drainInbox()
{
	m_drainQueued = false;
	MessageList msgs;
	m_queue->receive(msgs);
	for(const Message &msg : msgs) {
		handleMessage(msg);
	}
}

void Client::handleConnected()
{
	if(m_state == ConnectionState::Reconnecting) {
		qCInfo(lcIbClient, "Reconnected after %d attempt(s)",
			m_reconnectAttempt);
	}
	m_reconnectAttempt = 0;
	setConnectionState(ConnectionState::Connected);

	if(!m_boardId.isEmpty()) {
		m_awaitingBoardState = true;
		sendJoin();
	}
}

void Client::handleDisconnected(bool localDisconnect)
{
	if(localDisconnect || m_localDisconnect) {
		setConnectionState(ConnectionState::Disconnected);
	} else {
		qCWarning(lcIbClient, "Connection lost");
		scheduleReconnect();
	}
}

void Client::handleConnectionFailed(const QString &errorString)
{
	emit connectionError(errorString);
	if(m_localDisconnect) {
		setConnectionState(ConnectionState::Disconnected);
	} else {
		scheduleReconnect();
	}
}

void Client::scheduleDrain()
{
	if(!m_drainQueued) {
		m_drainQueued = true;
		QMetaObject::invokeMethod(
			this, &Client::drainInbox, Qt::QueuedConnection);
	}
}

void Client::attemptReconnect()
{
	qCDebug(lcIbClient, "Reconnection attempt %d of %d", m_reconnectAttempt,
		m_maxReconnectAttempts);
	m_queue->connectToServer(m_url);
}

void Client::setConnectionState(ConnectionState state)
{
	if(state != m_state) {
		m_state = state;
		qCDebug(lcIbClient, "Connection state %s",
			qUtf8Printable(connectionStateName(state)));
		emit connectionStateChanged(state);
	}
}

void Client::scheduleReconnect()
{
	if(m_reconnectAttempt >= m_maxReconnectAttempts) {
		qCWarning(lcIbClient, "Giving up after %d reconnection attempt(s)",
			m_reconnectAttempt);
		setConnectionState(ConnectionState::Error);
		emit connectionError(
			tr("Could not reconnect after %n attempt(s)", nullptr,
			   m_reconnectAttempt));
		return;
	}

	++m_reconnectAttempt;
	setConnectionState(ConnectionState::Reconnecting);
	m_reconnectTimer->start(m_reconnectDelayMs);
}

void Client::sendJoin()
{
	qCDebug(lcIbClient, "Joining board %s", qUtf8Printable(m_boardId));
	sendMessage(makeJoinBoardMessage(m_boardId, m_userId, m_displayName));
}

bool Client::acceptBoardEvent(const Message &msg)
{
	if(m_boardId.isEmpty()) {
		qCDebug(lcIbClient, "Not on a board, ignoring %s",
			qUtf8Printable(msg.name()));
		return false;
	}

	QString boardId = msg.boardId();
	if(!boardId.isEmpty() && boardId != m_boardId) {
		qCDebug(lcIbClient, "Ignoring %s for board %s",
			qUtf8Printable(msg.name()), qUtf8Printable(boardId));
		return false;
	}

	if(m_awaitingBoardState && msg.type() != MessageType::BoardState) {
		qCDebug(lcIbClient, "Ignoring %s until the board state arrives",
			qUtf8Printable(msg.name()));
		return false;
	}

	return true;
}

void Client::handleMessage(const Message &msg)
{
	bool handled;
	switch(msg.type()) {
	case MessageType::BoardState:
	case MessageType::StrokeStart:
	case MessageType::StrokeUpdate:
	case MessageType::StrokeEnd:
	case MessageType::CursorUpdate:
	case MessageType::ObjectAdded:
	case MessageType::ObjectUpdated:
	case MessageType::ObjectDeleted:
	case MessageType::BoardCleared:
	case MessageType::UserJoined:
	case MessageType::UserLeft:
	case MessageType::UserCount:
		if(!acceptBoardEvent(msg)) {
			return;
		}
		break;
	default:
		qCWarning(lcIbClient, "Unhandled event '%s'",
			qUtf8Printable(msg.name()));
		return;
	}

	switch(msg.type()) {
	case MessageType::BoardState:
		handled = handleBoardState(msg);
		break;
	case MessageType::StrokeStart:
		handled = handleStrokeStart(msg);
		break;
	case MessageType::StrokeUpdate:
		handled = handleStrokeUpdate(msg);
		break;
	case MessageType::StrokeEnd:
		handled = handleStrokeEnd(msg);
		break;
	case MessageType::CursorUpdate:
		handled = handleCursorUpdate(msg);
		break;
	case MessageType::ObjectAdded:
		handled = handleObjectAdded(msg);
		break;
	case MessageType::ObjectUpdated:
		handled = handleObjectUpdated(msg);
		break;
	case MessageType::ObjectDeleted:
		handled = handleObjectDeleted(msg);
		break;
	case MessageType::BoardCleared:
		handled = handleBoardCleared();
		break;
	case MessageType::UserJoined:
		handled = handleUserJoined(msg);
		break;
	case MessageType::UserLeft:
		handled = handleUserLeft(msg);
		break;
	case MessageType::UserCount:
		handled = handleUserCount(msg);
		break;
	default:
		handled = false;
		break;
	}

	if(handled) {
		emit messageReceived(msg);
	} else {
		qCWarning(lcIbClient, "Dropped %s event",
			qUtf8Printable(msg.name()));
	}
}

bool Client::handleBoardState(const Message &msg)
{
	QJsonArray array =
		msg.payload().value(QStringLiteral("strokes")).toArray();
	QVector<canvas::Stroke> strokes;
	strokes.reserve(array.size());
	for(const QJsonValue &v : array) {
		std::optional<canvas::Stroke> stroke =
			canvas::Stroke::fromJson(v.toObject());
		if(stroke.has_value()) {
			strokes.append(*stroke);
		} else {
			qCWarning(lcIbClient, "Skipping malformed stroke in board state");
		}
	}

	m_awaitingBoardState = false;
	m_model->setStrokes(strokes);

	QJsonValue users = msg.payload().value(QStringLiteral("users"));
	if(users.isArray()) {
		m_model->userlist()->setUsers(
			canvas::UserListModel::usersFromJson(users.toArray()));
	}

	emit boardStateReceived(m_boardId, int(m_model->strokes().size()));
	return true;
}

bool Client::handleStrokeStart(const Message &msg)
{
	std::optional<canvas::Stroke> header =
		canvas::Stroke::fromStartPayload(msg.payload());
	return header.has_value() && m_model->beginRemoteStroke(*header);
}

bool Client::handleStrokeUpdate(const Message &msg)
{
	QString id = msg.payload().value(QStringLiteral("stroke_id")).toString();
	std::optional<canvas::PointVector> points =
		canvas::pointsFromJson(msg.payload().value(QStringLiteral("points")));
	return points.has_value() && m_model->appendRemotePoints(id, *points);
}

bool Client::handleStrokeEnd(const Message &msg)
{
	QString id = msg.payload().value(QStringLiteral("stroke_id")).toString();
	return m_model->finishRemoteStroke(id);
}

bool Client::handleCursorUpdate(const Message &msg)
{
	const QJsonObject &payload = msg.payload();
	QString userId = payload.value(QStringLiteral("user_id")).toString();
	QJsonValue x = payload.value(QStringLiteral("x"));
	QJsonValue y = payload.value(QStringLiteral("y"));
	if(userId.isEmpty() || !x.isDouble() || !y.isDouble()) {
		return false;
	}

	m_model->cursors()->updateCursor(
		userId, payload.value(QStringLiteral("display_name")).toString(),
		x.toDouble(), y.toDouble(), m_clock());
	return true;
}

bool Client::handleObjectAdded(const Message &msg)
{
	std::optional<canvas::CanvasObject> object =
		canvas::CanvasObject::fromWire(msg.payload());
	return object.has_value() && m_model->addObject(*object);
}

bool Client::handleObjectUpdated(const Message &msg)
{
	QString id = msg.payload().value(QStringLiteral("object_id")).toString();
	QJsonValue props = msg.payload().value(QStringLiteral("properties"));
	return props.isObject() && m_model->updateObject(id, props.toObject());
}

bool Client::handleObjectDeleted(const Message &msg)
{
	QString id = msg.payload().value(QStringLiteral("object_id")).toString();
	return m_model->removeObject(id);
}

bool Client::handleBoardCleared()
{
	m_model->clear();
	m_history->clear();
	emit boardCleared();
	return true;
}

bool Client::handleUserJoined(const Message &msg)
{
	const QJsonObject &payload = msg.payload();
	canvas::User user{
		payload.value(QStringLiteral("sid")).toString(),
		payload.value(QStringLiteral("user_id")).toString(),
		payload.value(QStringLiteral("display_name")).toString(),
	};
	if(user.sid.isEmpty()) {
		return false;
	}
	m_model->userlist()->userJoined(user);
	return true;
}

bool Client::handleUserLeft(const Message &msg)
{
	QString sid = msg.payload().value(QStringLiteral("sid")).toString();
	if(sid.isEmpty()) {
		return false;
	}
	m_model->userlist()->userLeft(sid);
	return true;
}

bool Client::handleUserCount(const Message &msg)
{
	QJsonValue count = msg.payload().value(QStringLiteral("count"));
	if(!count.isDouble()) {
		return false;
	}
	m_model->userlist()->setUserCount(count.toInt());
	return true;
}

}
