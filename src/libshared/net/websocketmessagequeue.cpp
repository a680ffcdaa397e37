// SPDX-License-Identifier: GPL-3.0-or-later
#include "libshared/net/websocketmessagequeue.h"
#include <QDebug>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QTimer>
#include <QUrlQuery>
#include <QWebSocket>

Q_DECLARE_LOGGING_CATEGORY(lcIbTransport)

namespace net {

namespace {

// Engine.IO's default ping timeout, also used as the handshake deadline
constexpr int HANDSHAKE_TIMEOUT_MS = 20000;

}

WebSocketMessageQueue::WebSocketMessageQueue(QObject *parent)
	: MessageQueue(parent)
	, m_socket(new QWebSocket(QString(), QWebSocketProtocol::VersionLatest, this))
	, m_pingTimer(new QTimer(this))
{
	m_pingTimer->setSingleShot(true);
	connect(
		m_pingTimer, &QTimer::timeout, this,
		&WebSocketMessageQueue::handlePingTimeout);

	connect(
		m_socket, &QWebSocket::connected, this,
		&WebSocketMessageQueue::handleConnected);
	connect(
		m_socket, &QWebSocket::disconnected, this,
		&WebSocketMessageQueue::handleDisconnected);
#if QT_VERSION >= QT_VERSION_CHECK(6, 5, 0)
	connect(
		m_socket, &QWebSocket::errorOccurred, this,
		&WebSocketMessageQueue::handleError);
#else
	connect(
		m_socket,
		QOverload<QAbstractSocket::SocketError>::of(&QWebSocket::error), this,
		&WebSocketMessageQueue::handleError);
#endif
	connect(
		m_socket, &QWebSocket::textMessageReceived, this,
		&WebSocketMessageQueue::receiveTextMessage);
	connect(
		m_socket, &QWebSocket::binaryMessageReceived, this,
		&WebSocketMessageQueue::receiveBinaryMessage);
}

QUrl WebSocketMessageQueue::endpointUrl(const QUrl &url)
{
	QUrl result = url;
	if(result.path().isEmpty() || result.path() == QStringLiteral("/")) {
		result.setPath(QStringLiteral("/socket.io/"));
	}

	QUrlQuery query(result);
	if(!query.hasQueryItem(QStringLiteral("EIO"))) {
		query.addQueryItem(QStringLiteral("EIO"), QStringLiteral("4"));
	}
	if(!query.hasQueryItem(QStringLiteral("transport"))) {
		query.addQueryItem(
			QStringLiteral("transport"), QStringLiteral("websocket"));
	}
	result.setQuery(query);
	return result;
}

void WebSocketMessageQueue::connectToServer(const QUrl &url)
{
	QUrl endpoint = endpointUrl(url);
	qCDebug(lcIbTransport) << "Opening WebSocket to" << endpoint;
	m_localDisconnect = false;
	m_state = State::Opening;
	m_socket->open(endpoint);
}

void WebSocketMessageQueue::disconnectFromServer()
{
	m_localDisconnect = true;
	if(m_socket->state() == QAbstractSocket::UnconnectedState) {
		if(m_state != State::Closed) {
			handleDisconnected();
		}
	} else {
		if(m_state == State::Connected) {
			sendPacket(QStringLiteral("41"));
		}
		m_socket->close();
	}
}

void WebSocketMessageQueue::enqueueMessages(int count, const net::Message *msgs)
{
	for(int i = 0; i < count; ++i) {
		QString frame = QStringLiteral("42") + QString::fromUtf8(msgs[i].serialize());
		qint64 sent = m_socket->sendTextMessage(frame);
		if(sent <= 0) {
			qCWarning(
				lcIbTransport, "Error sending '%s'",
				qUtf8Printable(msgs[i].name()));
			break;
		}
		emit bytesSent(int(sent));
	}
}

void WebSocketMessageQueue::handleConnected()
{
	qCDebug(lcIbTransport) << "WebSocket open to" << m_socket->requestUrl();
	m_state = State::Handshaking;
	m_pingTimer->start(HANDSHAKE_TIMEOUT_MS);
}

void WebSocketMessageQueue::handleDisconnected()
{
	m_pingTimer->stop();
	State previous = m_state;
	m_state = State::Closed;

	if(previous == State::Connected) {
		qCInfo(lcIbTransport, "Disconnected, local %d", int(m_localDisconnect));
		emit disconnected(m_localDisconnect);
	} else if(previous != State::Closed && !m_localDisconnect) {
		emit connectionFailed(QStringLiteral("Connection closed during handshake"));
	}
}

void WebSocketMessageQueue::handleError(QAbstractSocket::SocketError error)
{
	QString errorString = m_socket->errorString();
	qCWarning(
		lcIbTransport, "Socket error %d: %s", int(error),
		qUtf8Printable(errorString));
	// Errors on an established connection are followed by disconnected().
	if(!m_localDisconnect) {
		failHandshake(errorString);
	}
}

void WebSocketMessageQueue::handlePingTimeout()
{
	if(m_state == State::Connected) {
		qCWarning(lcIbTransport, "Ping timeout, dropping connection");
		m_socket->abort();
	} else {
		failHandshake(QStringLiteral("Handshake timed out"));
	}
}

void WebSocketMessageQueue::receiveTextMessage(const QString &text)
{
	emit bytesReceived(int(text.toUtf8().size()));
	if(m_pingTimer->isActive() && m_state == State::Connected) {
		m_pingTimer->start();
	}

	if(text.isEmpty()) {
		emit badData(0);
		return;
	}

	switch(text.at(0).unicode()) {
	case '0': {
		QJsonObject params =
			QJsonDocument::fromJson(text.mid(1).toUtf8()).object();
		handleOpenPacket(params);
		break;
	}
	case '1':
		qCInfo(lcIbTransport, "Server closed the session");
		m_socket->close();
		break;
	case '2':
		// Pong echoes the ping's payload, if there is one
		sendPacket(QStringLiteral("3") + text.mid(1));
		break;
	case '3':
	case '6':
		break;
	case '4':
		handleSocketPacket(text.mid(1));
		break;
	default:
		qCWarning(
			lcIbTransport, "Unhandled Engine.IO packet type '%s'",
			qUtf8Printable(text.left(1)));
		emit badData(int(text.toUtf8().size()));
		break;
	}
}

void WebSocketMessageQueue::receiveBinaryMessage(const QByteArray &bytes)
{
	qCWarning(
		lcIbTransport, "Unexpected WebSocket binary message of %d bytes",
		int(bytes.size()));
	emit badData(int(bytes.size()));
}

void WebSocketMessageQueue::handleOpenPacket(const QJsonObject &params)
{
	if(m_state != State::Handshaking) {
		qCWarning(lcIbTransport, "Unexpected open packet");
		return;
	}

	int pingInterval = params.value(QStringLiteral("pingInterval")).toInt();
	int pingTimeout = params.value(QStringLiteral("pingTimeout")).toInt();
	qCDebug(
		lcIbTransport, "Session %s, ping interval %d, timeout %d",
		qUtf8Printable(params.value(QStringLiteral("sid")).toString()),
		pingInterval, pingTimeout);
	if(pingInterval > 0 && pingTimeout > 0) {
		m_pingTimer->setInterval(pingInterval + pingTimeout);
	} else {
		m_pingTimer->setInterval(HANDSHAKE_TIMEOUT_MS);
	}
	m_pingTimer->start();

	// Join the default namespace
	sendPacket(QStringLiteral("40"));
}

void WebSocketMessageQueue::handleSocketPacket(const QString &packet)
{
	if(packet.isEmpty()) {
		emit badData(0);
		return;
	}

	QChar type = packet.at(0);
	QString body = packet.mid(1);

	if(body.startsWith(QLatin1Char('/'))) {
		int comma = body.indexOf(QLatin1Char(','));
		QString nsp = comma < 0 ? body : body.left(comma);
		if(nsp != QStringLiteral("/")) {
			qCWarning(
				lcIbTransport, "Packet for namespace %s ignored",
				qUtf8Printable(nsp));
			emit badData(int(packet.toUtf8().size()));
			return;
		}
		body = comma < 0 ? QString() : body.mid(comma + 1);
	}

	// Acknowledgement IDs are not used
	int start = 0;
	while(start < body.length() && body.at(start).isDigit()) {
		++start;
	}
	body = body.mid(start);

	switch(type.unicode()) {
	case '0':
		if(m_state == State::Handshaking) {
			m_state = State::Connected;
			qCInfo(lcIbTransport) << "Connected to" << m_socket->requestUrl();
			emit connected();
		}
		break;
	case '1':
		qCInfo(lcIbTransport, "Server disconnected us from the namespace");
		m_socket->close();
		break;
	case '2': {
		if(m_state != State::Connected) {
			qCWarning(lcIbTransport, "Event received before connecting");
			emit badData(int(packet.toUtf8().size()));
			break;
		}
		net::Message msg = net::Message::deserialize(body.toUtf8());
		if(msg.isNull()) {
			emit badData(int(packet.toUtf8().size()));
		} else {
			receiveMessage(msg);
		}
		break;
	}
	case '4': {
		QJsonObject error = QJsonDocument::fromJson(body.toUtf8()).object();
		QString message = error.value(QStringLiteral("message")).toString();
		failHandshake(
			message.isEmpty() ? QStringLiteral("Connection refused") : message);
		break;
	}
	default:
		qCWarning(
			lcIbTransport, "Unhandled Socket.IO packet type '%s'",
			qUtf8Printable(QString(type)));
		emit badData(int(packet.toUtf8().size()));
		break;
	}
}

void WebSocketMessageQueue::failHandshake(const QString &errorString)
{
	if(m_state == State::Opening || m_state == State::Handshaking) {
		m_state = State::Closed;
		m_pingTimer->stop();
		emit connectionFailed(errorString);
		m_socket->abort();
	}
}

void WebSocketMessageQueue::sendPacket(const QString &packet)
{
	if(m_socket->sendTextMessage(packet) <= 0) {
		qCWarning(
			lcIbTransport, "Error sending packet '%s'",
			qUtf8Printable(packet.left(2)));
	}
}

}
