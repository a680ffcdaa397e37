// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBSHARED_NET_WEBSOCKETMESSSAGEQUEUE_H
#define LIBSHARED_NET_WEBSOCKETMESSSAGEQUEUE_H
#include "libshared/net/messagequeue.h"
#include <QAbstractSocket>

class QJsonObject;
class QTimer;
class QWebSocket;

namespace net {

/**
 * @brief Message queue speaking Socket.IO v4 over a WebSocket
 *
 * The relay is a Socket.IO server, so every frame is an Engine.IO packet:
 * the server opens with "0{...}", the client joins the default namespace
 * with "40" and events travel as "42[name, payload]". The server pings with
 * "2" and expects "3" back. connected() is emitted once the namespace
 * connection is acknowledged, not when the WebSocket opens.
 */
class WebSocketMessageQueue final : public MessageQueue {
	Q_OBJECT
public:
	explicit WebSocketMessageQueue(QObject *parent = nullptr);

	/**
	 * @brief Fill in the Socket.IO endpoint parts missing from a URL
	 *
	 * An empty path becomes /socket.io/ and the EIO and transport query
	 * parameters are added unless the URL already has them.
	 */
	static QUrl endpointUrl(const QUrl &url);

	void connectToServer(const QUrl &url) override;
	void disconnectFromServer() override;
	bool isConnected() const override { return m_state == State::Connected; }

protected:
	void enqueueMessages(int count, const net::Message *msgs) override;

private slots:
	void handleConnected();
	void handleDisconnected();
	void handleError(QAbstractSocket::SocketError error);
	void handlePingTimeout();
	void receiveTextMessage(const QString &text);
	void receiveBinaryMessage(const QByteArray &bytes);

private:
	enum class State { Closed, Opening, Handshaking, Connected };

	void handleOpenPacket(const QJsonObject &params);
	void handleSocketPacket(const QString &packet);
	void failHandshake(const QString &errorString);
	void sendPacket(const QString &packet);

	QWebSocket *m_socket;
	QTimer *m_pingTimer;
	State m_state = State::Closed;
	bool m_localDisconnect = false;
};

}

#endif
