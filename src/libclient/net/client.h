// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBCLIENT_NET_CLIENT_H
#define LIBCLIENT_NET_CLIENT_H
#include <QObject>
#include <QUrl>
#include <functional>
#include "libshared/net/message.h"

class QTimer;

namespace canvas {
class CanvasModel;
class History;
}

namespace net {

class MessageQueue;

/**
 * The client for accessing the relay server.
 *
 * Messages received from the server are merged into the canvas model. They
 * bypass the undo history, since remote changes can't be undone locally.
 * If the connection drops, the client tries to reconnect a limited number of
 * times and rejoins the board it was on.
 */
class Client final : public QObject {
	Q_OBJECT
public:
	enum class ConnectionState {
		Disconnected,
		Connecting,
		Connected,
		Reconnecting,
		Error,
	};
	Q_ENUM(ConnectionState)

	static constexpr int DEFAULT_RECONNECT_ATTEMPTS = 10;
	static constexpr int DEFAULT_RECONNECT_DELAY_MS = 1000;

	/**
	 * @brief Construct a client on top of a message queue
	 *
	 * The client takes ownership of the queue if it has no parent.
	 */
	Client(
		MessageQueue *queue, canvas::CanvasModel *model,
		canvas::History *history, QObject *parent = nullptr);

	MessageQueue *messageQueue() const { return m_queue; }

	void setReconnectPolicy(int maxAttempts, int delayMs);
	int maxReconnectAttempts() const { return m_maxReconnectAttempts; }
	int reconnectDelayMs() const { return m_reconnectDelayMs; }

	//! Number of reconnection attempts made since the connection was lost
	int reconnectAttempt() const { return m_reconnectAttempt; }

	//! Set the identity announced when joining a board
	void setUserInfo(const QString &userId, const QString &displayName);
	const QString &userId() const { return m_userId; }
	const QString &displayName() const { return m_displayName; }

	//! Replace the clock used to timestamp cursor updates
	void setClock(const std::function<qint64()> &clock);

	/**
	 * @brief Connect to a relay server
	 *
	 * If a board has been joined already, it is joined again once the
	 * connection is up.
	 */
	void connectToServer(const QUrl &url);

	/**
	 * @brief Disconnect from the server
	 *
	 * No reconnection attempts are made after this.
	 */
	void disconnectFromServer();

	ConnectionState connectionState() const { return m_state; }
	bool isConnected() const { return m_state == ConnectionState::Connected; }
	const QUrl &serverUrl() const { return m_url; }

	/**
	 * @brief Join a board
	 *
	 * When switching to a different board, the previous one is left and the
	 * local canvas, presence and undo history are reset. Board events are
	 * ignored until the new board's snapshot arrives.
	 */
	void joinBoard(const QString &boardId);

	/**
	 * @brief Stop listening to the current board
	 *
	 * Events for the board still in flight are ignored. What has been
	 * received so far stays in the model.
	 */
	void leaveBoard();

	//! The board currently joined, empty if none
	const QString &boardId() const { return m_boardId; }

	//! Waiting for the snapshot of a freshly joined board?
	bool isAwaitingBoardState() const { return m_awaitingBoardState; }

	static QString connectionStateName(ConnectionState state);

public slots:
	/**
	 * @brief Send a single message to the server
	 *
	 * Just a convenience method around sendMessages.
	 */
	void sendMessage(const net::Message &msg);

	/**
	 * @brief Send messages to the server
	 *
	 * Messages are dropped if there is no connection. Nothing is queued up
	 * for later delivery.
	 */
	void sendMessages(int count, const net::Message *msgs);

	/**
	 * @brief Handle all messages waiting in the queue's inbox
	 *
	 * This happens automatically once per event loop iteration when
	 * messages arrive.
	 */
	void drainInbox();

signals:
	void connectionStateChanged(net::Client::ConnectionState state);
	void connectionError(const QString &message);

	//! A board snapshot was applied
	void boardStateReceived(const QString &boardId, int strokeCount);

	//! A board event passed the filters and was handled
	void messageReceived(const net::Message &msg);

	//! Someone cleared the board
	void boardCleared();

private slots:
	void handleConnected();
	void handleDisconnected(bool localDisconnect);
	void handleConnectionFailed(const QString &errorString);
	void scheduleDrain();
	void attemptReconnect();

private:
	void setConnectionState(ConnectionState state);
	void scheduleReconnect();
	void sendJoin();

	bool acceptBoardEvent(const Message &msg);
	void handleMessage(const Message &msg);
	bool handleBoardState(const Message &msg);
	bool handleStrokeStart(const Message &msg);
	bool handleStrokeUpdate(const Message &msg);
	bool handleStrokeEnd(const Message &msg);
	bool handleCursorUpdate(const Message &msg);
	bool handleObjectAdded(const Message &msg);
	bool handleObjectUpdated(const Message &msg);
	bool handleObjectDeleted(const Message &msg);
	bool handleBoardCleared();
	bool handleUserJoined(const Message &msg);
	bool handleUserLeft(const Message &msg);
	bool handleUserCount(const Message &msg);

	MessageQueue *m_queue;
	canvas::CanvasModel *m_model;
	canvas::History *m_history;
	QTimer *m_reconnectTimer;
	std::function<qint64()> m_clock;

	ConnectionState m_state = ConnectionState::Disconnected;
	QUrl m_url;
	int m_maxReconnectAttempts = DEFAULT_RECONNECT_ATTEMPTS;
	int m_reconnectDelayMs = DEFAULT_RECONNECT_DELAY_MS;
	int m_reconnectAttempt = 0;
	bool m_localDisconnect = false;
	bool m_drainQueued = false;

	QString m_userId;
	QString m_displayName;
	QString m_boardId;
	bool m_awaitingBoardState = false;
};

}

#endif
