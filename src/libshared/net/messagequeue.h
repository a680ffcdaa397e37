// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBSHARED_NET_MESSAGEQUEUE_H
#define LIBSHARED_NET_MESSAGEQUEUE_H
#include "libshared/net/message.h"
#include <QObject>
#include <QUrl>

namespace net {

/**
 * A persistent bidirectional channel for sending and receiving messages.
 *
 * Sending is fire-and-forget: a message counts as sent once it has been
 * handed to the underlying socket. Received messages are collected in an
 * inbox that the owner drains with receive().
 */
class MessageQueue : public QObject {
	Q_OBJECT
public:
	explicit MessageQueue(QObject *parent = nullptr);

	/**
	 * @brief Open a connection to the given server
	 *
	 * Either connected() or connectionFailed() will be emitted later.
	 */
	virtual void connectToServer(const QUrl &url) = 0;

	//! Close the connection, disconnected(true) will be emitted
	virtual void disconnectFromServer() = 0;

	virtual bool isConnected() const = 0;

	/**
	 * @brief Check if there are new messages available
	 * @return true if receive will return at least one message
	 */
	bool isPending() const { return !m_inbox.isEmpty(); }

	/**
	 * Get received messages, swaps (!) the given buffer with the inbox.
	 */
	void receive(net::MessageList &buffer);

	/**
	 * Enqueue a single message for sending.
	 */
	void send(const net::Message &msg);

	/**
	 * Enqueue multiple messages for sending.
	 *
	 * Messages sent while not connected are discarded.
	 */
	void sendMultiple(int count, const net::Message *msgs);

signals:
	void connected();

	/**
	 * @brief An established connection was closed
	 * @param localDisconnect true if disconnectFromServer was called
	 */
	void disconnected(bool localDisconnect);

	//! A connection attempt did not succeed
	void connectionFailed(const QString &errorString);

	/**
	 * New message(s) are available. Get them with receive().
	 */
	void messageAvailable();

	/**
	 * A frame that couldn't be parsed into a message was received
	 * @param len length of the frame in bytes
	 */
	void badData(int len);

	void bytesReceived(int count);
	void bytesSent(int count);

protected:
	virtual void enqueueMessages(int count, const net::Message *msgs) = 0;

	//! Put a message into the inbox and notify listeners
	void receiveMessage(const net::Message &msg);

	net::MessageList m_inbox; // received (complete) messages
};

}

#endif
