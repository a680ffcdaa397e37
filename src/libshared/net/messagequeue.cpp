// SPDX-License-Identifier: GPL-3.0-or-later
#include "libshared/net/messagequeue.h"
#include <QDebug>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(lcIbTransport, "net.inkboard.transport", QtWarningMsg)

namespace net {

MessageQueue::MessageQueue(QObject *parent)
	: QObject(parent)
{
}

void MessageQueue::receive(net::MessageList &buffer)
{
	buffer.clear();
	m_inbox.swap(buffer);
}

void MessageQueue::send(const net::Message &msg)
{
	sendMultiple(1, &msg);
}

void MessageQueue::sendMultiple(int count, const net::Message *msgs)
{
	if(!isConnected()) {
		qCDebug(lcIbTransport, "Not connected, discarding %d message(s)", count);
		return;
	}

	if(count > 0) {
		enqueueMessages(count, msgs);
	}
}

void MessageQueue::receiveMessage(const net::Message &msg)
{
	m_inbox.append(msg);
	emit messageAvailable();
}

}
