// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBSHARED_NET_MESSAGE_H
#define LIBSHARED_NET_MESSAGE_H
#include <QJsonObject>
#include <QMetaType>
#include <QString>
#include <QVector>

class QByteArray;

namespace net {

enum class MessageType {
	Unknown,
	JoinBoard,
	LeaveBoard,
	StrokeStart,
	StrokeUpdate,
	StrokeEnd,
	CursorMove,
	CursorUpdate,
	ObjectAdd,
	ObjectAdded,
	ObjectUpdate,
	ObjectUpdated,
	ObjectDelete,
	ObjectDeleted,
	ClearBoard,
	BoardCleared,
	BoardState,
	UserJoined,
	UserLeft,
	UserCount,
};

using MessageList = QVector<class Message>;

/**
 * @brief A single event exchanged with the relay server
 *
 * On the wire, a message is the argument list of a Socket.IO event:
 * ["<name>", {...}]. The event name is kept verbatim even if it is not one we
 * know, so that it can be logged.
 */
class Message final {
public:
	static Message null() { return Message(); }

	/**
	 * @brief Parse a message from a Socket.IO event argument list
	 *
	 * Returns a null message if the input is not a JSON array, lacks an
	 * event name or has a non-object payload. Arguments after the payload
	 * are ignored.
	 */
	static Message deserialize(const QByteArray &bytes);

	static QString typeName(MessageType type);
	static MessageType typeFromName(const QString &name);

	Message();
	Message(MessageType type, const QJsonObject &payload = QJsonObject());
	Message(const QString &name, const QJsonObject &payload);

	bool isNull() const { return m_name.isEmpty(); }

	MessageType type() const { return m_type; }
	const QString &name() const { return m_name; }
	const QJsonObject &payload() const { return m_payload; }

	//! Board ID carried by the payload, empty if there is none
	QString boardId() const;

	QByteArray serialize() const;

	bool equals(const Message &other) const;

private:
	MessageType m_type;
	QString m_name;
	QJsonObject m_payload;
};

}

Q_DECLARE_METATYPE(net::Message)

#endif
