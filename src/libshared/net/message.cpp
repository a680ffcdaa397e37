// SPDX-License-Identifier: GPL-3.0-or-later
#include "libshared/net/message.h"
#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

namespace net {

namespace {

struct MessageTypeName {
	MessageType type;
	const char *name;
};

constexpr MessageTypeName MESSAGE_TYPE_NAMES[] = {
	{MessageType::JoinBoard, "join_board"},
	{MessageType::LeaveBoard, "leave_board"},
	{MessageType::StrokeStart, "stroke_start"},
	{MessageType::StrokeUpdate, "stroke_update"},
	{MessageType::StrokeEnd, "stroke_end"},
	{MessageType::CursorMove, "cursor_move"},
	{MessageType::CursorUpdate, "cursor_update"},
	{MessageType::ObjectAdd, "object_add"},
	{MessageType::ObjectAdded, "object_added"},
	{MessageType::ObjectUpdate, "object_update"},
	{MessageType::ObjectUpdated, "object_updated"},
	{MessageType::ObjectDelete, "object_delete"},
	{MessageType::ObjectDeleted, "object_deleted"},
	{MessageType::ClearBoard, "clear_board"},
	{MessageType::BoardCleared, "board_cleared"},
	{MessageType::BoardState, "board_state"},
	{MessageType::UserJoined, "user_joined"},
	{MessageType::UserLeft, "user_left"},
	{MessageType::UserCount, "user_count"},
};

}

Message Message::deserialize(const QByteArray &bytes)
{
	QJsonParseError err;
	QJsonDocument doc = QJsonDocument::fromJson(bytes, &err);
	if(err.error != QJsonParseError::NoError) {
		qWarning(
			"Message::deserialize JSON parsing error: %s",
			qUtf8Printable(err.errorString()));
		return null();
	}

	if(!doc.isArray()) {
		qWarning("Message::deserialize: not a JSON array");
		return null();
	}

	QJsonArray args = doc.array();
	QString name = args.at(0).toString();
	if(name.isEmpty()) {
		qWarning("Message::deserialize: missing event name");
		return null();
	}

	QJsonValue data = args.at(1);
	if(!data.isUndefined() && !data.isNull() && !data.isObject()) {
		qWarning(
			"Message::deserialize: payload of '%s' is not an object",
			qUtf8Printable(name));
		return null();
	}

	return Message(name, data.toObject());
}

QString Message::typeName(MessageType type)
{
	for(const MessageTypeName &mtn : MESSAGE_TYPE_NAMES) {
		if(mtn.type == type) {
			return QString::fromLatin1(mtn.name);
		}
	}
	return QString();
}

MessageType Message::typeFromName(const QString &name)
{
	for(const MessageTypeName &mtn : MESSAGE_TYPE_NAMES) {
		if(name == QLatin1String(mtn.name)) {
			return mtn.type;
		}
	}
	return MessageType::Unknown;
}

Message::Message()
	: m_type(MessageType::Unknown)
{
}

Message::Message(MessageType type, const QJsonObject &payload)
	: m_type(type)
	, m_name(typeName(type))
	, m_payload(payload)
{
}

Message::Message(const QString &name, const QJsonObject &payload)
	: m_type(typeFromName(name))
	, m_name(name)
	, m_payload(payload)
{
}

QString Message::boardId() const
{
	return m_payload.value(QStringLiteral("board_id")).toString();
}

QByteArray Message::serialize() const
{
	QJsonArray args{m_name, m_payload};
	return QJsonDocument(args).toJson(QJsonDocument::Compact);
}

bool Message::equals(const Message &other) const
{
	return m_name == other.m_name && m_payload == other.m_payload;
}

}
