// SPDX-License-Identifier: GPL-3.0-or-later
#include "libclient/net/message.h"
#include "libclient/canvas/canvasobject.h"
#include "libclient/canvas/stroke.h"
#include "libshared/util/argb.h"

namespace net {

Message makeJoinBoardMessage(
	const QString &boardId, const QString &userId, const QString &displayName)
{
	return Message(
		MessageType::JoinBoard,
		{
			{QStringLiteral("board_id"), boardId},
			{QStringLiteral("user_id"), userId},
			{QStringLiteral("display_name"), displayName},
		});
}

Message makeLeaveBoardMessage(const QString &boardId)
{
	return Message(
		MessageType::LeaveBoard, {{QStringLiteral("board_id"), boardId}});
}

Message makeStrokeStartMessage(const canvas::Stroke &stroke)
{
	return Message(
		MessageType::StrokeStart,
		{
			{QStringLiteral("stroke_id"), stroke.id},
			{QStringLiteral("tool"), canvas::strokeToolName(stroke.tool)},
			{QStringLiteral("color"), utils::argbToHex(stroke.color)},
			{QStringLiteral("size"), stroke.size},
			{QStringLiteral("layer_id"), stroke.layerId},
		});
}

Message makeStrokeUpdateMessage(
	const QString &strokeId, const canvas::PointVector &points)
{
	return Message(
		MessageType::StrokeUpdate,
		{
			{QStringLiteral("stroke_id"), strokeId},
			{QStringLiteral("points"), canvas::pointsToJson(points)},
		});
}

Message makeStrokeEndMessage(const QString &strokeId)
{
	return Message(
		MessageType::StrokeEnd, {{QStringLiteral("stroke_id"), strokeId}});
}

Message makeCursorMoveMessage(qreal x, qreal y)
{
	return Message(
		MessageType::CursorMove,
		{{QStringLiteral("x"), x}, {QStringLiteral("y"), y}});
}

Message makeObjectAddMessage(const canvas::CanvasObject &object)
{
	return Message(
		MessageType::ObjectAdd,
		{
			{QStringLiteral("object_id"), object.id},
			{QStringLiteral("type"), canvas::objectTypeName(object.type)},
			{QStringLiteral("properties"), object.toProperties()},
			{QStringLiteral("layer_id"), object.layerId},
		});
}

Message makeObjectUpdateMessage(const canvas::CanvasObject &object)
{
	return Message(
		MessageType::ObjectUpdate,
		{
			{QStringLiteral("object_id"), object.id},
			{QStringLiteral("properties"), object.toProperties()},
		});
}

Message makeObjectDeleteMessage(const QString &objectId)
{
	return Message(
		MessageType::ObjectDelete, {{QStringLiteral("object_id"), objectId}});
}

Message makeClearBoardMessage()
{
	return Message(MessageType::ClearBoard);
}

}
