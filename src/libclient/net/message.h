// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBCLIENT_NET_MESSAGE_H
#define LIBCLIENT_NET_MESSAGE_H
#include "libclient/canvas/point.h"
#include "libshared/net/message.h"

class QString;

namespace canvas {
struct CanvasObject;
struct Stroke;
}

namespace net {

Message makeJoinBoardMessage(
	const QString &boardId, const QString &userId, const QString &displayName);

Message makeLeaveBoardMessage(const QString &boardId);

Message makeStrokeStartMessage(const canvas::Stroke &stroke);

//! Carries only the points that were added since the previous update
Message makeStrokeUpdateMessage(
	const QString &strokeId, const canvas::PointVector &points);

Message makeStrokeEndMessage(const QString &strokeId);

Message makeCursorMoveMessage(qreal x, qreal y);

Message makeObjectAddMessage(const canvas::CanvasObject &object);

Message makeObjectUpdateMessage(const canvas::CanvasObject &object);

Message makeObjectDeleteMessage(const QString &objectId);

Message makeClearBoardMessage();

}

#endif
