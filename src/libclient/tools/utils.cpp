// SPDX-License-Identifier: GPL-3.0-or-later
#include "libclient/tools/utils.h"
#include "libclient/canvas/canvasobject.h"
#include "libclient/canvas/stroke.h"
#include <QUuid>
#include <QtMath>

namespace tools {

namespace hittest {

qreal distance(const QPointF &p1, const QPointF &p2)
{
	qreal dx = p1.x() - p2.x();
	qreal dy = p1.y() - p2.y();
	return qSqrt(dx * dx + dy * dy);
}

qreal pointToSegmentDistance(
	const QPointF &point, const QPointF &start, const QPointF &end)
{
	qreal dx = end.x() - start.x();
	qreal dy = end.y() - start.y();
	qreal lengthSquared = dx * dx + dy * dy;
	if(lengthSquared == 0.0) {
		return distance(point, start);
	}

	qreal t = ((point.x() - start.x()) * dx + (point.y() - start.y()) * dy) /
			  lengthSquared;
	t = qBound(0.0, t, 1.0);
	return distance(point, QPointF(start.x() + t * dx, start.y() + t * dy));
}

bool objectContains(const canvas::CanvasObject &object, const QPointF &point)
{
	if(object.isLineLike()) {
		QPointF start(object.x, object.y);
		QPointF end(object.x2.value_or(object.x), object.y2.value_or(object.y));
		return pointToSegmentDistance(point, start, end) < LINE_DISTANCE;
	}

	QRectF box;
	if(object.type == canvas::ObjectType::Text) {
		box = QRectF(object.x, object.y, TEXT_BOX_WIDTH, TEXT_BOX_HEIGHT);
	} else {
		box = object.boundingRect();
	}
	return box.adjusted(-BOX_MARGIN, -BOX_MARGIN, BOX_MARGIN, BOX_MARGIN)
		.contains(point);
}

bool eraserTouches(
	const canvas::Stroke &stroke, const QPointF &point, qreal eraserSize)
{
	qreal radius = eraserSize * 2.0 + stroke.size / 2.0;
	for(const canvas::StrokePoint &p : stroke.points) {
		if(distance(p.pos(), point) < radius) {
			return true;
		}
	}
	return false;
}

}

QString generateId()
{
	return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

}
