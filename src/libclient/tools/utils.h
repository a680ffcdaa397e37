// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBCLIENT_TOOLS_UTILS_H
#define LIBCLIENT_TOOLS_UTILS_H
#include <QPointF>
#include <QRectF>
#include <QString>

namespace canvas {
struct CanvasObject;
struct Stroke;
}

namespace tools {

namespace hittest {

//! Extra margin around boxed objects when picking them
static constexpr qreal BOX_MARGIN = 10.0;

//! Maximum distance from a line or arrow when picking it
static constexpr qreal LINE_DISTANCE = 15.0;

//! Size of the box used to pick a text object
static constexpr qreal TEXT_BOX_WIDTH = 100.0;
static constexpr qreal TEXT_BOX_HEIGHT = 30.0;

qreal distance(const QPointF &p1, const QPointF &p2);

/**
 * @brief Distance from a point to a line segment
 *
 * Falls back to the distance between the two points if the segment has no
 * length.
 */
qreal pointToSegmentDistance(
	const QPointF &point, const QPointF &start, const QPointF &end);

//! Does the point select the given object?
bool objectContains(const canvas::CanvasObject &object, const QPointF &point);

/**
 * @brief Does an eraser of the given size at this point touch the stroke?
 *
 * The reach is twice the eraser size plus half of the stroke's own size.
 */
bool eraserTouches(
	const canvas::Stroke &stroke, const QPointF &point, qreal eraserSize);

}

//! Generate a new unique ID for a stroke or object
QString generateId();

}

#endif
