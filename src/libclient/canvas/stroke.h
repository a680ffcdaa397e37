// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBCLIENT_CANVAS_STROKE_H
#define LIBCLIENT_CANVAS_STROKE_H
#include "libclient/canvas/point.h"
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <optional>

namespace canvas {

enum class StrokeTool { Pen, Eraser };

QString strokeToolName(StrokeTool tool);
std::optional<StrokeTool> strokeToolFromName(const QString &name);

//! ID of the layer that always exists on a fresh board
extern const QString DEFAULT_LAYER_ID;

/**
 * @brief A freehand ink path on one layer
 *
 * A stroke only grows by appending points until it is completed. After that
 * it doesn't change anymore.
 */
struct Stroke {
	static constexpr quint32 DEFAULT_COLOR = 0xff000000;
	static constexpr qreal DEFAULT_SIZE = 2.0;

	QString id;
	QString userId;
	StrokeTool tool = StrokeTool::Pen;
	quint32 color = DEFAULT_COLOR;
	qreal size = DEFAULT_SIZE;
	QString layerId = DEFAULT_LAYER_ID;
	PointVector points;
	bool completed = false;

	//! Full serialization, as found in board snapshots
	QJsonObject toJson() const;

	/**
	 * @brief Parse a stroke from a board snapshot
	 *
	 * Returns nothing if the ID is missing or any field is malformed.
	 */
	static std::optional<Stroke> fromJson(const QJsonObject &json);

	/**
	 * @brief Parse the header of a stroke_start event
	 *
	 * The resulting stroke has no points and is not completed.
	 */
	static std::optional<Stroke> fromStartPayload(const QJsonObject &payload);

	bool operator==(const Stroke &other) const;
	bool operator!=(const Stroke &other) const { return !(*this == other); }
};

//! Parse a JSON array of points, returns nothing if any point is malformed
std::optional<PointVector> pointsFromJson(const QJsonValue &value);

QJsonArray pointsToJson(const PointVector &points);

}

#endif
