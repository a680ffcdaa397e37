// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBCLIENT_CANVAS_CANVASOBJECT_H
#define LIBCLIENT_CANVAS_CANVASOBJECT_H
#include "libclient/canvas/stroke.h"
#include <QJsonObject>
#include <QRectF>
#include <QString>
#include <optional>

namespace canvas {

enum class ObjectType { Rectangle, Circle, Ellipse, Line, Arrow, Text };

QString objectTypeName(ObjectType type);
std::optional<ObjectType> objectTypeFromName(const QString &name);

/**
 * @brief A discrete shape or text primitive
 *
 * Lines and arrows span from (x, y) to (x2, y2). Everything else occupies
 * the box (x, y, x + width, y + height).
 */
struct CanvasObject {
	static constexpr qreal DEFAULT_STROKE_WIDTH = 2.0;

	QString id;
	ObjectType type = ObjectType::Rectangle;
	QString layerId = DEFAULT_LAYER_ID;
	qreal x = 0.0;
	qreal y = 0.0;
	qreal width = 0.0;
	qreal height = 0.0;
	qreal rotation = 0.0;
	quint32 color = Stroke::DEFAULT_COLOR;
	qreal strokeWidth = DEFAULT_STROKE_WIDTH;
	bool filled = false;
	std::optional<quint32> fillColor;
	std::optional<QString> text;
	std::optional<qreal> fontSize;
	std::optional<QString> fontFamily;
	std::optional<qreal> x2;
	std::optional<qreal> y2;

	bool isLineLike() const
	{
		return type == ObjectType::Line || type == ObjectType::Arrow;
	}

	//! Axis aligned bounds, normalized for lines drawn in any direction
	QRectF boundingRect() const;

	//! Move the object, including its second endpoint if it has one
	void translate(qreal dx, qreal dy);

	//! The "properties" object of object_add and object_update events
	QJsonObject toProperties() const;

	/**
	 * @brief Apply a (partial) properties object on top of this one
	 *
	 * Only the fields present in the patch are changed. If any of them is
	 * malformed, nothing is changed and false is returned.
	 */
	bool applyProperties(const QJsonObject &properties);

	/**
	 * @brief Parse an object_add/object_added payload
	 *
	 * The payload has the form {object_id, type, properties, layer_id}.
	 */
	static std::optional<CanvasObject> fromWire(const QJsonObject &payload);

	bool operator==(const CanvasObject &other) const;
	bool operator!=(const CanvasObject &other) const
	{
		return !(*this == other);
	}
};

}

#endif
