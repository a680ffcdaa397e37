// SPDX-License-Identifier: GPL-3.0-or-later
#include "libclient/canvas/canvasobject.h"
#include "libshared/util/argb.h"
#include <QJsonValue>
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcIbCanvas)

namespace canvas {

namespace {

struct ObjectTypeName {
	ObjectType type;
	const char *name;
};

constexpr ObjectTypeName OBJECT_TYPE_NAMES[] = {
	{ObjectType::Rectangle, "rectangle"}, {ObjectType::Circle, "circle"},
	{ObjectType::Ellipse, "ellipse"},	  {ObjectType::Line, "line"},
	{ObjectType::Arrow, "arrow"},		  {ObjectType::Text, "text"},
};

bool isAbsent(const QJsonValue &value)
{
	return value.isUndefined() || value.isNull();
}

bool readNumber(const QJsonObject &json, const char *key, qreal &out)
{
	QJsonValue value = json.value(QLatin1String(key));
	if(value.isDouble()) {
		out = value.toDouble();
		return true;
	}
	return isAbsent(value);
}

bool readOptionalNumber(
	const QJsonObject &json, const char *key, std::optional<qreal> &out)
{
	QJsonValue value = json.value(QLatin1String(key));
	if(value.isDouble()) {
		out = value.toDouble();
		return true;
	}
	return isAbsent(value);
}

bool readOptionalString(
	const QJsonObject &json, const char *key, std::optional<QString> &out)
{
	QJsonValue value = json.value(QLatin1String(key));
	if(value.isString()) {
		out = value.toString();
		return true;
	}
	return isAbsent(value);
}

bool readColor(const QJsonObject &json, const char *key, quint32 &out)
{
	QJsonValue value = json.value(QLatin1String(key));
	if(isAbsent(value)) {
		return true;
	}
	std::optional<quint32> argb = utils::argbFromHex(value.toString());
	if(argb.has_value()) {
		out = *argb;
		return true;
	}
	return false;
}

}

QString objectTypeName(ObjectType type)
{
	for(const ObjectTypeName &otn : OBJECT_TYPE_NAMES) {
		if(otn.type == type) {
			return QString::fromLatin1(otn.name);
		}
	}
	return QString();
}

std::optional<ObjectType> objectTypeFromName(const QString &name)
{
	for(const ObjectTypeName &otn : OBJECT_TYPE_NAMES) {
		if(name == QLatin1String(otn.name)) {
			return otn.type;
		}
	}
	return {};
}

QRectF CanvasObject::boundingRect() const
{
	if(isLineLike()) {
		QPointF p1(x, y);
		QPointF p2(x2.value_or(x), y2.value_or(y));
		return QRectF(p1, p2).normalized();
	} else {
		return QRectF(x, y, width, height).normalized();
	}
}

void CanvasObject::translate(qreal dx, qreal dy)
{
	x += dx;
	y += dy;
	if(x2.has_value()) {
		*x2 += dx;
	}
	if(y2.has_value()) {
		*y2 += dy;
	}
}

QJsonObject CanvasObject::toProperties() const
{
	QJsonObject props{
		{QStringLiteral("x"), x},
		{QStringLiteral("y"), y},
		{QStringLiteral("width"), width},
		{QStringLiteral("height"), height},
		{QStringLiteral("rotation"), rotation},
		{QStringLiteral("color"), utils::argbToHex(color)},
		{QStringLiteral("stroke_width"), strokeWidth},
		{QStringLiteral("filled"), filled},
	};
	if(fillColor.has_value()) {
		props[QStringLiteral("fill_color")] = utils::argbToHex(*fillColor);
	}
	if(text.has_value()) {
		props[QStringLiteral("text")] = *text;
	}
	if(fontSize.has_value()) {
		props[QStringLiteral("font_size")] = *fontSize;
	}
	if(fontFamily.has_value()) {
		props[QStringLiteral("font_family")] = *fontFamily;
	}
	if(x2.has_value()) {
		props[QStringLiteral("x2")] = *x2;
	}
	if(y2.has_value()) {
		props[QStringLiteral("y2")] = *y2;
	}
	return props;
}

bool CanvasObject::applyProperties(const QJsonObject &properties)
{
	// Work on a copy so a malformed field leaves this object untouched
	CanvasObject o = *this;

	bool ok = readNumber(properties, "x", o.x) &&
			  readNumber(properties, "y", o.y) &&
			  readNumber(properties, "width", o.width) &&
			  readNumber(properties, "height", o.height) &&
			  readNumber(properties, "rotation", o.rotation) &&
			  readColor(properties, "color", o.color) &&
			  readNumber(properties, "stroke_width", o.strokeWidth) &&
			  readOptionalString(properties, "text", o.text) &&
			  readOptionalNumber(properties, "font_size", o.fontSize) &&
			  readOptionalString(properties, "font_family", o.fontFamily) &&
			  readOptionalNumber(properties, "x2", o.x2) &&
			  readOptionalNumber(properties, "y2", o.y2);
	if(!ok) {
		qCWarning(lcIbCanvas, "Malformed properties for object %s",
			qUtf8Printable(id));
		return false;
	}

	QJsonValue filled = properties.value(QStringLiteral("filled"));
	if(filled.isBool()) {
		o.filled = filled.toBool();
	} else if(!isAbsent(filled)) {
		return false;
	}

	QJsonValue fillColor = properties.value(QStringLiteral("fill_color"));
	if(!isAbsent(fillColor)) {
		std::optional<quint32> argb = utils::argbFromHex(fillColor.toString());
		if(!argb.has_value()) {
			return false;
		}
		o.fillColor = argb;
	}

	*this = o;
	return true;
}

std::optional<CanvasObject> CanvasObject::fromWire(const QJsonObject &payload)
{
	CanvasObject o;
	o.id = payload.value(QStringLiteral("object_id")).toString();
	if(o.id.isEmpty()) {
		return {};
	}

	std::optional<ObjectType> type =
		objectTypeFromName(payload.value(QStringLiteral("type")).toString());
	if(!type.has_value()) {
		return {};
	}
	o.type = *type;

	QString layerId = payload.value(QStringLiteral("layer_id")).toString();
	if(!layerId.isEmpty()) {
		o.layerId = layerId;
	}

	QJsonValue props = payload.value(QStringLiteral("properties"));
	if(props.isObject()) {
		if(!o.applyProperties(props.toObject())) {
			return {};
		}
	} else if(!isAbsent(props)) {
		return {};
	}

	return o;
}

bool CanvasObject::operator==(const CanvasObject &other) const
{
	return id == other.id && type == other.type && layerId == other.layerId &&
		   x == other.x && y == other.y && width == other.width &&
		   height == other.height && rotation == other.rotation &&
		   color == other.color && strokeWidth == other.strokeWidth &&
		   filled == other.filled && fillColor == other.fillColor &&
		   text == other.text && fontSize == other.fontSize &&
		   fontFamily == other.fontFamily && x2 == other.x2 && y2 == other.y2;
}

}
