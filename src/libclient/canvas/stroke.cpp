// SPDX-License-Identifier: GPL-3.0-or-later
#include "libclient/canvas/stroke.h"
#include "libshared/util/argb.h"
#include <QJsonArray>
#include <QJsonValue>

namespace canvas {

const QString DEFAULT_LAYER_ID = QStringLiteral("default");

namespace {

// Fills in the fields shared between snapshot strokes and stroke_start
// headers. Absent fields keep their defaults, malformed ones fail.
bool readStrokeHeader(const QJsonObject &json, Stroke &stroke)
{
	QJsonValue tool = json.value(QStringLiteral("tool"));
	if(!tool.isUndefined() && !tool.isNull()) {
		std::optional<StrokeTool> t = strokeToolFromName(tool.toString());
		if(!t.has_value()) {
			return false;
		}
		stroke.tool = *t;
	}

	QJsonValue color = json.value(QStringLiteral("color"));
	if(!color.isUndefined() && !color.isNull()) {
		std::optional<quint32> argb = utils::argbFromHex(color.toString());
		if(!argb.has_value()) {
			return false;
		}
		stroke.color = *argb;
	}

	QJsonValue size = json.value(QStringLiteral("size"));
	if(size.isDouble()) {
		stroke.size = size.toDouble();
	} else if(!size.isUndefined() && !size.isNull()) {
		return false;
	}

	QString layerId = json.value(QStringLiteral("layer_id")).toString();
	if(!layerId.isEmpty()) {
		stroke.layerId = layerId;
	}

	stroke.userId = json.value(QStringLiteral("user_id")).toString();
	return true;
}

}

QString strokeToolName(StrokeTool tool)
{
	switch(tool) {
	case StrokeTool::Pen:
		return QStringLiteral("pen");
	case StrokeTool::Eraser:
		return QStringLiteral("eraser");
	}
	return QString();
}

std::optional<StrokeTool> strokeToolFromName(const QString &name)
{
	if(name == QStringLiteral("pen")) {
		return StrokeTool::Pen;
	} else if(name == QStringLiteral("eraser")) {
		return StrokeTool::Eraser;
	} else {
		return {};
	}
}

std::optional<PointVector> pointsFromJson(const QJsonValue &value)
{
	if(value.isUndefined() || value.isNull()) {
		return PointVector();
	} else if(!value.isArray()) {
		return {};
	}

	QJsonArray array = value.toArray();
	PointVector points;
	points.reserve(array.size());
	for(const QJsonValue &v : array) {
		std::optional<StrokePoint> p = StrokePoint::fromJson(v);
		if(!p.has_value()) {
			return {};
		}
		points.append(*p);
	}
	return points;
}

QJsonArray pointsToJson(const PointVector &points)
{
	QJsonArray array;
	for(const StrokePoint &p : points) {
		array.append(p.toJson());
	}
	return array;
}

QJsonObject Stroke::toJson() const
{
	QJsonObject json{
		{QStringLiteral("id"), id},
		{QStringLiteral("tool"), strokeToolName(tool)},
		{QStringLiteral("color"), utils::argbToHex(color)},
		{QStringLiteral("size"), size},
		{QStringLiteral("layer_id"), layerId},
		{QStringLiteral("points"), pointsToJson(points)},
		{QStringLiteral("completed"), completed},
	};
	if(!userId.isEmpty()) {
		json[QStringLiteral("user_id")] = userId;
	}
	return json;
}

std::optional<Stroke> Stroke::fromJson(const QJsonObject &json)
{
	Stroke stroke;
	stroke.id = json.value(QStringLiteral("id")).toString();
	if(stroke.id.isEmpty() || !readStrokeHeader(json, stroke)) {
		return {};
	}

	std::optional<PointVector> points =
		pointsFromJson(json.value(QStringLiteral("points")));
	if(!points.has_value()) {
		return {};
	}
	stroke.points = *points;
	stroke.completed = json.value(QStringLiteral("completed")).toBool(false);
	return stroke;
}

std::optional<Stroke> Stroke::fromStartPayload(const QJsonObject &payload)
{
	Stroke stroke;
	stroke.id = payload.value(QStringLiteral("stroke_id")).toString();
	if(stroke.id.isEmpty() || !readStrokeHeader(payload, stroke)) {
		return {};
	}
	return stroke;
}

bool Stroke::operator==(const Stroke &other) const
{
	return id == other.id && userId == other.userId && tool == other.tool &&
		   color == other.color && size == other.size &&
		   layerId == other.layerId && points == other.points &&
		   completed == other.completed;
}

}
