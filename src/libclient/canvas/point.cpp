// SPDX-License-Identifier: GPL-3.0-or-later
#include "libclient/canvas/point.h"
#include <QJsonValue>

namespace canvas {

QJsonObject StrokePoint::toJson() const
{
	return QJsonObject{
		{QStringLiteral("x"), m_x},
		{QStringLiteral("y"), m_y},
		{QStringLiteral("pressure"), m_pressure},
		{QStringLiteral("tilt"), m_tilt},
		{QStringLiteral("timestamp"), double(m_timestampMs)},
	};
}

std::optional<StrokePoint> StrokePoint::fromJson(const QJsonValue &value)
{
	if(!value.isObject()) {
		return {};
	}

	QJsonObject json = value.toObject();
	QJsonValue x = json.value(QStringLiteral("x"));
	QJsonValue y = json.value(QStringLiteral("y"));
	if(!x.isDouble() || !y.isDouble()) {
		return {};
	}

	return StrokePoint(
		x.toDouble(), y.toDouble(),
		json.value(QStringLiteral("pressure")).toDouble(DEFAULT_PRESSURE),
		json.value(QStringLiteral("tilt")).toDouble(0.0),
		qint64(json.value(QStringLiteral("timestamp")).toDouble(0.0)));
}

}
