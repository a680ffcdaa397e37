// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBCLIENT_CANVAS_POINT_H
#define LIBCLIENT_CANVAS_POINT_H
#include <QJsonObject>
#include <QPointF>
#include <QVector>
#include <optional>

class QJsonValue;

namespace canvas {

/**
 * @brief A single sampled point of a freehand stroke
 *
 * Points are immutable once created.
 */
class StrokePoint final {
public:
	static constexpr qreal DEFAULT_PRESSURE = 0.5;

	StrokePoint()
		: m_x(0.0)
		, m_y(0.0)
		, m_pressure(DEFAULT_PRESSURE)
		, m_tilt(0.0)
		, m_timestampMs(0)
	{
	}

	StrokePoint(
		qreal x, qreal y, qreal pressure = DEFAULT_PRESSURE, qreal tilt = 0.0,
		qint64 timestampMs = 0)
		: m_x(x)
		, m_y(y)
		, m_pressure(qBound(0.0, pressure, 1.0))
		, m_tilt(tilt)
		, m_timestampMs(timestampMs)
	{
	}

	qreal x() const { return m_x; }
	qreal y() const { return m_y; }
	QPointF pos() const { return QPointF(m_x, m_y); }

	//! Pen pressure in range [0, 1]
	qreal pressure() const { return m_pressure; }

	qreal tilt() const { return m_tilt; }

	//! Time at which this point was put on the canvas
	qint64 timestampMs() const { return m_timestampMs; }

	QJsonObject toJson() const;

	/**
	 * @brief Parse a point from its wire form
	 *
	 * The x and y coordinates are mandatory, everything else falls back to
	 * the defaults.
	 */
	static std::optional<StrokePoint> fromJson(const QJsonValue &value);

	bool operator==(const StrokePoint &other) const
	{
		return m_x == other.m_x && m_y == other.m_y &&
			   m_pressure == other.m_pressure && m_tilt == other.m_tilt &&
			   m_timestampMs == other.m_timestampMs;
	}

	bool operator!=(const StrokePoint &other) const
	{
		return !(*this == other);
	}

private:
	qreal m_x;
	qreal m_y;
	qreal m_pressure;
	qreal m_tilt;
	qint64 m_timestampMs;
};

typedef QVector<StrokePoint> PointVector;

}

Q_DECLARE_TYPEINFO(canvas::StrokePoint, Q_MOVABLE_TYPE);

#endif
