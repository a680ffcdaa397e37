// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBCLIENT_TOOLS_TOOL_H
#define LIBCLIENT_TOOLS_TOOL_H
#include "libclient/canvas/history.h"
#include "libclient/canvas/point.h"
#include "libclient/tools/enums.h"
#include <QPointF>
#include <QVector>
#include "libshared/net/message.h"
#include <optional>

namespace canvas {
class CanvasModel;
}

/**
 * @brief Tools
 *
 * Tools translate pointer input from the local user into model changes and
 * messages that can be sent over the network. Each tool is a set of plain
 * functions over the edit state: they never touch the model or the network
 * themselves, they only describe what should happen.
 */
namespace tools {

//! A pointer event, already converted to canvas coordinates
struct PointerEvent {
	QPointF point;
	qreal pressure = canvas::StrokePoint::DEFAULT_PRESSURE;
	qreal tilt = 0.0;
	qint64 timestampMs = 0;

	canvas::StrokePoint toStrokePoint() const
	{
		return canvas::StrokePoint(
			point.x(), point.y(), pressure, tilt, timestampMs);
	}
};

//! The tool settings and read-only model access tools work with
struct ToolContext {
	const canvas::CanvasModel &model;
	Type type;
	quint32 color;
	qreal strokeSize;
	QString layerId;
	QString userId;
};

//! Everything that is in progress between pointer down and up
struct EditState {
	//! The freehand stroke being drawn
	std::optional<canvas::Stroke> stroke;

	//! The shape being dragged out
	std::optional<canvas::CanvasObject> shape;

	//! Currently selected object, empty if none
	QString selectedObjectId;

	//! Where the drag started or was last re-anchored
	std::optional<QPointF> dragAnchor;

	//! Selected object state at the beginning of a drag
	std::optional<canvas::CanvasObject> dragOrigin;

	//! The eraser is held down
	bool erasing = false;
};

//! A finished local change and the messages that announce it
struct Commit {
	canvas::Action action;

	//! Sent only if the model accepts the action
	net::MessageList messages;
};

//! What a tool wants done as a result of an event
struct Effects {
	//! Finished local changes: apply to the model and record in history
	QVector<Commit> commits;

	//! Object states to put in the model right away, without history
	QVector<canvas::CanvasObject> liveUpdates;

	//! Messages to send
	net::MessageList messages;

	void append(const Effects &other)
	{
		commits += other.commits;
		liveUpdates += other.liveUpdates;
		messages += other.messages;
	}
};

}

#endif
