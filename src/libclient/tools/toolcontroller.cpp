// SPDX-License-Identifier: GPL-3.0-or-later
#include "libclient/tools/toolcontroller.h"
#include "libclient/canvas/canvasmodel.h"
#include "libclient/canvas/history.h"
#include "libclient/canvas/layerlist.h"
#include "libclient/net/client.h"
#include "libclient/net/message.h"
#include "libclient/tools/annotation.h"
#include "libclient/tools/eraser.h"
#include "libclient/tools/freehand.h"
#include "libclient/tools/selection.h"
#include "libclient/tools/shapetools.h"
#include <QDateTime>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(lcIbTools, "net.inkboard.tools", QtWarningMsg)

namespace tools {

ToolController::ToolController(
	net::Client *client, canvas::CanvasModel *model, canvas::History *history,
	QObject *parent)
	: QObject(parent)
	, m_client(client)
	, m_model(model)
	, m_history(history)
	, m_textInput(nullptr)
	, m_activeTool(Type::Pen)
	, m_color(canvas::Stroke::DEFAULT_COLOR)
	, m_strokeSize(4.0)
	, m_zoom(1.0)
	, m_pressed(false)
{
	Q_ASSERT(client);
	Q_ASSERT(model);
	Q_ASSERT(history);
	connect(
		m_model, &canvas::CanvasModel::objectsChanged, this,
		&ToolController::dropStaleSelection);
}

void ToolController::setActiveTool(Type tool)
{
	if(tool != m_activeTool) {
		finishActiveTool();
		m_activeTool = tool;
		if(tool != Type::Select) {
			setSelection(QString());
		}
		emit activeToolChanged(tool);
	}
}

void ToolController::setZoom(qreal zoom)
{
	qreal z = qBound(ZOOM_MIN, zoom, ZOOM_MAX);
	if(z != m_zoom) {
		m_zoom = z;
		emit viewChanged();
	}
}

void ToolController::panBy(const QPointF &delta)
{
	if(!delta.isNull()) {
		m_panOffset += delta;
		emit viewChanged();
	}
}

QPointF ToolController::screenToCanvas(const QPointF &point) const
{
	return (point - m_panOffset) / m_zoom;
}

QVector<canvas::Stroke> ToolController::liveStrokes() const
{
	QVector<canvas::Stroke> strokes;
	if(m_state.stroke.has_value()) {
		strokes.append(*m_state.stroke);
	}
	return strokes;
}

QVector<canvas::CanvasObject> ToolController::liveObjects() const
{
	QVector<canvas::CanvasObject> objects;
	if(m_state.shape.has_value()) {
		objects.append(*m_state.shape);
	}
	return objects;
}

void ToolController::pointerDown(
	const QPointF &point, qreal pressure, qreal tilt, qint64 timestampMs)
{
	if(m_pressed) {
		finishActiveTool();
	}

	if(isBlockedByLock()) {
		qCDebug(lcIbTools, "Active layer is locked");
		return;
	}

	m_pressed = true;
	PointerEvent ev = makeEvent(point, pressure, tilt, timestampMs);
	ToolContext ctx = context();
	Effects effects;

	switch(m_activeTool) {
	case Type::Pen:
	case Type::Pencil:
	case Type::Marker:
		effects = freehand::begin(m_state, ctx, ev);
		break;
	case Type::Eraser:
		effects = eraser::begin(m_state, ctx, ev);
		break;
	case Type::Select: {
		effects = selection::begin(m_state, ctx, ev);
		emit selectionChanged(m_state.selectedObjectId);
		break;
	}
	case Type::Rectangle:
	case Type::Circle:
	case Type::Ellipse:
	case Type::Line:
	case Type::Arrow:
		effects = shape::begin(m_state, ctx, ev);
		break;
	case Type::Text:
		// Text is placed in one go, there's nothing to drag
		m_pressed = false;
		if(m_textInput) {
			std::optional<QString> text = m_textInput->requestText(ev.point);
			if(text.has_value()) {
				effects = annotation::create(ctx, ev, *text);
			}
		} else {
			qCWarning(lcIbTools, "No text input available");
		}
		break;
	}

	apply(effects);
}

void ToolController::pointerMove(
	const QPointF &point, qreal pressure, qreal tilt, qint64 timestampMs)
{
	PointerEvent ev = makeEvent(point, pressure, tilt, timestampMs);
	Effects effects;
	effects.messages.append(
		net::makeCursorMoveMessage(ev.point.x(), ev.point.y()));

	if(m_pressed) {
		ToolContext ctx = context();
		switch(m_activeTool) {
		case Type::Pen:
		case Type::Pencil:
		case Type::Marker:
			effects.append(freehand::motion(m_state, ev));
			break;
		case Type::Eraser:
			effects.append(eraser::motion(m_state, ctx, ev));
			break;
		case Type::Select:
			effects.append(selection::motion(m_state, ctx, ev));
			break;
		case Type::Rectangle:
		case Type::Circle:
		case Type::Ellipse:
		case Type::Line:
		case Type::Arrow:
			effects.append(shape::motion(m_state, ev));
			break;
		case Type::Text:
			break;
		}
	}

	apply(effects);
}

void ToolController::pointerUp()
{
	if(m_pressed) {
		finishActiveTool();
	}
}

void ToolController::pointerHover(const QPointF &point)
{
	QPointF p = screenToCanvas(point);
	m_client->sendMessage(net::makeCursorMoveMessage(p.x(), p.y()));
}

bool ToolController::undo()
{
	std::optional<canvas::Action> action = m_history->undo();
	if(!action.has_value()) {
		qCDebug(lcIbTools, "Nothing to undo");
		return false;
	}

	bool ok = canvas::revert(*m_model, *action);
	if(!ok) {
		qCWarning(lcIbTools, "Undone action could not be reverted");
	}
	emit historyChanged();
	return ok;
}

bool ToolController::redo()
{
	std::optional<canvas::Action> action = m_history->redo();
	if(!action.has_value()) {
		qCDebug(lcIbTools, "Nothing to redo");
		return false;
	}

	bool ok = canvas::replay(*m_model, *action);
	if(!ok) {
		qCWarning(lcIbTools, "Redone action could not be replayed");
	}
	emit historyChanged();
	return ok;
}

bool ToolController::deleteSelectedObject()
{
	const canvas::CanvasObject *o = m_model->object(m_state.selectedObjectId);
	if(!o) {
		return false;
	}

	Effects effects;
	effects.commits.append(Commit{
		canvas::action::DeleteObject{*o}, {net::makeObjectDeleteMessage(o->id)}});
	m_state.dragAnchor.reset();
	m_state.dragOrigin.reset();
	apply(effects);
	setSelection(QString());
	return true;
}

void ToolController::clearCanvas()
{
	cancel();

	Effects effects;
	effects.commits.append(Commit{
		canvas::action::ClearCanvas{m_model->strokes(), m_model->objects()},
		{net::makeClearBoardMessage()}});
	apply(effects);
}

void ToolController::cancel()
{
	m_state.stroke.reset();
	m_state.shape.reset();
	m_state.dragAnchor.reset();
	m_state.dragOrigin.reset();
	m_state.erasing = false;
	m_pressed = false;
	setSelection(QString());
}

PointerEvent ToolController::makeEvent(
	const QPointF &point, qreal pressure, qreal tilt, qint64 timestampMs) const
{
	PointerEvent ev;
	ev.point = screenToCanvas(point);
	ev.pressure = qBound(0.0, pressure, 1.0);
	ev.tilt = tilt;
	ev.timestampMs = timestampMs < 0 ? QDateTime::currentMSecsSinceEpoch()
									 : timestampMs;
	return ev;
}

ToolContext ToolController::context() const
{
	return ToolContext{
		*m_model,
		m_activeTool,
		m_color,
		m_strokeSize,
		m_model->layerlist()->activeLayerId(),
		m_userId,
	};
}

bool ToolController::isBlockedByLock() const
{
	const canvas::LayerListModel *layers = m_model->layerlist();
	return m_activeTool != Type::Select &&
		   layers->isLocked(layers->activeLayerId());
}

void ToolController::finishActiveTool()
{
	Effects effects;
	switch(m_activeTool) {
	case Type::Pen:
	case Type::Pencil:
	case Type::Marker:
		effects = freehand::end(m_state);
		break;
	case Type::Eraser:
		effects = eraser::end(m_state);
		break;
	case Type::Select:
		effects = selection::end(m_state, context());
		break;
	case Type::Rectangle:
	case Type::Circle:
	case Type::Ellipse:
	case Type::Line:
	case Type::Arrow:
		effects = shape::end(m_state);
		break;
	case Type::Text:
		break;
	}
	m_pressed = false;
	apply(effects);
}

void ToolController::apply(const Effects &effects)
{
	for(const canvas::CanvasObject &o : effects.liveUpdates) {
		m_model->replaceObject(o);
	}

	net::MessageList messages = effects.messages;
	bool pushed = false;
	for(const Commit &commit : effects.commits) {
		if(canvas::replay(*m_model, commit.action)) {
			m_history->push(commit.action);
			messages += commit.messages;
			pushed = true;
		} else {
			// Peers must not get what our own model doesn't have
			qCWarning(
				lcIbTools, "Local change rejected by the model, not sending %d "
				"message(s)", int(commit.messages.size()));
		}
	}
	if(pushed) {
		emit historyChanged();
	}

	if(!messages.isEmpty()) {
		m_client->sendMessages(int(messages.size()), messages.constData());
	}
}

void ToolController::setSelection(const QString &objectId)
{
	if(objectId != m_state.selectedObjectId) {
		m_state.selectedObjectId = objectId;
		emit selectionChanged(objectId);
	}
}

void ToolController::dropStaleSelection()
{
	if(!m_state.selectedObjectId.isEmpty() &&
	   !m_model->object(m_state.selectedObjectId)) {
		m_state.dragAnchor.reset();
		m_state.dragOrigin.reset();
		setSelection(QString());
	}
}

}
