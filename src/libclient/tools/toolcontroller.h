// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBCLIENT_TOOLS_TOOLCONTROLLER_H
#define LIBCLIENT_TOOLS_TOOLCONTROLLER_H
#include "libclient/tools/tool.h"
#include <QObject>
#include <QPointF>

namespace canvas {
class CanvasModel;
class History;
}

namespace net {
class Client;
}

namespace tools {

/**
 * @brief Asks the user for text to place on the canvas
 *
 * The request is synchronous: the call returns once the user has confirmed
 * or cancelled.
 */
class TextInputProvider {
public:
	virtual ~TextInputProvider() = default;

	//! Returns the entered text or nothing if the user cancelled
	virtual std::optional<QString> requestText(const QPointF &point) = 0;
};

/**
 * @brief The ToolController dispatches user input to the currently active tool
 *
 * Pointer positions are given in view coordinates and are converted to canvas
 * coordinates using the current pan offset and zoom. The effects produced by
 * the tools are applied here: finished changes go into the model and the
 * undo history, messages go to the client.
 */
class ToolController final : public QObject {
	Q_OBJECT
	Q_PROPERTY(QPointF panOffset READ panOffset NOTIFY viewChanged)
	Q_PROPERTY(qreal zoom READ zoom WRITE setZoom NOTIFY viewChanged)
public:
	static constexpr qreal ZOOM_MIN = 0.1;
	static constexpr qreal ZOOM_MAX = 5.0;

	ToolController(
		net::Client *client, canvas::CanvasModel *model,
		canvas::History *history, QObject *parent = nullptr);

	Type activeTool() const { return m_activeTool; }

	/**
	 * @brief Change the active tool
	 *
	 * Anything in progress with the previous tool is finished first.
	 */
	void setActiveTool(Type tool);

	quint32 color() const { return m_color; }
	void setColor(quint32 color) { m_color = color; }

	qreal strokeSize() const { return m_strokeSize; }
	void setStrokeSize(qreal size) { m_strokeSize = size; }

	const QString &userId() const { return m_userId; }
	void setUserId(const QString &userId) { m_userId = userId; }

	void setTextInputProvider(TextInputProvider *provider)
	{
		m_textInput = provider;
	}

	const QPointF &panOffset() const { return m_panOffset; }
	qreal zoom() const { return m_zoom; }

	//! Set the zoom factor, clamped to [ZOOM_MIN, ZOOM_MAX]
	void setZoom(qreal zoom);
	void zoomBy(qreal factor) { setZoom(m_zoom * factor); }
	void panBy(const QPointF &delta);

	QPointF screenToCanvas(const QPointF &point) const;

	const EditState &editState() const { return m_state; }
	const QString &selectedObjectId() const { return m_state.selectedObjectId; }

	//! The unfinished local stroke, if any
	QVector<canvas::Stroke> liveStrokes() const;

	//! The shape being dragged out, if any
	QVector<canvas::CanvasObject> liveObjects() const;

	/**
	 * @brief Start a pointer interaction
	 * @param timestampMs event time, or -1 for the current time
	 */
	void pointerDown(
		const QPointF &point, qreal pressure = 0.5, qreal tilt = 0.0,
		qint64 timestampMs = -1);

	//! Pointer moved while pressed
	void pointerMove(
		const QPointF &point, qreal pressure = 0.5, qreal tilt = 0.0,
		qint64 timestampMs = -1);

	void pointerUp();

	//! Pointer moved while not pressed
	void pointerHover(const QPointF &point);

	/**
	 * @brief Undo the latest local change
	 *
	 * Other users are not told about this.
	 */
	bool undo();

	//! Redo the latest undone local change
	bool redo();

	//! Delete the selected object
	bool deleteSelectedObject();

	//! Clear the whole board, for everyone
	void clearCanvas();

	//! Drop whatever is in progress without committing it
	void cancel();

signals:
	void activeToolChanged(Type tool);
	void selectionChanged(const QString &objectId);
	void viewChanged();
	void historyChanged();

private:
	PointerEvent makeEvent(
		const QPointF &point, qreal pressure, qreal tilt,
		qint64 timestampMs) const;
	ToolContext context() const;
	bool isBlockedByLock() const;
	void finishActiveTool();
	void apply(const Effects &effects);
	void setSelection(const QString &objectId);
	void dropStaleSelection();

	net::Client *m_client;
	canvas::CanvasModel *m_model;
	canvas::History *m_history;
	TextInputProvider *m_textInput;

	Type m_activeTool;
	quint32 m_color;
	qreal m_strokeSize;
	QString m_userId;

	QPointF m_panOffset;
	qreal m_zoom;

	EditState m_state;
	bool m_pressed;
};

}

#endif
