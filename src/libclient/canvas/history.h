// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBCLIENT_CANVAS_HISTORY_H
#define LIBCLIENT_CANVAS_HISTORY_H
#include "libclient/canvas/canvasobject.h"
#include "libclient/canvas/stroke.h"
#include <QVector>
#include <deque>
#include <optional>
#include <variant>

namespace canvas {

class CanvasModel;

namespace action {

struct AddStroke {
	Stroke stroke;
};

struct DeleteStroke {
	Stroke stroke;
};

struct AddObject {
	CanvasObject object;
};

struct UpdateObject {
	CanvasObject prev;
	CanvasObject next;
};

struct DeleteObject {
	CanvasObject object;
};

struct ClearCanvas {
	QVector<Stroke> strokes;
	QVector<CanvasObject> objects;
};

}

//! A reversible record of one local mutation
typedef std::variant<
	action::AddStroke, action::DeleteStroke, action::AddObject,
	action::UpdateObject, action::DeleteObject, action::ClearCanvas>
	Action;

//! Undo the effect of an action on the model
bool revert(CanvasModel &model, const Action &action);

//! Redo the effect of an action on the model
bool replay(CanvasModel &model, const Action &action);

/**
 * @brief Local undo/redo stacks
 *
 * Only locally made changes go in here. Undoing something does not tell
 * other users about it: the history is a private scratch pad.
 */
class History final {
public:
	static constexpr int DEFAULT_MAX_DEPTH = 100;

	explicit History(int maxDepth = DEFAULT_MAX_DEPTH);

	int maxDepth() const { return m_maxDepth; }

	//! Change the undo depth limit, dropping the oldest entries if needed
	void setMaxDepth(int maxDepth);

	/**
	 * @brief Record a new action
	 *
	 * The oldest entry is dropped if the undo stack is full. The redo stack
	 * is cleared.
	 */
	void push(const Action &action);

	//! Pop the latest action onto the redo stack and return it
	std::optional<Action> undo();

	//! Pop the latest undone action back onto the undo stack and return it
	std::optional<Action> redo();

	void clear();

	bool canUndo() const { return !m_undo.empty(); }
	bool canRedo() const { return !m_redo.empty(); }
	int undoCount() const { return int(m_undo.size()); }
	int redoCount() const { return int(m_redo.size()); }

	//! The undo stack, oldest first
	const std::deque<Action> &undoStack() const { return m_undo; }

private:
	void trim();

	std::deque<Action> m_undo;
	std::deque<Action> m_redo;
	int m_maxDepth;
};

}

#endif
