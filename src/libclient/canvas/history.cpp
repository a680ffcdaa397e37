// SPDX-License-Identifier: GPL-3.0-or-later
#include "libclient/canvas/history.h"
#include "libclient/canvas/canvasmodel.h"

namespace canvas {

bool revert(CanvasModel &model, const Action &action)
{
	if(const action::AddStroke *a = std::get_if<action::AddStroke>(&action)) {
		return model.removeStroke(a->stroke.id);
	} else if(
		const action::DeleteStroke *a =
			std::get_if<action::DeleteStroke>(&action)) {
		return model.addStroke(a->stroke);
	} else if(
		const action::AddObject *a = std::get_if<action::AddObject>(&action)) {
		return model.removeObject(a->object.id);
	} else if(
		const action::UpdateObject *a =
			std::get_if<action::UpdateObject>(&action)) {
		return model.replaceObject(a->prev);
	} else if(
		const action::DeleteObject *a =
			std::get_if<action::DeleteObject>(&action)) {
		return model.addObject(a->object);
	} else if(
		const action::ClearCanvas *a =
			std::get_if<action::ClearCanvas>(&action)) {
		model.restore(a->strokes, a->objects);
		return true;
	}
	return false;
}

bool replay(CanvasModel &model, const Action &action)
{
	if(const action::AddStroke *a = std::get_if<action::AddStroke>(&action)) {
		return model.addStroke(a->stroke);
	} else if(
		const action::DeleteStroke *a =
			std::get_if<action::DeleteStroke>(&action)) {
		return model.removeStroke(a->stroke.id);
	} else if(
		const action::AddObject *a = std::get_if<action::AddObject>(&action)) {
		return model.addObject(a->object);
	} else if(
		const action::UpdateObject *a =
			std::get_if<action::UpdateObject>(&action)) {
		return model.replaceObject(a->next);
	} else if(
		const action::DeleteObject *a =
			std::get_if<action::DeleteObject>(&action)) {
		return model.removeObject(a->object.id);
	} else if(std::holds_alternative<action::ClearCanvas>(action)) {
		model.clear();
		return true;
	}
	return false;
}

History::History(int maxDepth)
	: m_maxDepth(qMax(1, maxDepth))
{
}

void History::setMaxDepth(int maxDepth)
{
	m_maxDepth = qMax(1, maxDepth);
	trim();
}

void History::push(const Action &action)
{
	m_undo.push_back(action);
	trim();
	m_redo.clear();
}

std::optional<Action> History::undo()
{
	if(m_undo.empty()) {
		return {};
	}
	Action action = m_undo.back();
	m_undo.pop_back();
	m_redo.push_back(action);
	return action;
}

std::optional<Action> History::redo()
{
	if(m_redo.empty()) {
		return {};
	}
	Action action = m_redo.back();
	m_redo.pop_back();
	m_undo.push_back(action);
	trim();
	return action;
}

void History::clear()
{
	m_undo.clear();
	m_redo.clear();
}

void History::trim()
{
	while(int(m_undo.size()) > m_maxDepth) {
		m_undo.pop_front();
	}
}

}
