// SPDX-License-Identifier: GPL-3.0-or-later
#include "libclient/tools/selection.h"
#include "libclient/canvas/canvasmodel.h"
#include "libclient/canvas/layerlist.h"
#include "libclient/net/message.h"
#include "libclient/tools/utils.h"

namespace tools {
namespace selection {

QString pick(const canvas::CanvasModel &model, const QPointF &point)
{
	const QVector<canvas::CanvasObject> &objects = model.objects();
	QSet<QString> visible = model.layerlist()->visibleLayerIds();
	for(int i = objects.size() - 1; i >= 0; --i) {
		const canvas::CanvasObject &o = objects.at(i);
		if(visible.contains(o.layerId) && hittest::objectContains(o, point)) {
			return o.id;
		}
	}
	return QString();
}

Effects begin(EditState &state, const ToolContext &ctx, const PointerEvent &ev)
{
	state.selectedObjectId = pick(ctx.model, ev.point);
	const canvas::CanvasObject *o = ctx.model.object(state.selectedObjectId);
	if(o) {
		state.dragAnchor = ev.point;
		state.dragOrigin = *o;
	} else {
		state.dragAnchor.reset();
		state.dragOrigin.reset();
	}
	return Effects();
}

Effects motion(EditState &state, const ToolContext &ctx, const PointerEvent &ev)
{
	Effects effects;
	if(state.selectedObjectId.isEmpty() || !state.dragAnchor.has_value()) {
		return effects;
	}

	const canvas::CanvasObject *o = ctx.model.object(state.selectedObjectId);
	if(!o) {
		// Deleted by someone else while we were dragging it
		state.selectedObjectId.clear();
		state.dragAnchor.reset();
		state.dragOrigin.reset();
		return effects;
	}

	QPointF delta = ev.point - *state.dragAnchor;
	state.dragAnchor = ev.point;

	canvas::CanvasObject moved = *o;
	moved.translate(delta.x(), delta.y());
	effects.liveUpdates.append(moved);
	return effects;
}

Effects end(EditState &state, const ToolContext &ctx)
{
	Effects effects;
	if(state.dragAnchor.has_value() && state.dragOrigin.has_value()) {
		const canvas::CanvasObject *o =
			ctx.model.object(state.selectedObjectId);
		if(o && *o != *state.dragOrigin) {
			effects.messages.append(net::makeObjectUpdateMessage(*o));
		}
	}
	state.dragAnchor.reset();
	state.dragOrigin.reset();
	return effects;
}

}
}
