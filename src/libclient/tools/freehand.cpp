// SPDX-License-Identifier: GPL-3.0-or-later
#include "libclient/tools/freehand.h"
#include "libclient/net/message.h"
#include "libclient/tools/utils.h"

namespace tools {
namespace freehand {

Effects begin(EditState &state, const ToolContext &ctx, const PointerEvent &ev)
{
	canvas::Stroke stroke;
	stroke.id = generateId();
	stroke.userId = ctx.userId;
	stroke.tool = canvas::StrokeTool::Pen;
	stroke.color = ctx.color;
	stroke.size = ctx.strokeSize;
	stroke.layerId = ctx.layerId;
	stroke.points.append(ev.toStrokePoint());
	state.stroke = stroke;

	// The start message has no points, so the first one follows separately
	Effects effects;
	effects.messages.append(net::makeStrokeStartMessage(stroke));
	effects.messages.append(
		net::makeStrokeUpdateMessage(stroke.id, stroke.points));
	return effects;
}

Effects motion(EditState &state, const PointerEvent &ev)
{
	Effects effects;
	if(state.stroke.has_value()) {
		canvas::StrokePoint point = ev.toStrokePoint();
		state.stroke->points.append(point);
		effects.messages.append(net::makeStrokeUpdateMessage(
			state.stroke->id, canvas::PointVector{point}));
	}
	return effects;
}

Effects end(EditState &state)
{
	Effects effects;
	if(state.stroke.has_value()) {
		canvas::Stroke stroke = *state.stroke;
		stroke.completed = true;
		state.stroke.reset();

		effects.commits.append(Commit{
			canvas::action::AddStroke{stroke},
			{net::makeStrokeEndMessage(stroke.id)}});
	}
	return effects;
}

}
}
