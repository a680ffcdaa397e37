// SPDX-License-Identifier: GPL-3.0-or-later
#include "libclient/tools/eraser.h"
#include "libclient/canvas/canvasmodel.h"
#include "libclient/canvas/layerlist.h"
#include "libclient/tools/utils.h"

namespace tools {
namespace eraser {

namespace {

Effects eraseAt(const ToolContext &ctx, const QPointF &point)
{
	const canvas::LayerListModel *layers = ctx.model.layerlist();
	Effects effects;
	for(const canvas::Stroke &stroke : ctx.model.strokes()) {
		const canvas::LayerListItem *layer = layers->layer(stroke.layerId);
		if(layer && layer->visible && !layer->locked &&
		   hittest::eraserTouches(stroke, point, ctx.strokeSize)) {
			effects.commits.append(Commit{canvas::action::DeleteStroke{stroke}, {}});
		}
	}
	return effects;
}

}

Effects begin(EditState &state, const ToolContext &ctx, const PointerEvent &ev)
{
	state.erasing = true;
	return eraseAt(ctx, ev.point);
}

Effects motion(EditState &state, const ToolContext &ctx, const PointerEvent &ev)
{
	if(state.erasing) {
		return eraseAt(ctx, ev.point);
	}
	return Effects();
}

Effects end(EditState &state)
{
	state.erasing = false;
	return Effects();
}

}
}
