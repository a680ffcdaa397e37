// SPDX-License-Identifier: GPL-3.0-or-later
#include "libclient/tools/annotation.h"
#include "libclient/net/message.h"
#include "libclient/tools/utils.h"

namespace tools {
namespace annotation {

Effects create(
	const ToolContext &ctx, const PointerEvent &ev, const QString &text)
{
	Effects effects;
	if(text.isEmpty()) {
		return effects;
	}

	canvas::CanvasObject o;
	o.id = generateId();
	o.type = canvas::ObjectType::Text;
	o.layerId = ctx.layerId;
	o.x = ev.point.x();
	o.y = ev.point.y();
	o.color = ctx.color;
	o.strokeWidth = ctx.strokeSize;
	o.text = text;
	o.fontSize = ctx.strokeSize * FONT_SIZE_FACTOR;

	effects.commits.append(
		Commit{canvas::action::AddObject{o}, {net::makeObjectAddMessage(o)}});
	return effects;
}

}
}
