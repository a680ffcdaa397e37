// SPDX-License-Identifier: GPL-3.0-or-later
#include "libclient/tools/shapetools.h"
#include "libclient/net/message.h"
#include "libclient/tools/utils.h"
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcIbTools)

namespace tools {
namespace shape {

std::optional<canvas::ObjectType> objectTypeFor(Type type)
{
	switch(type) {
	case Type::Rectangle:
		return canvas::ObjectType::Rectangle;
	case Type::Circle:
		return canvas::ObjectType::Circle;
	case Type::Ellipse:
		return canvas::ObjectType::Ellipse;
	case Type::Line:
		return canvas::ObjectType::Line;
	case Type::Arrow:
		return canvas::ObjectType::Arrow;
	default:
		return {};
	}
}

Effects begin(EditState &state, const ToolContext &ctx, const PointerEvent &ev)
{
	std::optional<canvas::ObjectType> type = objectTypeFor(ctx.type);
	if(!type.has_value()) {
		return Effects();
	}

	canvas::CanvasObject o;
	o.id = generateId();
	o.type = *type;
	o.layerId = ctx.layerId;
	o.x = ev.point.x();
	o.y = ev.point.y();
	o.color = ctx.color;
	o.strokeWidth = ctx.strokeSize;
	if(o.isLineLike()) {
		o.x2 = ev.point.x();
		o.y2 = ev.point.y();
	}

	state.shape = o;
	state.dragAnchor = ev.point;
	return Effects();
}

Effects motion(EditState &state, const PointerEvent &ev)
{
	if(state.shape.has_value() && state.dragAnchor.has_value()) {
		canvas::CanvasObject &o = *state.shape;
		const QPointF &anchor = *state.dragAnchor;
		if(o.isLineLike()) {
			o.x2 = ev.point.x();
			o.y2 = ev.point.y();
		} else {
			o.x = qMin(anchor.x(), ev.point.x());
			o.y = qMin(anchor.y(), ev.point.y());
			o.width = qAbs(ev.point.x() - anchor.x());
			o.height = qAbs(ev.point.y() - anchor.y());
		}
	}
	return Effects();
}

Effects end(EditState &state)
{
	Effects effects;
	if(state.shape.has_value()) {
		const canvas::CanvasObject &o = *state.shape;
		if(o.isLineLike() || o.width > MIN_SIZE || o.height > MIN_SIZE) {
			effects.commits.append(Commit{
				canvas::action::AddObject{o}, {net::makeObjectAddMessage(o)}});
		} else {
			qCDebug(lcIbTools, "Discarding tiny %s",
				qUtf8Printable(canvas::objectTypeName(o.type)));
		}
	}
	state.shape.reset();
	state.dragAnchor.reset();
	return effects;
}

}
}
