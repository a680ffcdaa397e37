// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBCLIENT_TOOLS_SELECTION_H
#define LIBCLIENT_TOOLS_SELECTION_H
#include "libclient/tools/tool.h"

namespace tools {

/**
 * @brief Object selection and dragging
 *
 * Clicking picks the topmost object under the pointer. Dragging moves it by
 * the distance covered since the previous motion event. The moves go into the
 * model immediately. When the drag ends, the final state is sent to others.
 */
namespace selection {

//! Find the topmost object at the given point on a visible layer
QString pick(const canvas::CanvasModel &model, const QPointF &point);

Effects begin(EditState &state, const ToolContext &ctx, const PointerEvent &ev);
Effects motion(EditState &state, const ToolContext &ctx, const PointerEvent &ev);
Effects end(EditState &state, const ToolContext &ctx);

}

}

#endif
