// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBCLIENT_TOOLS_SHAPETOOLS_H
#define LIBCLIENT_TOOLS_SHAPETOOLS_H
#include "libclient/tools/tool.h"

namespace tools {

/**
 * \brief Tools that drag out a shape object
 *
 * Boxed shapes (rectangle, circle, ellipse) span from the drag anchor to the
 * pointer in whichever direction it was dragged. Lines and arrows keep their
 * first endpoint at the anchor and move the second one.
 */
namespace shape {

//! Boxed shapes smaller than this in both dimensions are discarded
static constexpr qreal MIN_SIZE = 5.0;

std::optional<canvas::ObjectType> objectTypeFor(Type type);

Effects begin(EditState &state, const ToolContext &ctx, const PointerEvent &ev);
Effects motion(EditState &state, const PointerEvent &ev);
Effects end(EditState &state);

}

}

#endif
