// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBCLIENT_TOOLS_FREEHAND_H
#define LIBCLIENT_TOOLS_FREEHAND_H
#include "libclient/tools/tool.h"

namespace tools {

/**
 * @brief Freehand pen, pencil and marker
 *
 * Points are streamed to other users as they are drawn. The stroke goes into
 * the model and the history only once the pen is lifted.
 */
namespace freehand {

Effects begin(EditState &state, const ToolContext &ctx, const PointerEvent &ev);
Effects motion(EditState &state, const PointerEvent &ev);
Effects end(EditState &state);

}

}

#endif
