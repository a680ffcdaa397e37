// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBCLIENT_TOOLS_ERASER_H
#define LIBCLIENT_TOOLS_ERASER_H
#include "libclient/tools/tool.h"

namespace tools {

/**
 * @brief Stroke eraser
 *
 * Removes whole finalized strokes that come near the pointer. Only strokes
 * on visible, unlocked layers can be erased.
 */
namespace eraser {

Effects begin(EditState &state, const ToolContext &ctx, const PointerEvent &ev);
Effects motion(EditState &state, const ToolContext &ctx, const PointerEvent &ev);
Effects end(EditState &state);

}

}

#endif
