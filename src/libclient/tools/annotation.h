// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBCLIENT_TOOLS_ANNOTATION_H
#define LIBCLIENT_TOOLS_ANNOTATION_H
#include "libclient/tools/tool.h"

namespace tools {

/**
 * @brief Text tool
 *
 * Text objects are created in one go once the user has entered the text.
 */
namespace annotation {

//! Font size relative to the current stroke size
static constexpr qreal FONT_SIZE_FACTOR = 4.0;

Effects create(
	const ToolContext &ctx, const PointerEvent &ev, const QString &text);

}

}

#endif
