// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBSHARED_UTIL_ARGB_H
#define LIBSHARED_UTIL_ARGB_H
#include <QString>
#include <QtGlobal>
#include <optional>

namespace utils {

/**
 * @brief Format a packed 0xAARRGGBB color as "#aarrggbb"
 *
 * The output is always '#' followed by exactly eight lowercase hex digits.
 */
QString argbToHex(quint32 argb);

/**
 * @brief Parse a color formatted by argbToHex
 *
 * The leading '#' is optional. Returns nothing if the remainder is empty,
 * longer than eight digits or contains anything other than hex digits.
 */
std::optional<quint32> argbFromHex(const QString &hex);

}

#endif
