// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBCLIENT_UTILS_NAMEGENERATOR_H
#define LIBCLIENT_UTILS_NAMEGENERATOR_H
#include <QString>

namespace utils {

/**
 * @brief Make up a display name like "Fuzzy Otter"
 */
QString generateDisplayName();

//! Same as above, but always gives the same name for the same seed
QString generateDisplayName(quint32 seed);

}

#endif
