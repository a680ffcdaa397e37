// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBCLIENT_TOOLS_ENUMS_H
#define LIBCLIENT_TOOLS_ENUMS_H
#include <QMetaType>

namespace tools {

enum class Type {
	Pen,
	Pencil,
	Marker,
	Eraser,
	Select,
	Rectangle,
	Circle,
	Ellipse,
	Line,
	Arrow,
	Text,
};

//! Pencil and marker draw exactly like the pen
inline bool isFreehand(Type type)
{
	return type == Type::Pen || type == Type::Pencil || type == Type::Marker;
}

inline bool isShape(Type type)
{
	switch(type) {
	case Type::Rectangle:
	case Type::Circle:
	case Type::Ellipse:
	case Type::Line:
	case Type::Arrow:
		return true;
	default:
		return false;
	}
}

}

Q_DECLARE_METATYPE(tools::Type)

#endif
