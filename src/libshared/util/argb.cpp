// SPDX-License-Identifier: GPL-3.0-or-later
#include "libshared/util/argb.h"

namespace utils {

QString argbToHex(quint32 argb)
{
	return QStringLiteral("#%1").arg(argb, 8, 16, QLatin1Char('0'));
}

std::optional<quint32> argbFromHex(const QString &hex)
{
	QString digits = hex.startsWith(QLatin1Char('#')) ? hex.mid(1) : hex;
	if(digits.isEmpty() || digits.length() > 8) {
		return std::nullopt;
	}

	// toUInt accepts a "0x" prefix and surrounding whitespace, we don't.
	for(const QChar c : digits) {
		if(!((c >= QLatin1Char('0') && c <= QLatin1Char('9')) ||
			 (c >= QLatin1Char('a') && c <= QLatin1Char('f')) ||
			 (c >= QLatin1Char('A') && c <= QLatin1Char('F')))) {
			return std::nullopt;
		}
	}

	bool ok;
	uint value = digits.toUInt(&ok, 16);
	if(!ok) {
		return std::nullopt;
	}
	return quint32(value);
}

}
