// SPDX-License-Identifier: GPL-3.0-or-later
#include "libclient/canvas/cursorlist.h"
#include <QColor>
#include <QHash>
#include <QTimer>

namespace canvas {

CursorListModel::CursorListModel(QObject *parent)
	: QAbstractListModel(parent)
	, m_staleMs(DEFAULT_STALE_MS)
{
}

int CursorListModel::rowCount(const QModelIndex &parent) const
{
	if(parent.isValid())
		return 0;
	return m_cursors.size();
}

QVariant CursorListModel::data(const QModelIndex &index, int role) const
{
	if(index.isValid() && index.row() >= 0 && index.row() < m_cursors.size()) {
		const CursorInfo &c = m_cursors.at(index.row());
		switch(role) {
		case UserIdRole: return c.userId;
		case Qt::DisplayRole:
		case DisplayNameRole: return c.displayName;
		case XRole: return c.x;
		case YRole: return c.y;
		case ColorRole: return c.color;
		default: break;
		}
	}
	return QVariant();
}

QHash<int, QByteArray> CursorListModel::roleNames() const
{
	QHash<int, QByteArray> roles;
	roles[UserIdRole] = "userId";
	roles[DisplayNameRole] = "displayName";
	roles[XRole] = "x";
	roles[YRole] = "y";
	roles[ColorRole] = "color";
	return roles;
}

const CursorInfo *CursorListModel::cursor(const QString &userId) const
{
	int i = indexOf(userId);
	return i < 0 ? nullptr : &m_cursors.at(i);
}

void CursorListModel::updateCursor(
	const QString &userId, const QString &displayName, qreal x, qreal y,
	qint64 now)
{
	int i = indexOf(userId);
	if(i < 0) {
		i = m_cursors.size();
		beginInsertRows(QModelIndex(), i, i);
		m_cursors.append(CursorInfo{
			userId, displayName, x, y, colorForUser(userId), now});
		endInsertRows();
	} else {
		CursorInfo &c = m_cursors[i];
		c.displayName = displayName;
		c.x = x;
		c.y = y;
		c.lastUpdate = now;
		emit dataChanged(index(i), index(i));
	}

	m_checks.append(ExpiryCheck{userId, now + m_staleMs, now});
	// Coarse timers may fire early, so the timer doesn't compare against the
	// due time. It only checks that no newer update arrived.
	QTimer::singleShot(m_staleMs, this, [this, userId, now]() {
		evictIfStale(userId, now);
	});
}

void CursorListModel::expire(qint64 now)
{
	QVector<ExpiryCheck>::iterator it = m_checks.begin();
	while(it != m_checks.end()) {
		if(it->due > now) {
			++it;
			continue;
		}

		QString userId = it->userId;
		qint64 stamp = it->stamp;
		it = m_checks.erase(it);
		removeIfUnchanged(userId, stamp);
	}
}

void CursorListModel::evictIfStale(const QString &userId, qint64 stamp)
{
	for(int i = 0; i < m_checks.size(); ++i) {
		const ExpiryCheck &check = m_checks.at(i);
		if(check.userId == userId && check.stamp == stamp) {
			m_checks.removeAt(i);
			removeIfUnchanged(userId, stamp);
			return;
		}
	}
}

void CursorListModel::removeIfUnchanged(const QString &userId, qint64 stamp)
{
	int i = indexOf(userId);
	if(i >= 0 && m_cursors.at(i).lastUpdate == stamp) {
		beginRemoveRows(QModelIndex(), i, i);
		m_cursors.removeAt(i);
		endRemoveRows();
		emit cursorRemoved(userId);
	}
}

void CursorListModel::clear()
{
	m_checks.clear();
	if(!m_cursors.isEmpty()) {
		beginResetModel();
		m_cursors.clear();
		endResetModel();
	}
}

quint32 CursorListModel::colorForUser(const QString &userId)
{
	int hue = int(qHash(userId, 0) % 360u);
	return QColor::fromHslF(hue / 360.0, 0.7, 0.5).rgba();
}

int CursorListModel::indexOf(const QString &userId) const
{
	for(int i = 0; i < m_cursors.size(); ++i) {
		if(m_cursors.at(i).userId == userId) {
			return i;
		}
	}
	return -1;
}

}
