// SPDX-License-Identifier: GPL-3.0-or-later
#include "libclient/canvas/userlist.h"
#include <QJsonArray>
#include <QJsonObject>

namespace canvas {

UserListModel::UserListModel(QObject *parent)
	: QAbstractListModel(parent)
	, m_userCount(0)
{
}

QVariant UserListModel::data(const QModelIndex &index, int role) const
{
	if(!index.isValid() || index.row() < 0 || index.row() >= m_users.size())
		return QVariant();

	const User &u = m_users.at(index.row());
	switch(role) {
	case SidRole: return u.sid;
	case UserIdRole: return u.userId;
	case Qt::DisplayRole:
	case NameRole: return u.displayName;
	}
	return QVariant();
}

int UserListModel::rowCount(const QModelIndex &parent) const
{
	if(parent.isValid())
		return 0;
	return m_users.count();
}

QHash<int, QByteArray> UserListModel::roleNames() const
{
	QHash<int, QByteArray> roles;
	roles[SidRole] = "sid";
	roles[UserIdRole] = "userId";
	roles[NameRole] = "name";
	return roles;
}

void UserListModel::userJoined(const User &user)
{
	// Check if this is a returning connection
	int i = indexOf(user.sid);
	if(i >= 0) {
		m_users[i] = user;
		emit dataChanged(index(i), index(i));
		return;
	}

	int pos = m_users.count();
	beginInsertRows(QModelIndex(), pos, pos);
	m_users.append(user);
	endInsertRows();
}

void UserListModel::userLeft(const QString &sid)
{
	int i = indexOf(sid);
	if(i >= 0) {
		beginRemoveRows(QModelIndex(), i, i);
		m_users.removeAt(i);
		endRemoveRows();
	}
}

void UserListModel::setUsers(const QVector<User> &users)
{
	beginResetModel();
	m_users = users;
	endResetModel();
}

void UserListModel::reset()
{
	int size = m_users.size();
	if(size != 0) {
		beginRemoveRows(QModelIndex(), 0, size - 1);
		m_users.clear();
		endRemoveRows();
	}
	setUserCount(0);
}

void UserListModel::setUserCount(int count)
{
	if(count != m_userCount) {
		m_userCount = count;
		emit userCountChanged(count);
	}
}

QVector<User> UserListModel::usersFromJson(const QJsonArray &array)
{
	QVector<User> users;
	for(const QJsonValue &v : array) {
		QJsonObject o = v.toObject();
		QString sid = o.value(QStringLiteral("sid")).toString();
		if(!sid.isEmpty()) {
			users.append(User{
				sid, o.value(QStringLiteral("user_id")).toString(),
				o.value(QStringLiteral("display_name")).toString()});
		}
	}
	return users;
}

int UserListModel::indexOf(const QString &sid) const
{
	for(int i = 0; i < m_users.size(); ++i) {
		if(m_users.at(i).sid == sid) {
			return i;
		}
	}
	return -1;
}

}
