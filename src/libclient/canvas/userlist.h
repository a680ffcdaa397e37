// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBCLIENT_CANVAS_USERLIST_H
#define LIBCLIENT_CANVAS_USERLIST_H
#include <QAbstractListModel>
#include <QVector>

class QJsonArray;

namespace canvas {

/**
 * @brief Information about a user present on the board
 */
struct User {
	//! Connection ID assigned by the server
	QString sid;
	QString userId;
	QString displayName;
};

/**
 * A list model to represent the users on the current board.
 */
class UserListModel final : public QAbstractListModel {
	Q_OBJECT
public:
	enum UserListRoles {
		SidRole = Qt::UserRole + 1,
		UserIdRole,
		NameRole,
	};

	UserListModel(QObject *parent = nullptr);

	QVariant
	data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
	int rowCount(const QModelIndex &parent = QModelIndex()) const override;
	QHash<int, QByteArray> roleNames() const override;

	//! A user joined the board. A returning sid replaces the old entry.
	void userJoined(const User &user);

	//! A user left the board
	void userLeft(const QString &sid);

	//! Replace the whole list, e.g. from a board snapshot
	void setUsers(const QVector<User> &users);

	//! Clear all users and the count
	void reset();

	const QVector<User> &users() const { return m_users; }

	/**
	 * @brief Number of users on the board as reported by the server
	 *
	 * This includes the local user, who is not in the list.
	 */
	int userCount() const { return m_userCount; }
	void setUserCount(int count);

	//! Parse a user list as found in board snapshots
	static QVector<User> usersFromJson(const QJsonArray &array);

signals:
	void userCountChanged(int count);

private:
	int indexOf(const QString &sid) const;

	QVector<User> m_users;
	int m_userCount;
};

}

#endif
