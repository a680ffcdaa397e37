// SPDX-License-Identifier: GPL-3.0-or-later
// No include guard: expanded once for the Settings declaration and once for
// the definitions of the setting metadata.
#include "libclient/settings_table_macros.h"

SETTING(serverUrl         , ServerUrl         , "net/serverurl"           , QString, QStringLiteral("ws://localhost:8000/socket.io/?EIO=4&transport=websocket"))
SETTING(boardId           , BoardId           , "net/boardid"             , QString, QStringLiteral("default"))
SETTING(reconnectAttempts , ReconnectAttempts , "net/reconnectattempts"   , int    , 10)
SETTING(reconnectDelayMs  , ReconnectDelayMs  , "net/reconnectdelayms"    , int    , 1000)
SETTING(displayName       , DisplayName       , "user/displayname"        , QString, QString())
SETTING(userId            , UserId            , "user/id"                 , QString, QString())
SETTING(historyDepth      , HistoryDepth      , "canvas/historydepth"     , int    , 100)
SETTING(cursorStaleMs     , CursorStaleMs     , "canvas/cursorstalems"    , int    , 5000)
SETTING(strokeSize        , StrokeSize        , "tools/strokesize"        , double , 4.0)
SETTING(color             , Color             , "tools/color"             , QString, QStringLiteral("#ffffffff"))
SETTING(logFile           , LogFile           , "settings/logfile"        , bool   , false)

#include "libclient/settings_table_macros.h"
