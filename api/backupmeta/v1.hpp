#pragma once

#include "backupmeta/v1/backup_info.pb.h"
#include "backupmeta/v1/table_server_timestamp.pb.h"
