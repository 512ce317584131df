#pragma once

#include "pgshift/commands/config_command.hpp"
#include "pgshift/commands/migrate_command.hpp"
#include "pgshift/commands/transfer_command.hpp"
