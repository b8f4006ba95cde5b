#pragma once

#include "bandlink/core/protocol/bridge/enums/message_type.hpp"
#include "bandlink/core/protocol/bridge/enums/command.hpp"
#include "bandlink/core/protocol/bridge/enums/event_type.hpp"
