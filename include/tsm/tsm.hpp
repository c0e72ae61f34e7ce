#pragma once

#include "tsm/builder.hpp"
#include "tsm/detail/context.hpp"
#include "tsm/detail/errors.hpp"
#include "tsm/detail/event.hpp"
#include "tsm/detail/kind.hpp"
#include "tsm/detail/logger.hpp"
#include "tsm/detail/options.hpp"
#include "tsm/detail/result.hpp"
#include "tsm/detail/table.hpp"
#include "tsm/diagram.hpp"
#include "tsm/machine.hpp"
