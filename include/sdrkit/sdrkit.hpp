#pragma once

#include "sdrkit/arg_info.hpp"
#include "sdrkit/args.hpp"
#include "sdrkit/device.hpp"
#include "sdrkit/error.hpp"
#include "sdrkit/format.hpp"
#include "sdrkit/logging.hpp"
#include "sdrkit/stream.hpp"
#include "sdrkit/types.hpp"
