#pragma once
#ifndef MOBILITYKIT_LOGGING_H
#define MOBILITYKIT_LOGGING_H

#include "config/config.h"

namespace mobilitykit {

// Applies config.log_level to the default spdlog logger. Unknown level names
// fall back to "info".
void configure_logging(const Config& config);

}  // namespace mobilitykit

#endif  // MOBILITYKIT_LOGGING_H
