#pragma once

#include <fcitx-utils/log.h>

namespace tracekey {

FCITX_DECLARE_LOG_CATEGORY(tracekey_log);

} // namespace tracekey

#define TKLOG(level) FCITX_LOGC(::tracekey::tracekey_log, level)
