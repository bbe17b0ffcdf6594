#include "log.h"

namespace tracekey {

FCITX_DEFINE_LOG_CATEGORY(tracekey_log, "tracekey");

} // namespace tracekey
