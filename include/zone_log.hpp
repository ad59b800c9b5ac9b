#ifndef ZONE_LOG_HPP
#define ZONE_LOG_HPP

#include "zone_log/core/log_common.hpp"
#include "zone_log/core/io_error.hpp"
#include "zone_log/core/log_level.hpp"
#include "zone_log/core/log_record.hpp"
#include "zone_log/core/utc_offset.hpp"
#include "zone_log/core/timestamp_format.hpp"
#include "zone_log/formatter/format_policy.hpp"
#include "zone_log/formatter/level_style.hpp"
#include "zone_log/formatter/indent_streambuf.hpp"
#include "zone_log/formatter/line_renderer.hpp"
#include "zone_log/formatter/formatter_interface.hpp"
#include "zone_log/formatter/zoned_formatter.hpp"
#include "zone_log/sink/sink_interface.hpp"
#include "zone_log/sink/stream_sink.hpp"
#include "zone_log/sink/console_sink.hpp"
#include "zone_log/log_manager.hpp"
#include "zone_log/logger.hpp"
#include "zone_log/macros.hpp"

#endif // ZONE_LOG_HPP
