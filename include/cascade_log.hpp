#ifndef CASCADE_LOG_HPP
#define CASCADE_LOG_HPP

#include "cascade_log/core/log_common.hpp"
#include "cascade_log/core/log_level.hpp"
#include "cascade_log/core/log_record.hpp"
#include "cascade_log/core/errors.hpp"
#include "cascade_log/core/error_reporter.hpp"
#include "cascade_log/core/message_value.hpp"
#include "cascade_log/core/logger_registry.hpp"
#include "cascade_log/core/rolling_policy.hpp"
#include "cascade_log/core/file_lock.hpp"
#include "cascade_log/core/rolling_file_manager.hpp"
#include "cascade_log/layout/pattern_layout.hpp"
#include "cascade_log/transport/transport_interface.hpp"
#include "cascade_log/transport/console_transport.hpp"
#include "cascade_log/appender/appender_interface.hpp"
#include "cascade_log/appender/null_appender.hpp"
#include "cascade_log/appender/console_appender.hpp"
#include "cascade_log/appender/file_appender.hpp"
#include "cascade_log/appender/daily_rolling_file_appender.hpp"
#include "cascade_log/appender/appender_set.hpp"
#include "cascade_log/appender/appender_factory.hpp"
#include "cascade_log/config/logging_config.hpp"
#include "cascade_log/logging_context.hpp"
#include "cascade_log/logger.hpp"
#include "cascade_log/global.hpp"
#include "cascade_log/macros.hpp"

#endif // CASCADE_LOG_HPP
