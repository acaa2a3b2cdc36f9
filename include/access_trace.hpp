#ifndef ACCESS_TRACE_HPP
#define ACCESS_TRACE_HPP

#include "access_trace/core/log_common.hpp"
#include "access_trace/core/log_level.hpp"
#include "access_trace/core/log_entry.hpp"
#include "access_trace/core/header_map.hpp"
#include "access_trace/core/exchange.hpp"
#include "access_trace/core/format_error.hpp"
#include "access_trace/core/directive.hpp"
#include "access_trace/core/directive_parser.hpp"
#include "access_trace/core/builtin_directives.hpp"
#include "access_trace/core/tag_registry.hpp"
#include "access_trace/core/access_format.hpp"
#include "access_trace/core/span.hpp"
#include "access_trace/core/path_filter.hpp"
#include "access_trace/formatter/formatter_interface.hpp"
#include "access_trace/formatter/human_readable_formatter.hpp"
#include "access_trace/formatter/json_formatter.hpp"
#include "access_trace/transport/transport_interface.hpp"
#include "access_trace/transport/stdout_transport.hpp"
#include "access_trace/transport/file_transport.hpp"
#include "access_trace/sink/sink_interface.hpp"
#include "access_trace/sink/console_sink.hpp"
#include "access_trace/sink/file_sink.hpp"
#include "access_trace/sink/callback_sink.hpp"
#include "access_trace/sink_manager.hpp"
#include "access_trace/logger.hpp"
#include "access_trace/access_logger.hpp"
#include "access_trace/access_logger_configuration.hpp"

#endif // ACCESS_TRACE_HPP
