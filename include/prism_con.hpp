#ifndef PRISM_CON_HPP
#define PRISM_CON_HPP

#include "prism_con/core/common.hpp"
#include "prism_con/core/palette.hpp"
#include "prism_con/core/role_flags.hpp"
#include "prism_con/core/scoped_value.hpp"
#include "prism_con/core/write_record.hpp"
#include "prism_con/core/console_context.hpp"
#include "prism_con/core/delay_timer.hpp"
#include "prism_con/formatter/highlight_formatter.hpp"
#include "prism_con/transport/transport_interface.hpp"
#include "prism_con/transport/stdout_transport.hpp"
#include "prism_con/transport/file_transport.hpp"
#include "prism_con/transport/callback_transport.hpp"
#include "prism_con/sink/sink_interface.hpp"
#include "prism_con/sink/output_sink.hpp"
#include "prism_con/sink/error_sink.hpp"
#include "prism_con/sink/sink_streambuf.hpp"
#include "prism_con/console_options.hpp"
#include "prism_con/console.hpp"
#include "prism_con/global.hpp"
#include "prism_con/exception_printer.hpp"
#include "prism_con/input/user_input.hpp"

#endif // PRISM_CON_HPP
