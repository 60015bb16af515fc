#ifndef MSGMUX_MSGMUX_HPP
#define MSGMUX_MSGMUX_HPP

// Main include header for the msgmux library

#include "msgmux/broadcast_writer.hpp"
#include "msgmux/connection.hpp"
#include "msgmux/context.hpp"
#include "msgmux/errors.hpp"
#include "msgmux/gate.hpp"
#include "msgmux/lb_writer.hpp"
#include "msgmux/log.hpp"
#include "msgmux/message.hpp"
#include "msgmux/msg_io.hpp"
#include "msgmux/pool.hpp"
#include "msgmux/queue.hpp"
#include "msgmux/queued_reader.hpp"
#include "msgmux/task_group.hpp"
#include "msgmux/types.hpp"

#endif // MSGMUX_MSGMUX_HPP
