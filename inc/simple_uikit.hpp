//SPDX-License-Identifier: LicenseRef-Apache-License-2.0
//Author: Blayne Dennis
/**
 * @file
 * @brief Simple cross thread scheduling core of a widget toolkit
 *
 * The library is broken down into two parts:
 * 1. a concurrency layer: a pollable event queue, cancellable threads, a
 *    thread pool, and a scheduler which calls back into a single threaded
 *    main loop (the UI thread) from any thread
 * 2. a widget layer protocol: an ordered container keeping widgets in a 1:1
 *    mapping with business objects, sorted by a pluggable key
 *
 * Most public objects are "shared context" handles: cheap to copy, and every
 * copy refers to the same private context object holding the actual state
 * and implementation (see `su::shared_context`). Objects tied to a single
 * owner, like `su::notifier`, `su::main_loop` or `su::application`, are
 * plain non-copyable types instead.
 *
 * Operations which can fail without it being a programming error report it
 * through their return value (`bool` or `su::state`), never by throwing.
 */

#ifndef __SIMPLE_UIKIT__
#define __SIMPLE_UIKIT__

#include "utility.hpp"
#include "context.hpp"
#include "log.hpp"
#include "config.hpp"
#include "data.hpp"
#include "event.hpp"
#include "notifier.hpp"
#include "atomic_counter.hpp"
#include "channel.hpp"
#include "selectable_queue.hpp"
#include "cancellable_thread.hpp"
#include "thread_pool.hpp"
#include "main_loop.hpp"
#include "callback_handle.hpp"
#include "scheduler.hpp"
#include "application.hpp"
#include "widget_container.hpp"
#include "object_container.hpp"

#endif
