#pragma once

#include <floem/reactive/base_signal.hpp>
#include <floem/reactive/borrow.hpp>
#include <floem/reactive/context.hpp>
#include <floem/reactive/derived.hpp>
#include <floem/reactive/effect.hpp>
#include <floem/reactive/id.hpp>
#include <floem/reactive/memo.hpp>
#include <floem/reactive/runtime.hpp>
#include <floem/reactive/scope.hpp>
#include <floem/reactive/signal.hpp>
#include <floem/reactive/trigger.hpp>
