#pragma once

#include <floem/log.hpp>
#include <floem/reactive.hpp>
#include <floem/ui/base_style.hpp>
#include <floem/ui/recalc.hpp>
#include <floem/ui/selectors.hpp>
#include <floem/ui/style.hpp>
#include <floem/ui/style_parser.hpp>
#include <floem/ui/units.hpp>
#include <floem/ui/view_state.hpp>
#include <floem/ui/view_tree.hpp>
#include <floem/ui/window_state.hpp>
