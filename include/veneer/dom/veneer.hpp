#pragma once

#include <veneer/dom/config.hpp>
#include <veneer/dom/context.hpp>
#include <veneer/dom/diff.hpp>
#include <veneer/dom/error.hpp>
#include <veneer/dom/events.hpp>
#include <veneer/dom/host.hpp>
#include <veneer/dom/html.hpp>
#include <veneer/dom/interner.hpp>
#include <veneer/dom/json.hpp>
#include <veneer/dom/log.hpp>
#include <veneer/dom/mutation_queue.hpp>
#include <veneer/dom/node.hpp>
#include <veneer/dom/patch.hpp>
#include <veneer/dom/root.hpp>
#include <veneer/dom/tree.hpp>
