#pragma once
#include <rill/version.hpp>

#include <rill/core/log.hpp>
#include <rill/core/config.hpp>
#include <rill/core/diagnostics.hpp>
#include <rill/core/errors.hpp>

#include <rill/core/event.hpp>
#include <rill/core/terminal_guard.hpp>
#include <rill/core/disposable.hpp>
#include <rill/core/disposal_bag.hpp>
#include <rill/core/observer.hpp>
#include <rill/core/sink.hpp>
#include <rill/core/observable.hpp>
#include <rill/core/sources.hpp>
#include <rill/core/scheduler.hpp>

#include <rill/subjects/publish_subject.hpp>
#include <rill/subjects/behavior_subject.hpp>
#include <rill/subjects/replay_subject.hpp>
#include <rill/subjects/relay.hpp>

#include <rill/traits/single.hpp>
#include <rill/traits/completable.hpp>
#include <rill/traits/maybe.hpp>
#include <rill/traits/conversions.hpp>

#include <rill/drivers/driver.hpp>
