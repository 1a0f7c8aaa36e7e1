#pragma once

#include "init.hpp"
#include "log.hpp"
#include "errors.hpp"
#include "clock.hpp"
#include "execution_context.hpp"
#include "dispatcher_pool.hpp"
#include "job.hpp"
#include "deferred.hpp"
#include "scope.hpp"
