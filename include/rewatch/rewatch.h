#pragma once

#include <rewatch/config.h>
#include <rewatch/engine.h>
#include <rewatch/input.h>
#include <rewatch/log.h>
#include <rewatch/monitor.h>
#include <rewatch/output.h>
#include <rewatch/scheduler.h>
#include <rewatch/state_dir.h>
#include <rewatch/var.h>
