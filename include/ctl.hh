#pragma once

#include "prelude.hh"
#include "ctl/command.hh"
#include "ctl/transport.hh"
#include "ctl/console.hh"
