#pragma once

#include "tessella/core/Base.h"
#include "tessella/core/Log.h"
#include "tessella/core/Assert.h"
