#pragma once

#include "seat/inventory/v1/state.pb.h"
