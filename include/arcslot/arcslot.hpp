#pragma once
#include "utils.hpp"
#include "slot.hpp"
#include "slot_registry.hpp"
#include "handle.hpp"
#include "unique_resource.hpp"
