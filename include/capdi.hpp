#pragma once

#include "capdi/export.hpp"
#include "capdi/fwd.hpp"
#include "capdi/lifetime.hpp"
#include "capdi/descriptor.hpp"
#include "capdi/exceptions.hpp"
#include "capdi/type_traits.hpp"
#include "capdi/logging.hpp"
#include "capdi/scope.hpp"
#include "capdi/container.hpp"
#include "capdi/registry.hpp"
