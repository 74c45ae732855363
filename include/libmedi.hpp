#pragma once

#include "libmedi/export.hpp"
#include "libmedi/fwd.hpp"
#include "libmedi/lifetime.hpp"
#include "libmedi/disposable.hpp"
#include "libmedi/erased_ptr.hpp"
#include "libmedi/decorated_ptr.hpp"
#include "libmedi/descriptor.hpp"
#include "libmedi/exceptions.hpp"
#include "libmedi/log.hpp"
#include "libmedi/result.hpp"
#include "libmedi/request.hpp"
#include "libmedi/type_traits.hpp"
#include "libmedi/handler_catalog.hpp"
#include "libmedi/pipeline.hpp"
#include "libmedi/registry.hpp"
#include "libmedi/resolver.hpp"
#include "libmedi/scope.hpp"
#include "libmedi/mediator.hpp"
#include "libmedi/behaviors.hpp"
