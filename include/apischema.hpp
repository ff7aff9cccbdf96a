#pragma once

// Umbrella header: reference resolution and OpenAPI-aware schema validation.

#include "apischema/exceptions.hpp"
#include "apischema/logging.hpp"
#include "apischema/resolver/handlers.hpp"
#include "apischema/resolver/resolver.hpp"
#include "apischema/settings.hpp"
#include "apischema/telemetry.hpp"
#include "apischema/types.hpp"
#include "apischema/validation/error.hpp"
#include "apischema/validation/format.hpp"
#include "apischema/validation/keywords.hpp"
#include "apischema/validation/validator.hpp"
#include "apischema/version.hpp"
