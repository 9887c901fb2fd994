#pragma once

// Umbrella header for the Jettison binary codec.

#include <jettison/codec.hpp>
#include <jettison/errors.hpp>
#include <jettison/format.hpp>
#include <jettison/logger.hpp>
#include <jettison/schema.hpp>
#include <jettison/value.hpp>
