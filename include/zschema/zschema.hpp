#pragma once

#include <zschema/value.hpp>
#include <zschema/errors.hpp>
#include <zschema/logging.hpp>
#include <zschema/codec.hpp>
#include <zschema/schema.hpp>
#include <zschema/types.hpp>
#include <zschema/builders.hpp>
