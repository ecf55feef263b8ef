#pragma once

#include <cf/coerce.h>
#include <cf/constraints.h>
#include <cf/declaration.h>
#include <cf/errors.h>
#include <cf/plan.h>
#include <cf/record.h>
#include <cf/registry.h>
#include <cf/report.h>
#include <cf/schema.h>
#include <cf/types.h>
#include <cf/validate.h>
#include <cf/value.h>
