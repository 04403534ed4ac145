#ifndef LARDER_CORE_H
#define LARDER_CORE_H

#include <larder/core/exception.h>
#include <larder/core/monitoring.h>
#include <larder/core/type_definitions.h>

#endif
