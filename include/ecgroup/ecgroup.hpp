#pragma once

#include "ecgroup/common/errors.hpp"
#include "ecgroup/group/element.hpp"
#include "ecgroup/group/group.hpp"
#include "ecgroup/group/scalar.hpp"
