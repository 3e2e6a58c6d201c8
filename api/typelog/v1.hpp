#pragma once

#include <google/protobuf/any.pb.h>

#include "typelog/v1/envelope.pb.h"
