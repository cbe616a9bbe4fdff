#pragma once

#include "soundscribe/control/v1/control.pb.h"
#include "soundscribe/control/v1/control.grpc.pb.h"
