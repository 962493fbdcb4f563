#pragma once

#include "payday/v1/payment.pb.h"
#include "payday/v1/events.pb.h"
#include "payday/v1/payment_service.pb.h"
#include "payday/v1/payment_service.grpc.pb.h"
