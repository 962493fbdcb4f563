#pragma once

#include "service_context.hpp"
#include "payday/v1.hpp"

namespace payday::service {

class PaymentService {
public:
  explicit PaymentService(ServiceContext ctx);

  payday::v1::CreateInvoiceResponse CreateInvoice(const payday::v1::CreateInvoiceRequest& req);

  payday::v1::CancelInvoiceResponse CancelInvoice(const payday::v1::CancelInvoiceRequest& req);

  payday::v1::SendPaymentResponse SendPayment(const payday::v1::SendPaymentRequest& req);

  payday::v1::GetPaymentResponse GetPayment(const payday::v1::GetPaymentRequest& req);

  payday::v1::ListPaymentEventsResponse ListPaymentEvents(const payday::v1::ListPaymentEventsRequest& req);

private:
  ServiceContext ctx_;
};

}
