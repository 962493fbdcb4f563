#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/service/payment_service.hpp"
#include "payday/v1.hpp"

namespace payday::grpc {

class PaymentServer final : public payday::v1::PaymentService::Service {
public:
  explicit PaymentServer(std::shared_ptr<payday::service::PaymentService> svc);

  ::grpc::Status CreateInvoice(::grpc::ServerContext*,
                               const payday::v1::CreateInvoiceRequest*,
                               payday::v1::CreateInvoiceResponse*) override;

  ::grpc::Status CancelInvoice(::grpc::ServerContext*,
                               const payday::v1::CancelInvoiceRequest*,
                               payday::v1::CancelInvoiceResponse*) override;

  ::grpc::Status SendPayment(::grpc::ServerContext*,
                             const payday::v1::SendPaymentRequest*,
                             payday::v1::SendPaymentResponse*) override;

  ::grpc::Status GetPayment(::grpc::ServerContext*,
                            const payday::v1::GetPaymentRequest*,
                            payday::v1::GetPaymentResponse*) override;

  ::grpc::Status ListPaymentEvents(::grpc::ServerContext*,
                                   const payday::v1::ListPaymentEventsRequest*,
                                   payday::v1::ListPaymentEventsResponse*) override;

private:
  std::shared_ptr<payday::service::PaymentService> service_;
};

}
