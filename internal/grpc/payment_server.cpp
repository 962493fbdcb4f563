#include "payment_server.hpp"
#include "grpc_error.hpp"

namespace payday::grpc {

PaymentServer::PaymentServer(std::shared_ptr<payday::service::PaymentService> svc)
    : service_(std::move(svc)) {}

::grpc::Status PaymentServer::CreateInvoice(::grpc::ServerContext*,
                                            const payday::v1::CreateInvoiceRequest* req,
                                            payday::v1::CreateInvoiceResponse* resp) {
  try {
    *resp = service_->CreateInvoice(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PaymentServer::CancelInvoice(::grpc::ServerContext*,
                                            const payday::v1::CancelInvoiceRequest* req,
                                            payday::v1::CancelInvoiceResponse* resp) {
  try {
    *resp = service_->CancelInvoice(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PaymentServer::SendPayment(::grpc::ServerContext*,
                                          const payday::v1::SendPaymentRequest* req,
                                          payday::v1::SendPaymentResponse* resp) {
  try {
    *resp = service_->SendPayment(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PaymentServer::GetPayment(::grpc::ServerContext*,
                                         const payday::v1::GetPaymentRequest* req,
                                         payday::v1::GetPaymentResponse* resp) {
  try {
    *resp = service_->GetPayment(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PaymentServer::ListPaymentEvents(::grpc::ServerContext*,
                                                const payday::v1::ListPaymentEventsRequest* req,
                                                payday::v1::ListPaymentEventsResponse* resp) {
  try {
    *resp = service_->ListPaymentEvents(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
