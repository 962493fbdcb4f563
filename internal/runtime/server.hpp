#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace payday::runtime {

/*
  Owns the gRPC transport and the service adapters registered on it.

  Stop() lets in-flight calls finish for up to shutdown_grace before they
  are cancelled; a SendPayment cut short still has its attempt recorded.
*/
class Server {
public:
  Server(std::string bind_address, std::vector<std::unique_ptr<grpc::Service>> services,
         std::chrono::milliseconds shutdown_grace = std::chrono::milliseconds(5000));
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();
  void Stop();

  const std::string& BindAddress() const { return bind_address_; }

private:
  std::string bind_address_;
  std::vector<std::unique_ptr<grpc::Service>> services_;
  std::chrono::milliseconds shutdown_grace_;
  std::unique_ptr<grpc::Server> grpc_server_;
};

} // namespace payday::runtime
