#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace soundscribe::runtime {

/*
  Hosts the gRPC control services.
*/
class Server {
public:
  Server(std::string bind_address, std::vector<std::unique_ptr<grpc::Service>> services);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();

  // In-flight calls get grace to finish before being cancelled.
  void Stop(std::chrono::milliseconds grace = std::chrono::seconds(5));

  // Port actually bound; resolves ":0" binds.
  int Port() const { return selected_port_; }

private:
  std::string bind_address_;
  std::vector<std::unique_ptr<grpc::Service>> services_;
  std::unique_ptr<grpc::Server> grpc_server_;
  int selected_port_ = 0;
};

} // namespace soundscribe::runtime
