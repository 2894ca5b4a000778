#pragma once
#include <crow.h>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace tsforecast {
namespace engine {

class ApiServer {
public:
  using Handler = std::function<crow::response(const crow::request&)>;

  ApiServer(const std::string& ip, int port, const std::string& runs_dir);
  void init();
  void start();
  void stop();

private:
  void registerRoutes();
  void addRoute(const std::string& path, crow::HTTPMethod method, Handler h);

  // --- route handlers ---
  crow::response health(const crow::request&);
  crow::response listModels(const crow::request&);
  crow::response train(const crow::request&);
  crow::response predict(const crow::request&);

private:
  crow::SimpleApp app_;
  std::string ip_;
  int port_;
  std::string runs_dir_;
  std::mutex train_mu_;   // one fit at a time
};

} // namespace engine
} // namespace tsforecast
