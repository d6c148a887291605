#include "srvfront.hpp"

#include <cstdlib>

#include <getopt.h>
#include <iostream>
#include <string>
#include <string_view>

// ============================================================================
// Line echo protocol: greet, then send every chunk back
// ============================================================================

class EchoHandler : public srvfront::Handler {
 public:
  using Handler::Handler;

  void handle() override {
    SRVFRONT_LOG_INFO(logger(), "client #" << id() << " connected from " << peer().host << ":" << peer().port);
    push("220 srvfront echo ready.\r\n");
  }

 protected:
  void on_data(std::string_view data) override {
    if (data.substr(0, 4) == "QUIT") {
      push("221 Goodbye.\r\n");
      close_when_done();
      return;
    }
    push(data);
  }

  void on_close() override { SRVFRONT_LOG_DEBUG(logger(), "client #" << id() << " closed"); }
};

static void usage(const char* prog) {
  std::cout << "Usage: " << prog << " [options]\n"
            << "Options:\n"
            << "  -H, --host HOST          Interface to bind (default: all)\n"
            << "  -p, --port PORT          Port to listen on (default: 2121)\n"
            << "  -w, --workers N          Worker processes; 0 = one per CPU (default: 1)\n"
            << "  -c, --max-cons N         Global connection limit; 0 = unlimited (default: 512)\n"
            << "  -i, --max-cons-per-ip N  Per-address limit; 0 = unlimited (default: 0)\n"
            << "  -b, --backlog N          listen() backlog (default: 100)\n"
            << "  -t, --timeout MS         Poll timeout in milliseconds (default: 1000)\n"
            << "      --tls-cert FILE      Serve TLS with this certificate (PEM)\n"
            << "      --tls-key FILE       Private key for --tls-cert (PEM)\n"
            << "  -v, --verbose            Debug logging\n"
            << "  -h, --help               Show this help message\n";
}

static bool parse_number(const char* text, long min, long max, long* out) {
  char* end = nullptr;
  long value = std::strtol(text, &end, 10);
  if (end == text || *end != '\0' || value < min || value > max) {
    return false;
  }
  *out = value;
  return true;
}

int main(int argc, char* argv[]) {
  enum { kOptTlsCert = 256, kOptTlsKey };

  static const struct option kLongOptions[] = {
      {"host", required_argument, nullptr, 'H'},
      {"port", required_argument, nullptr, 'p'},
      {"workers", required_argument, nullptr, 'w'},
      {"max-cons", required_argument, nullptr, 'c'},
      {"max-cons-per-ip", required_argument, nullptr, 'i'},
      {"backlog", required_argument, nullptr, 'b'},
      {"timeout", required_argument, nullptr, 't'},
      {"tls-cert", required_argument, nullptr, kOptTlsCert},
      {"tls-key", required_argument, nullptr, kOptTlsKey},
      {"verbose", no_argument, nullptr, 'v'},
      {"help", no_argument, nullptr, 'h'},
      {nullptr, 0, nullptr, 0},
  };

  std::string host;
  long port = 2121;
  long workers = 1;
  long max_cons = static_cast<long>(srvfront::AdmissionController::kDefaultMaxCons);
  long max_cons_per_ip = 0;
  long backlog = 100;
  long timeout_ms = 1000;
  std::string tls_cert;
  std::string tls_key;
  bool verbose = false;

  int opt;
  while ((opt = getopt_long(argc, argv, "H:p:w:c:i:b:t:vh", kLongOptions, nullptr)) != -1) {
    bool ok = true;
    switch (opt) {
      case 'H':
        host = optarg;
        break;
      case 'p':
        ok = parse_number(optarg, 0, 65535, &port);
        break;
      case 'w':
        ok = parse_number(optarg, 0, 1024, &workers);
        break;
      case 'c':
        ok = parse_number(optarg, 0, 1000000, &max_cons);
        break;
      case 'i':
        ok = parse_number(optarg, 0, 1000000, &max_cons_per_ip);
        break;
      case 'b':
        ok = parse_number(optarg, 1, 65535, &backlog);
        break;
      case 't':
        ok = parse_number(optarg, -1, 3600000, &timeout_ms);
        break;
      case kOptTlsCert:
        tls_cert = optarg;
        break;
      case kOptTlsKey:
        tls_key = optarg;
        break;
      case 'v':
        verbose = true;
        break;
      case 'h':
        usage(argv[0]);
        return 0;
      default:
        usage(argv[0]);
        return 1;
    }
    if (!ok) {
      std::cerr << "Invalid option value: " << optarg << std::endl;
      return 1;
    }
  }

  srvfront::StderrSink sink(workers != 1);
  srvfront::Logger logger(sink, verbose ? srvfront::LogLevel::kDebug : srvfront::LogLevel::kInfo);
  srvfront::PollLoop loop(logger);

  srvfront::ServerOptions options;
  options.backlog = static_cast<int>(backlog);
  options.max_cons = static_cast<size_t>(max_cons);
  options.max_cons_per_ip = static_cast<size_t>(max_cons_per_ip);
  options.tcp_tuning.tcp_nodelay = true;
  options.tls.cert_path = tls_cert;
  options.tls.key_path = tls_key.empty() ? tls_cert : tls_key;
  options.logger = logger;

  srvfront::ServeOptions serve_options;
  serve_options.timeout_ms = static_cast<int>(timeout_ms);
  serve_options.worker_processes = static_cast<int>(workers);

  try {
    srvfront::Server server(host, static_cast<uint16_t>(port), srvfront::handler_type<EchoHandler>("EchoHandler"),
                            loop, options);
    SRVFRONT_LOG_INFO(logger, "Starting srvfront echo on port " << server.address().port);

    auto result = server.serve(serve_options);
    server.close_all();
    if (!result.has_value()) {
      std::cerr << "Error: " << srvfront::to_string(result.get_error()) << std::endl;
      return 1;
    }
  } catch (const srvfront::BindError& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  } catch (const srvfront::ConfigError& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
