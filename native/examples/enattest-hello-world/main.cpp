#include <enattest/android/attestation_validator.h>
#include <enattest/nonce/nonce.h>
#include <enattest/validation/validation_result.h>
#include <enattest/x509/trusted_root_store.h>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

std::string ReadAllText(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    throw std::runtime_error("failed to open file: " + path);
  }
  std::string out((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  if (f.bad()) {
    throw std::runtime_error("failed to read file: " + path);
  }
  while (!out.empty() && (out.back() == '\n' || out.back() == '\r' || out.back() == ' ')) {
    out.pop_back();
  }
  return out;
}

// Nonce supplied on the command line instead of derived from a publish request.
class FixedNonce final : public enattest::nonce::INonce {
 public:
  explicit FixedNonce(std::string value) : value_(std::move(value)) {}
  std::string Value() const override { return value_; }

 private:
  std::string value_;
};

enattest::nonce::Publish SamplePublish() {
  enattest::nonce::Publish p;
  p.keys = {
      {"x21Goi8X9m/glOZ0+wz8fA", 263123, 144},
      {"2mvFSmRsFmJR5r07dxGSjg", 263267, 144},
      {"6bAd3dv7p+VEuaJVkVItaQ", 263411, 27},
  };
  p.regions = {"GB", "US"};
  p.app_package_name = "com.google.android.apps.exposurenotification";
  p.transmission_risk = 4;
  p.verification_authority_name = "QRTH-ROWO-LOLO-FOOB";
  return p;
}

void PrintResult(const enattest::validation::ValidationResult& r) {
  std::cout << "is_valid: " << (r.is_valid ? "true" : "false") << "\n";
  std::cout << "validator: " << r.validator_name << "\n";

  if (!r.metadata.empty()) {
    std::cout << "metadata:\n";
    for (const auto& kv : r.metadata) {
      std::cout << "  " << kv.first << ": " << kv.second << "\n";
    }
  }

  for (const auto& f : r.failures) {
    std::cout << "- " << f.message << " (" << enattest::validation::ToString(f.error_code) << ", "
              << enattest::validation::ToString(f.kind()) << ")\n";
    if (f.property_name) {
      std::cout << "  property: " << *f.property_name << "\n";
    }
    if (f.attempted_value) {
      std::cout << "  value: " << *f.attempted_value << "\n";
    }
  }
}

std::string GetArgValue(int argc, char** argv, const std::string& name) {
  for (int i = 0; i < argc; ++i) {
    if (argv[i] == name) {
      if (i + 1 >= argc) {
        throw std::runtime_error("missing value for " + name);
      }
      return argv[i + 1];
    }
  }
  return {};
}

[[noreturn]] void PrintUsageAndExit(const char* exe) {
  std::cerr
      << "Usage:\n"
      << "  " << exe << " nonce\n"
      << "  " << exe << " validate --statement <file> --nonce <base64> [--roots <pem>] [--app <package>]\n"
      << "        [--digest <base64>] [--at <unix seconds>] [--window <seconds>]\n";
  std::exit(2);
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::debug);
  auto logger = std::make_shared<spdlog::logger>("enattest", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  spdlog::set_default_logger(logger);

  try {
    if (argc < 2) {
      PrintUsageAndExit(argv[0]);
    }

    const std::string mode = argv[1];

    if (mode == "nonce") {
      const auto publish = SamplePublish();
      std::cout << "cleartext: " << enattest::nonce::NonceCleartext(publish) << "\n";
      std::cout << "nonce: " << enattest::nonce::ComputeNonce(publish) << "\n";
      return 0;
    }

    if (mode == "validate") {
      const std::string statementPath = GetArgValue(argc, argv, "--statement");
      const std::string nonce = GetArgValue(argc, argv, "--nonce");
      const std::string rootsPath = GetArgValue(argc, argv, "--roots");
      const std::string at = GetArgValue(argc, argv, "--at");
      const std::string window = GetArgValue(argc, argv, "--window");

      if (statementPath.empty() || nonce.empty()) {
        PrintUsageAndExit(argv[0]);
      }

      enattest::android::VerifyOptions opt;
      opt.app_pkg_name = GetArgValue(argc, argv, "--app");
      opt.apk_digest = GetArgValue(argc, argv, "--digest");
      opt.nonce = std::make_shared<FixedNonce>(nonce);

      if (!rootsPath.empty()) {
        std::string error;
        auto roots = enattest::x509::TrustedRootStore::FromPemFile(rootsPath, &error);
        if (!roots) {
          std::cerr << "failed to load trusted roots: " << error << "\n";
          return 1;
        }
        opt.chain_options.trust_mode = enattest::x509::X509TrustMode::kCustomRoots;
        opt.chain_options.trusted_roots = std::make_shared<const enattest::x509::TrustedRootStore>(std::move(*roots));
      }

      enattest::android::ValidationContext ctx;
      ctx.logger = logger;
      auto now = std::chrono::system_clock::now();
      if (!at.empty()) {
        now = std::chrono::system_clock::time_point{std::chrono::seconds(std::stoll(at))};
        ctx.clock = [now] { return now; };
      }

      const auto slack = std::chrono::seconds(window.empty() ? 300 : std::stoll(window));
      opt.min_valid_time = now - slack;
      opt.max_valid_time = now + slack;

      const auto r = enattest::android::ValidateAttestation(ctx, ReadAllText(statementPath), opt);
      PrintResult(r);
      return r.is_valid ? 0 : 3;
    }

    PrintUsageAndExit(argv[0]);
  } catch (const std::exception& e) {
    spdlog::error("{}", e.what());
    return 1;
  }
}
