#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "config/config.pb.h"
#include "internal/address/address.hpp"
#include "internal/auth/structured_message.hpp"
#include "internal/crypto/hash.hpp"
#include "internal/crypto/secp256k1.hpp"
#include "internal/observability/logging.hpp"
#include "internal/probe/curl_http_client.hpp"
#include "internal/probe/endpoint_prober.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"
#include "internal/util/time.hpp"

using namespace x402;

static void Usage() {
  std::cout << "Usage:\n"
            << "  registryctl keygen [--testnet]\n"
            << "  registryctl address <pubkey-hex> [--testnet]\n"
            << "  registryctl fingerprint <address>\n"
            << "  registryctl sign-structured <privkey-hex> <message-hex> <domain-hex>\n"
            << "  registryctl sign-simple <privkey-hex> <message>\n"
            << "  registryctl probe <url> [timeout=10s]\n";
}

static uint8_t VersionFor(const std::vector<std::string>& args) {
  for (const auto& arg : args) {
    if (arg == "--testnet") {
      return address::SingleSigVersion(address::Network::Testnet);
    }
  }
  return address::SingleSigVersion(address::Network::Mainnet);
}

static crypto::PrivateKey RequirePrivateKey(const std::string& hex) {
  auto key = crypto::ParsePrivateKey(hex);
  if (!key) {
    throw util::InvalidArgument("invalid private key: expected 64 hex chars (or 66 ending in 01)");
  }
  return *key;
}

static util::Bytes RequireHex(const std::string& hex, const char* what) {
  auto bytes = util::FromHex(hex);
  if (!bytes) {
    throw util::InvalidArgument(std::string("invalid ") + what + " hex");
  }
  return *bytes;
}

static int Keygen(const std::vector<std::string>& args) {
  const auto key    = crypto::GeneratePrivateKey();
  const auto pubkey = crypto::DerivePublicKey(key);

  std::cout << "private_key: " << util::ToHex(key.data(), key.size()) << "01\n"
            << "public_key:  " << util::ToHex(pubkey.data(), pubkey.size()) << "\n"
            << "address:     " << address::Address::FromPublicKey(pubkey, VersionFor(args)).ToString() << "\n";
  return 0;
}

static int AddressOf(const std::vector<std::string>& args) {
  const auto bytes = RequireHex(args.at(0), "public key");
  if (bytes.size() != std::tuple_size<crypto::PublicKey>::value) {
    throw util::InvalidArgument("public key must be 33 bytes (compressed)");
  }

  crypto::PublicKey pubkey{};
  std::copy(bytes.begin(), bytes.end(), pubkey.begin());
  std::cout << address::Address::FromPublicKey(pubkey, VersionFor(args)).ToString() << "\n";
  return 0;
}

static int Fingerprint(const std::vector<std::string>& args) {
  const auto parsed = address::Address::Parse(args.at(0));
  std::cout << "canonical:   " << parsed.ToString() << "\n"
            << "version:     " << static_cast<int>(parsed.version()) << (parsed.IsMainnet() ? " (mainnet)" : " (testnet)") << "\n"
            << "fingerprint: " << parsed.FingerprintHex() << "\n";
  return 0;
}

static int SignStructured(const std::vector<std::string>& args) {
  const auto key     = RequirePrivateKey(args.at(0));
  const auto message = RequireHex(args.at(1), "message");
  const auto domain  = RequireHex(args.at(2), "domain");

  const auto hash      = auth::StructuredDataHash(domain, message);
  const auto signature = crypto::SignRecoverable(hash, key);
  std::cout << util::ToHex(signature.data(), signature.size()) << "\n";
  return 0;
}

static int SignSimple(const std::vector<std::string>& args) {
  const auto key = RequirePrivateKey(args.at(0));

  const auto hash      = crypto::Sha256(std::string_view(args.at(1)));
  const auto signature = crypto::SignRecoverable(hash, key);
  std::cout << util::ToHex(signature.data(), signature.size()) << "\n";
  return 0;
}

static int Probe(const std::vector<std::string>& args) {
  x402::runtime::config::LoggingConfig logging;
  logging.set_level("warn");
  observability::InitializeLogging(logging);

  probe::ProberOptions options;
  if (args.size() > 1) {
    options.timeout = util::ParseDuration(args.at(1));
  }

  probe::EndpointProber prober(std::make_shared<probe::CurlHttpClient>(), options);
  const auto            report = prober.Probe(args.at(0)).ToReport();

  google::protobuf::util::JsonPrintOptions print;
  print.add_whitespace              = true;
  print.preserve_proto_field_names  = true;
  print.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(report, &json, print);
  if (!status.ok()) {
    throw std::runtime_error("failed to render probe report: " + std::string(status.message()));
  }
  std::cout << json;
  return report.is_x402_endpoint() ? 0 : 3;
}

int main(int argc, char** argv) {
  if (argc < 2) {
    Usage();
    return 1;
  }

  const std::string        cmd = argv[1];
  std::vector<std::string> args(argv + 2, argv + argc);

  struct Command {
    const char* name;
    std::size_t min_args;
    int (*run)(const std::vector<std::string>&);
  };
  static const Command kCommands[] = {
      {"keygen", 0, Keygen},           {"address", 1, AddressOf},         {"fingerprint", 1, Fingerprint},
      {"sign-structured", 3, SignStructured}, {"sign-simple", 2, SignSimple}, {"probe", 1, Probe},
  };

  for (const auto& command : kCommands) {
    if (cmd != command.name) {
      continue;
    }
    if (args.size() < command.min_args) {
      Usage();
      return 1;
    }
    try {
      return command.run(args);
    } catch (const std::exception& e) {
      std::cerr << cmd << ": " << e.what() << "\n";
      return 2;
    }
  }

  Usage();
  return 1;
}
