#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <orca/codec/state_codec.hpp>
#include <orca/crypto/sign.hpp>
#include <orca/hash/blake2b.hpp>
#include <orca/signing/signature_coordinator.hpp>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;

std::optional<orca::schema::bytes_t> read_file(const std::string& path) {
  auto in = std::ifstream{path, std::ios::binary};
  if (!in) {
    return std::nullopt;
  }
  return orca::schema::bytes_t{std::istreambuf_iterator<char>{in},
                               std::istreambuf_iterator<char>{}};
}

bool write_file(const std::string& path, const orca::schema::bytes_t& bytes) {
  auto out = std::ofstream{path, std::ios::binary | std::ios::trunc};
  out.write(reinterpret_cast<const char*>(bytes.data()),
            static_cast<std::streamsize>(bytes.size()));
  return static_cast<bool>(out);
}

template <std::size_t N>
std::optional<std::array<uint8_t, N>> parse_fixed(const std::string& hex) {
  auto bytes = orca::schema::try_from_hex(hex);
  if (!bytes || bytes->size() != N) {
    return std::nullopt;
  }
  auto out = std::array<uint8_t, N>{};
  std::copy(std::begin(*bytes), std::end(*bytes), std::begin(out));
  return out;
}

template <typename T>
int report_failure(const orca::schema::result<T>& failed) {
  spdlog::error("{} [{}]: {} {}", orca::schema::to_string(failed.code),
                failed.codespace, failed.log, failed.info);
  std::cerr << orca::schema::to_string(failed.code) << ": " << failed.log;
  if (!failed.info.empty()) {
    std::cerr << " (" << failed.info << ")";
  }
  std::cerr << '\n';
  return static_cast<int>(failed.code);
}

void print_status(const orca::schema::session_status_t& status) {
  std::cout << orca::schema::to_string(orca::schema::to_transaction_status(
                   status))
            << '\n';
  std::visit(overloaded{[](const orca::schema::session_pending_t& pending) {
                          std::cout << pending.collected << "/"
                                    << pending.required << " signed\n";
                          for (const auto& signer : pending.missing) {
                            std::cout << "missing "
                                      << orca::schema::to_hex(signer) << '\n';
                          }
                        },
                        [](const orca::schema::session_complete_t& complete) {
                          std::cout << orca::schema::to_hex(complete.tx_id)
                                    << '\n';
                        }},
             status);
}

std::optional<orca::schema::tx_id_t> session_argument(
    const po::variables_map& vm) {
  if (!vm.contains("session")) {
    std::cerr << "--session is required\n";
    return std::nullopt;
  }
  auto session = orca::schema::try_make_hash32(vm["session"].as<std::string>());
  if (!session) {
    std::cerr << "--session must be a 32-byte transaction id in hex\n";
  }
  return session;
}

std::optional<orca::schema::bytes_t> transaction_argument(
    const po::variables_map& vm) {
  if (vm.contains("tx-hex")) {
    return orca::schema::try_from_hex(vm["tx-hex"].as<std::string>());
  }
  if (vm.contains("tx-file")) {
    return read_file(vm["tx-file"].as<std::string>());
  }
  std::cerr << "--tx-file or --tx-hex is required\n";
  return std::nullopt;
}

int run_sign(const po::variables_map& vm) {
  auto tx_bytes = transaction_argument(vm);
  if (!tx_bytes) {
    return 1;
  }
  auto tx = orca::codec::decode_transaction(
      orca::schema::make_bytes_view(*tx_bytes));
  if (!tx) {
    return report_failure(tx);
  }
  if (!vm.contains("secret")) {
    std::cerr << "--secret is required\n";
    return 1;
  }
  auto secret = parse_fixed<32>(vm["secret"].as<std::string>());
  if (!secret) {
    std::cerr << "--secret must be a 32-byte ed25519 seed in hex\n";
    return 1;
  }
  auto tx_id = orca::codec::transaction_id(tx->body);
  auto vkey = orca::crypto::derive_public_key(*secret);
  auto signature = orca::crypto::sign(
      orca::schema::bytes_view_t{tx_id.data(), tx_id.size()}, *secret);
  if (!vkey || !signature) {
    std::cerr << "signing failed\n";
    return 1;
  }
  spdlog::info("Signed {} as {}", orca::schema::to_hex(tx_id),
               orca::schema::to_hex(orca::hash::key_hash(*vkey)));
  std::cout << orca::schema::to_hex(orca::hash::key_hash(*vkey)) << ' '
            << orca::schema::to_hex(*vkey) << ' '
            << orca::schema::to_hex(*signature) << '\n';
  return 0;
}

int run_session_command(const std::string& command,
                        const po::variables_map& vm,
                        orca::signing::signature_coordinator& coordinator) {
  if (command == "session-start") {
    auto tx_bytes = transaction_argument(vm);
    if (!tx_bytes) {
      return 1;
    }
    auto signers = std::vector<orca::schema::key_hash_t>{};
    if (vm.contains("signer")) {
      for (const auto& hex : vm["signer"].as<std::vector<std::string>>()) {
        auto signer = orca::schema::try_make_hash28(hex);
        if (!signer) {
          std::cerr << "--signer must be a 28-byte key hash in hex\n";
          return 1;
        }
        signers.push_back(*signer);
      }
    }
    if (signers.empty()) {
      // Fall back to the signers the body itself declares.
      auto tx = orca::codec::decode_transaction(
          orca::schema::make_bytes_view(*tx_bytes));
      if (!tx) {
        return report_failure(tx);
      }
      signers = tx->body.required_signers;
    }
    auto session = coordinator.start(orca::schema::make_bytes_view(*tx_bytes),
                                     std::move(signers));
    if (!session) {
      return report_failure(session);
    }
    std::cout << orca::schema::to_hex(*session) << '\n';
    return 0;
  }

  if (command == "import") {
    if (!vm.contains("in")) {
      std::cerr << "--in is required\n";
      return 1;
    }
    auto envelope = read_file(vm["in"].as<std::string>());
    if (!envelope) {
      std::cerr << "cannot read " << vm["in"].as<std::string>() << '\n';
      return 1;
    }
    auto status =
        coordinator.import_envelope(orca::schema::make_bytes_view(*envelope));
    if (!status) {
      return report_failure(status);
    }
    print_status(*status);
    return 0;
  }

  auto session = session_argument(vm);
  if (!session) {
    return 1;
  }

  if (command == "contribute") {
    if (!vm.contains("vkey") || !vm.contains("signature")) {
      std::cerr << "--vkey and --signature are required\n";
      return 1;
    }
    auto vkey = parse_fixed<32>(vm["vkey"].as<std::string>());
    auto signature = parse_fixed<64>(vm["signature"].as<std::string>());
    if (!vkey || !signature) {
      std::cerr << "--vkey takes 32 bytes and --signature 64 bytes of hex\n";
      return 1;
    }
    auto signer = orca::hash::key_hash(*vkey);
    if (vm.contains("signer")) {
      auto declared = orca::schema::try_make_hash28(
          vm["signer"].as<std::vector<std::string>>().front());
      if (!declared) {
        std::cerr << "--signer must be a 28-byte key hash in hex\n";
        return 1;
      }
      signer = *declared;
    }
    auto status = coordinator.contribute(
        *session, signer,
        orca::schema::vkey_witness_t{.vkey = *vkey, .signature = *signature});
    if (!status) {
      return report_failure(status);
    }
    print_status(*status);
    return 0;
  }

  if (command == "status") {
    auto status = coordinator.status(*session);
    if (!status) {
      return report_failure(status);
    }
    print_status(*status);
    return 0;
  }

  if (command == "export") {
    if (!vm.contains("out")) {
      std::cerr << "--out is required\n";
      return 1;
    }
    auto envelope = coordinator.export_envelope(*session);
    if (!envelope) {
      return report_failure(envelope);
    }
    if (!write_file(vm["out"].as<std::string>(), *envelope)) {
      std::cerr << "cannot write " << vm["out"].as<std::string>() << '\n';
      return 1;
    }
    return 0;
  }

  if (command == "assemble") {
    auto status = coordinator.status(*session);
    if (!status) {
      return report_failure(status);
    }
    const auto* complete =
        std::get_if<orca::schema::session_complete_t>(&*status);
    if (complete == nullptr) {
      print_status(*status);
      return 1;
    }
    if (vm.contains("out")) {
      if (!write_file(vm["out"].as<std::string>(),
                      complete->signed_transaction)) {
        std::cerr << "cannot write " << vm["out"].as<std::string>() << '\n';
        return 1;
      }
    } else {
      std::cout << orca::schema::to_hex(complete->signed_transaction) << '\n';
    }
    return 0;
  }

  if (command == "abandon") {
    auto abandoned = coordinator.abandon(*session);
    if (!abandoned) {
      return report_failure(abandoned);
    }
    return 0;
  }

  std::cerr << "unknown command '" << command << "'\n";
  return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>("orca.log", false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "orca", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::info);

  auto command = std::string{};
  auto db_path = std::string{};
  auto config_path = std::string{};

  auto description = po::options_description{"orca"};
  description.add_options()("help,h", "Show the help message")(
      "command", po::value<std::string>(&command),
      "sign|session-start|contribute|status|export|import|assemble|abandon")(
      "config,c", po::value<std::string>(&config_path),
      "INI file with default option values")(
      "db", po::value<std::string>(&db_path)->default_value("orca-sessions"),
      "RocksDB path of the session store")(
      "tx-file", po::value<std::string>(), "transaction CBOR file")(
      "tx-hex", po::value<std::string>(), "transaction CBOR as hex")(
      "secret", po::value<std::string>(), "ed25519 seed hex")(
      "session", po::value<std::string>(), "session (transaction) id hex")(
      "signer", po::value<std::vector<std::string>>()->multitoken(),
      "required signer key hash hex")("vkey", po::value<std::string>(),
                                      "witness verification key hex")(
      "signature", po::value<std::string>(), "witness signature hex")(
      "in", po::value<std::string>(), "envelope input file")(
      "out", po::value<std::string>(), "output file")(
      "verbose,v", "Enable verbose output");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(description)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.contains("config")) {
      po::store(
          po::parse_config_file<char>(vm["config"].as<std::string>().c_str(),
                                      description),
          vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n';
    spdlog::shutdown();
    return 1;
  }

  if (vm.contains("help") || command.empty()) {
    std::cout << description << std::endl;
    spdlog::shutdown();
    return 0;
  }
  if (vm.contains("verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }

  auto code = 0;
  if (command == "sign") {
    code = run_sign(vm);
  } else {
    auto coordinator = orca::signing::signature_coordinator{db_path};
    code = run_session_command(command, vm, coordinator);
  }

  spdlog::shutdown();
  return code;
}
