#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <confide/auth/challenge_issuer.hpp>
#include <confide/auth/confidence_authenticator.hpp>
#include <confide/auth/embedding.hpp>
#include <confide/auth/session_store.hpp>
#include <confide/config/options.hpp>
#include <confide/crypto/cipher.hpp>
#include <confide/disclosure/disclosure_registry.hpp>
#include <confide/schema/key/keys.hpp>
#include <confide/vault/contact_directory.hpp>
#include <confide/vault/secret_vault.hpp>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace po = boost::program_options;

namespace {

constexpr auto kExitOk = 0;
constexpr auto kExitUsage = 1;
constexpr auto kExitDenied = 2;

struct command_line final {
  std::string command;
  std::string principal;
  std::string display_name;
  std::string channel;
  std::optional<std::string> category;
  std::vector<std::string> samples;
  std::string tier;
  std::string title;
  std::string content;
  std::vector<std::string> authorized;
  std::string record;
  std::optional<std::string> target;
  std::optional<std::string> target_name;
  std::string reader;
  std::string contact;
  std::string relationship;
  std::string knowledge;
};

// Services share the encoder, storage and cipher by reference.
struct services final {
  confide::schema::encoding::scale_encoder_t encoder;
  confide::storage::rocksdb_storage_t storage;
  confide::crypto::envelope_cipher cipher;
  confide::auth::session_store sessions;
  confide::vault::contact_directory contacts;
  confide::auth::challenge_issuer challenges;
  confide::auth::confidence_authenticator authenticator;
  confide::vault::secret_vault vault;
  confide::disclosure::disclosure_registry disclosures;

  services(const confide::config::options& options,
           const confide::crypto::symmetric_key_t& master_key)
      : storage{confide::storage::make_storage<
            confide::storage::rocksdb_storage_tag>(options.db_path)},
        cipher{master_key},
        contacts{encoder, storage},
        challenges{encoder,
                   storage,
                   sessions,
                   // No memory store is attached to the CLI; challenges fall
                   // back to the identity question.
                   confide::auth::memory_source_t{},
                   confide::auth::make_expected_answer_verifier(),
                   options.challenge},
        authenticator{encoder,
                      storage,
                      cipher,
                      sessions,
                      challenges,
                      confide::auth::make_placeholder_extractor(),
                      options.authenticator},
        vault{encoder, storage, cipher, sessions, contacts.lookup(),
              options.vault},
        disclosures{encoder, storage, cipher, sessions} {}
};

std::optional<confide::schema::record_id_t> parse_record(
    const std::string& hex) {
  auto record_id = confide::schema::try_make_hash32(hex);
  if (!record_id.has_value()) {
    std::cerr << "invalid record id: " << hex << std::endl;
  }
  return record_id;
}

template <typename T>
int report(const confide::schema::access_result<T>& result) {
  if (result.ok()) {
    return kExitOk;
  }
  std::cerr << to_string(result.code) << ": " << result.log << std::endl;
  return kExitDenied;
}

// Voice verification, answering any challenges on stdin.
std::optional<confide::schema::auth_session_t> authenticate(
    services& s,
    const command_line& cli) {
  if (cli.samples.empty()) {
    std::cerr << "--sample is required" << std::endl;
    return std::nullopt;
  }
  auto outcome = s.authenticator.verify(
      cli.principal, confide::schema::make_bytes_view(cli.samples.front()),
      cli.channel, cli.category);

  return std::visit(
      overloaded{
          [&](const confide::auth::authenticated_t& authenticated)
              -> std::optional<confide::schema::auth_session_t> {
            return authenticated.session;
          },
          [&](const confide::auth::challenge_required_t& required)
              -> std::optional<confide::schema::auth_session_t> {
            std::cout << "Voice confidence " << required.score
                      << " requires a knowledge check." << std::endl;
            auto responses = std::vector<confide::schema::challenge_response_t>{};
            for (const auto& challenge : required.challenges) {
              std::cout << challenge.prompt << std::endl << "> " << std::flush;
              auto answer = std::string{};
              std::getline(std::cin, answer);
              responses.push_back({.challenge_id = challenge.challenge_id,
                                   .answer = std::move(answer)});
            }
            auto result =
                s.challenges.verify(cli.principal, cli.channel, responses);
            if (!result.ok()) {
              report(result);
              return std::nullopt;
            }
            return result.value;
          },
          [&](const confide::auth::denied_t& denied)
              -> std::optional<confide::schema::auth_session_t> {
            std::cerr << to_string(denied.code) << ": " << denied.reason
                      << " (score " << denied.score << ")" << std::endl;
            return std::nullopt;
          }},
      outcome);
}

int run_command(services& s, const command_line& cli) {
  if (cli.command == "register") {
    auto record = s.authenticator.register_principal(
        cli.principal,
        cli.display_name.empty() ? cli.principal : cli.display_name);
    std::cout << record.principal_id << " " << to_string(record.status)
              << std::endl;
    return kExitOk;
  }

  if (cli.command == "enroll") {
    auto samples = std::vector<confide::schema::bytes_t>{};
    for (const auto& sample : cli.samples) {
      samples.push_back(confide::schema::make_bytes(sample));
    }
    auto result = s.authenticator.enroll(cli.principal, samples);
    if (result.ok()) {
      std::cout << "voiceprint "
                << confide::schema::to_hex(result.value->voiceprint_id)
                << std::endl;
    }
    return report(result);
  }

  if (cli.command == "verify") {
    auto session = authenticate(s, cli);
    if (!session.has_value()) {
      return kExitDenied;
    }
    std::cout << "session " << confide::schema::to_hex(session->session_id)
              << " confidence " << session->confidence << std::endl;
    return kExitOk;
  }

  if (cli.command == "put-secret") {
    auto tier = confide::schema::try_from_string<confide::schema::secrecy_tier_t>(
        cli.tier);
    if (!tier.has_value()) {
      std::cerr << "invalid tier: " << cli.tier << std::endl;
      return kExitUsage;
    }
    auto result = s.vault.put(cli.principal, *tier, cli.title, cli.content,
                              cli.authorized);
    if (result.ok()) {
      std::cout << confide::schema::to_hex(result.value->record_id) << std::endl;
    }
    return report(result);
  }

  if (cli.command == "get-secret") {
    auto record_id = parse_record(cli.record);
    if (!record_id.has_value()) {
      return kExitUsage;
    }
    auto session = authenticate(s, cli);
    if (!session.has_value()) {
      return kExitDenied;
    }
    auto result = s.vault.get_with_session(*record_id, session->session_id);
    if (result.ok()) {
      std::cout << *result.value << std::endl;
    }
    return report(result);
  }

  if (cli.command == "authorize" || cli.command == "revoke") {
    auto record_id = parse_record(cli.record);
    if (!record_id.has_value() || cli.authorized.empty()) {
      return kExitUsage;
    }
    auto status = kExitOk;
    for (const auto& principal : cli.authorized) {
      auto result = cli.command == "authorize"
                        ? s.vault.authorize(*record_id, cli.principal, principal)
                        : s.vault.revoke(*record_id, cli.principal, principal);
      if (!result.ok()) {
        status = report(result);
      }
    }
    return status;
  }

  if (cli.command == "reclassify") {
    auto record_id = parse_record(cli.record);
    auto tier = confide::schema::try_from_string<confide::schema::secrecy_tier_t>(
        cli.tier);
    if (!record_id.has_value() || !tier.has_value()) {
      return kExitUsage;
    }
    auto result = s.vault.reclassify(*record_id, cli.principal, *tier);
    if (result.ok()) {
      std::cout << confide::schema::to_hex(result.value->record_id) << std::endl;
    }
    return report(result);
  }

  if (cli.command == "audit-log") {
    auto record_id = parse_record(cli.record);
    if (!record_id.has_value()) {
      return kExitUsage;
    }
    auto result = s.vault.access_log(*record_id, cli.principal);
    if (result.ok()) {
      for (const auto& entry : *result.value) {
        std::cout << entry.sequence << " " << entry.accessed_at << " "
                  << entry.principal_id << " "
                  << (entry.success ? "granted" : "denied") << " "
                  << entry.reason << std::endl;
      }
    }
    return report(result);
  }

  if (cli.command == "set-contact") {
    auto relationship =
        confide::schema::try_from_string<confide::schema::relationship_type_t>(
            cli.relationship);
    auto knowledge = confide::schema::try_from_string<
        confide::schema::knowledge_access_level_t>(cli.knowledge);
    if (cli.contact.empty() || !relationship.has_value() ||
        !knowledge.has_value()) {
      std::cerr << "--contact, --relationship and --knowledge are required"
                << std::endl;
      return kExitUsage;
    }
    s.contacts.upsert({.owner = cli.principal,
                       .contact_id = cli.contact,
                       .display_name = cli.display_name.empty()
                                           ? cli.contact
                                           : cli.display_name,
                       .relationship = *relationship,
                       .knowledge_access = *knowledge});
    return kExitOk;
  }

  if (cli.command == "create-disclosure") {
    auto result = s.disclosures.create(cli.principal, cli.title, cli.content,
                                       cli.target, cli.target_name);
    if (result.ok()) {
      std::cout << confide::schema::to_hex(result.value->record_id)
                << (result.value->matched ? " matched" : "") << std::endl;
    }
    return report(result);
  }

  if (cli.command == "designate") {
    auto record_id = parse_record(cli.record);
    if (!record_id.has_value()) {
      return kExitUsage;
    }
    return report(cli.reader.empty()
                      ? s.disclosures.clear_designated_reader(*record_id,
                                                              cli.principal)
                      : s.disclosures.set_designated_reader(
                            *record_id, cli.principal, cli.reader));
  }

  if (cli.command == "read-disclosure") {
    auto record_id = parse_record(cli.record);
    if (!record_id.has_value()) {
      return kExitUsage;
    }
    auto result = s.disclosures.read(*record_id, cli.principal);
    if (result.ok()) {
      std::cout << *result.value << std::endl;
    }
    return report(result);
  }

  if (cli.command == "matches") {
    for (const auto& event : s.disclosures.matches(cli.principal)) {
      std::cout << event.first_principal << " " << event.second_principal
                << " " << event.matched_at << std::endl;
    }
    return kExitOk;
  }

  if (cli.command == "delete-account") {
    auto removed = s.authenticator.delete_account(cli.principal);
    std::cout << "removed " << removed << " voiceprint(s)" << std::endl;
    return kExitOk;
  }

  std::cerr << "unknown command: " << cli.command << std::endl;
  return kExitUsage;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto options = confide::config::options{};
  auto cli = command_line{};
  auto config_path = std::string{};
  auto category = std::string{};
  auto target = std::string{};
  auto target_name = std::string{};

  auto generic = po::options_description{"Confide"};
  generic.add_options()("help,h", "Show the help message")(
      "verbose,v", "Enable verbose output")(
      "config,c", po::value<std::string>(&config_path),
      "INI configuration file");

  auto settings = po::options_description{"Settings"};
  settings.add_options()(
      "db-path", po::value<std::string>(&options.db_path)->default_value("confide.db"),
      "RocksDB directory")(
      "log-path", po::value<std::string>(&options.log_path)->default_value("confide.log"),
      "Log file")(
      "master-key", po::value<std::string>(&options.master_key_hex),
      "Hex master key (or CONFIDE_MASTER_KEY)")(
      "auth.high-threshold",
      po::value<double>(&options.authenticator.high_confidence_threshold)
          ->default_value(0.85),
      "Score that issues a session directly")(
      "auth.medium-threshold",
      po::value<double>(&options.authenticator.medium_confidence_threshold)
          ->default_value(0.70),
      "Score that requires a knowledge challenge")(
      "auth.max-attempts",
      po::value<uint32_t>(&options.authenticator.max_attempts_per_window)
          ->default_value(3),
      "Verification attempts per window")(
      "challenge.max-challenges",
      po::value<uint32_t>(&options.challenge.max_challenges)->default_value(2),
      "Challenges per verification")(
      "vault.ultra-secret-requires-challenge",
      po::value<bool>(&options.vault.ultra_secret_requires_challenge)
          ->default_value(false),
      "Release ultra_secret only to challenge-verified sessions");

  auto arguments = po::options_description{"Arguments"};
  arguments.add_options()("command", po::value<std::string>(&cli.command),
                          "Command to run")(
      "principal,p", po::value<std::string>(&cli.principal), "Acting principal")(
      "name", po::value<std::string>(&cli.display_name), "Display name")(
      "channel", po::value<std::string>(&cli.channel)->default_value("cli"),
      "Channel id")("category", po::value<std::string>(&category),
                    "Memory category")(
      "sample", po::value<std::vector<std::string>>(&cli.samples)->composing(),
      "Voice sample (repeatable)")("tier", po::value<std::string>(&cli.tier),
                                   "secret, confidential or ultra_secret")(
      "title", po::value<std::string>(&cli.title), "Record title")(
      "content", po::value<std::string>(&cli.content), "Record content")(
      "authorize",
      po::value<std::vector<std::string>>(&cli.authorized)->composing(),
      "Principal to authorize (repeatable)")(
      "record,r", po::value<std::string>(&cli.record), "Record id (hex)")(
      "target", po::value<std::string>(&target), "Romantic target principal")(
      "target-name", po::value<std::string>(&target_name), "Target name")(
      "reader", po::value<std::string>(&cli.reader), "Designated reader")(
      "contact", po::value<std::string>(&cli.contact), "Contact principal")(
      "relationship", po::value<std::string>(&cli.relationship),
      "Contact relationship")("knowledge",
                              po::value<std::string>(&cli.knowledge),
                              "Contact knowledge level");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  auto description = po::options_description{};
  description.add(generic).add(settings).add(arguments);

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(description)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.contains("config")) {
      auto file = std::ifstream{vm["config"].as<std::string>()};
      if (!file) {
        std::cerr << "cannot open config file" << std::endl;
        return kExitUsage;
      }
      po::store(po::parse_config_file(file, settings), vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << std::endl;
    return kExitUsage;
  }

  if (vm.contains("help") || cli.command.empty()) {
    std::cout << "usage: confide <command> [options]\n"
                 "commands: register enroll verify put-secret get-secret "
                 "authorize revoke reclassify audit-log set-contact "
                 "create-disclosure designate read-disclosure matches "
                 "delete-account\n"
              << description << std::endl;
    return vm.contains("help") ? kExitOk : kExitUsage;
  }
  if (!category.empty()) {
    cli.category = category;
  }
  if (!target.empty()) {
    cli.target = target;
  }
  if (!target_name.empty()) {
    cli.target_name = target_name;
  }

  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console_sink->set_level(vm.contains("verbose") ? spdlog::level::debug
                                                 : spdlog::level::warn);
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      options.log_path, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "main", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  logger->set_level(spdlog::level::debug);
  spdlog::set_default_logger(logger);

  if (options.master_key_hex.empty()) {
    if (const auto* env = std::getenv("CONFIDE_MASTER_KEY")) {
      options.master_key_hex = env;
    }
  }
  auto master_key = confide::crypto::try_make_key(options.master_key_hex);
  if (!master_key.has_value()) {
    spdlog::error("A 32-byte hex master key is required");
    spdlog::shutdown();
    return kExitUsage;
  }
  if (cli.principal.empty()) {
    spdlog::error("--principal is required");
    spdlog::shutdown();
    return kExitUsage;
  }

  spdlog::debug("Opening {}", options.db_path);
  auto status = kExitOk;
  {
    auto s = services{options, *master_key};
    status = run_command(s, cli);
  }

  spdlog::shutdown();
  return status;
}
