#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <registrar/app/environment.hpp>
#include <registrar/schema/account_state.hpp>
#include <registrar/schema/primitives.hpp>
#include <registrar/schema/registration_state.hpp>
#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <type_traits>

namespace {

struct command_arguments final {
  std::string phone_number;
  std::string aci;
  std::string pni;
  std::string auth_token;
  bool flag{true};
};

template <typename T>
std::string describe(const std::optional<T>& value) {
  if (!value) {
    return "<none>";
  }
  if constexpr (std::is_same_v<T, registrar::schema::uuid_t>) {
    return registrar::schema::to_string(*value);
  } else if constexpr (std::is_same_v<T, std::string>) {
    return *value;
  } else {
    return std::to_string(*value);
  }
}

void print_status(registrar::account::account_manager& accounts) {
  auto state = accounts.current_state();
  std::cout << "registration_state: "
            << registrar::schema::to_string(accounts.registration_state())
            << "\n"
            << "local_number: " << describe(accounts.local_number()) << "\n"
            << "local_aci: " << describe(accounts.local_aci()) << "\n"
            << "local_pni: " << describe(accounts.local_pni()) << "\n"
            << "registration_date: " << describe(state->registration_date)
            << "\n"
            << "device_id: " << state->device_id << "\n"
            << "device_name: " << describe(state->device_name) << "\n"
            << "is_onboarded: " << state->is_onboarded << "\n"
            << "is_deregistered: " << state->is_deregistered << "\n"
            << "is_transfer_in_progress: " << state->is_transfer_in_progress
            << "\n"
            << "was_transferred: " << state->was_transferred << "\n"
            << "reregistration_phone_number: "
            << describe(state->reregistration_phone_number) << "\n"
            << "reregistration_aci: " << describe(state->reregistration_aci)
            << "\n"
            << "manual_message_fetch_enabled: "
            << state->manual_message_fetch_enabled << "\n"
            << "is_discoverable_by_phone_number: "
            << describe(state->is_discoverable_by_phone_number) << std::endl;
}

std::optional<registrar::schema::uuid_t> parse_uuid(const std::string& name,
                                                    const std::string& text) {
  auto uuid = registrar::schema::try_make_uuid(text);
  if (!uuid) {
    spdlog::error("--{} is not a valid UUID: '{}'", name, text);
  }
  return uuid;
}

// Parses the identity arguments shared by the registration commands.
struct identity_arguments final {
  registrar::schema::e164_t phone_number;
  registrar::schema::uuid_t aci;
  std::optional<registrar::schema::uuid_t> pni;
};

std::optional<identity_arguments> parse_identity(
    const command_arguments& args) {
  if (args.phone_number.empty() || args.aci.empty()) {
    spdlog::error("--phone-number and --aci are required");
    return std::nullopt;
  }
  auto aci = parse_uuid("aci", args.aci);
  if (!aci) {
    return std::nullopt;
  }
  auto identity = identity_arguments{.phone_number = args.phone_number,
                                     .aci = *aci,
                                     .pni = std::nullopt};
  if (!args.pni.empty()) {
    identity.pni = parse_uuid("pni", args.pni);
    if (!identity.pni) {
      return std::nullopt;
    }
  }
  return identity;
}

using command_t =
    std::function<int(registrar::app::environment&, const command_arguments&)>;

std::map<std::string, command_t> make_commands() {
  using registrar::app::environment;
  using write_transaction_t = registrar::account::write_transaction_t;

  auto commands = std::map<std::string, command_t>{};
  commands["status"] = [](environment& env, const command_arguments&) {
    print_status(env.accounts());
    return 0;
  };
  commands["begin-verification"] = [](environment& env,
                                      const command_arguments& args) {
    auto identity = parse_identity(args);
    if (!identity) {
      return 1;
    }
    env.accounts().begin_verification(identity->phone_number, identity->aci,
                                      identity->pni);
    print_status(env.accounts());
    return 0;
  };
  commands["confirm"] = [](environment& env, const command_arguments& args) {
    auto identity = parse_identity(args);
    if (!identity) {
      return 1;
    }
    env.accounts().begin_verification(identity->phone_number, identity->aci,
                                      identity->pni);
    env.accounts().did_register();
    print_status(env.accounts());
    return 0;
  };
  commands["register-primary"] = [](environment& env,
                                    const command_arguments& args) {
    auto identity = parse_identity(args);
    if (!identity) {
      return 1;
    }
    if (args.auth_token.empty()) {
      spdlog::error("--auth-token is required");
      return 1;
    }
    env.storage().write([&](write_transaction_t& tx) {
      env.accounts().did_register_primary(identity->phone_number, identity->aci,
                                          identity->pni, args.auth_token, tx);
    });
    print_status(env.accounts());
    return 0;
  };
  commands["change-number"] = [](environment& env,
                                 const command_arguments& args) {
    auto identity = parse_identity(args);
    if (!identity) {
      return 1;
    }
    env.storage().write([&](write_transaction_t& tx) {
      env.accounts().update_local_phone_number(identity->phone_number,
                                               identity->aci, identity->pni,
                                               args.flag, tx);
    });
    print_status(env.accounts());
    return 0;
  };
  commands["deregister"] = [](environment& env, const command_arguments& args) {
    env.accounts().set_is_deregistered(args.flag);
    print_status(env.accounts());
    return 0;
  };
  commands["reregister"] = [](environment& env, const command_arguments&) {
    if (!env.accounts().reset_for_reregistration()) {
      return 1;
    }
    print_status(env.accounts());
    return 0;
  };
  commands["onboard"] = [](environment& env, const command_arguments& args) {
    env.accounts().set_is_onboarded(args.flag);
    print_status(env.accounts());
    return 0;
  };
  commands["transfer-start"] = [](environment& env, const command_arguments&) {
    env.accounts().set_is_transfer_in_progress(true);
    print_status(env.accounts());
    return 0;
  };
  commands["transfer-finish"] = [](environment& env,
                                   const command_arguments&) {
    env.accounts().set_is_transfer_in_progress(false);
    env.accounts().set_was_transferred(true);
    print_status(env.accounts());
    return 0;
  };
  commands["manual-fetch"] = [](environment& env,
                                const command_arguments& args) {
    env.accounts().set_manual_message_fetch_enabled(args.flag);
    print_status(env.accounts());
    return 0;
  };
  commands["discoverable"] = [](environment& env,
                                const command_arguments& args) {
    env.storage().write([&](write_transaction_t& tx) {
      env.accounts().set_is_discoverable_by_phone_number(args.flag, tx);
    });
    print_status(env.accounts());
    return 0;
  };
  return commands;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto options = registrar::app::environment_options{};
  auto args = command_arguments{};
  auto command = std::string{};
  auto log_file = std::string{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Registrar"};
  description.add_options()("help,h", "Show the help message")(
      "db-path,d",
      boost::program_options::value<std::string>(&options.db_path)
          ->default_value("registrar.db"),
      "Path of the account database")(
      "secondary", "Run as a secondary process sharing the main app's database")(
      "verbose,v", "Enable verbose output")(
      "log-file",
      boost::program_options::value<std::string>(&log_file)->default_value(
          "registrar.log"),
      "File to append logs to")(
      "command,c",
      boost::program_options::value<std::string>(&command)->default_value(
          "status"),
      "status, begin-verification, confirm, register-primary, change-number, "
      "deregister, reregister, onboard, transfer-start, transfer-finish, "
      "manual-fetch or discoverable")(
      "phone-number",
      boost::program_options::value<std::string>(&args.phone_number),
      "E.164 phone number")(
      "aci", boost::program_options::value<std::string>(&args.aci),
      "Account identifier")(
      "pni", boost::program_options::value<std::string>(&args.pni),
      "Phone number identifier")(
      "auth-token",
      boost::program_options::value<std::string>(&args.auth_token),
      "Server auth token for register-primary")(
      "flag",
      boost::program_options::value<bool>(&args.flag)->default_value(true),
      "Value for the flag commands");

  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& ex) {
    std::cerr << ex.what() << "\n" << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "registrar", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  options.is_main_app = !vm.contains("secondary");

  auto commands = make_commands();
  auto found = commands.find(command);
  if (found == commands.end()) {
    spdlog::error("Unknown command '{}'", command);
    spdlog::shutdown();
    return 1;
  }

  auto result = 0;
  try {
    auto env = registrar::app::environment{options};
    result = found->second(env, args);
  } catch (const registrar::storage::storage_error& ex) {
    spdlog::error("Command '{}' failed: {}", command, ex.what());
    result = 1;
  }

  spdlog::shutdown();
  return result;
}
