#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <titlebook/common/log_level.hpp>
#include <titlebook/execution/engine.hpp>
#include <titlebook/schema/ledger_record.hpp>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;

using encoder_t = titlebook::execution::encoder_t;

void configure_logging(const std::string& log_file,
                       const spdlog::level::level_enum level) {
  spdlog::init_thread_pool(8192, 1);

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "titlebook", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(level);
}

void print_record(encoder_t& encoder,
                  const titlebook::schema::bytes_t& value) {
  auto record = encoder.try_decode<titlebook::schema::ledger_record_t>(
      titlebook::schema::bytes_view_t{value.data(), value.size()});
  if (record) {
    std::cout << titlebook::schema::describe(*record) << std::endl;
  }
  std::cout << titlebook::schema::to_hex(titlebook::schema::bytes_view_t{
                   value.data(), value.size()})
            << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto db_path = std::string{};
  auto config_path = std::string{};
  auto log_level = std::string{};
  auto log_file = std::string{};
  auto function = std::string{};
  auto args = std::vector<std::string>{};

  auto general = po::options_description{"titlebook"};
  general.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_path),
      "Read options from an INI-style file")("verbose,v",
                                             "Enable debug logging");

  auto settings = po::options_description{"Settings"};
  settings.add_options()(
      "db,d",
      po::value<std::string>(&db_path)->default_value("./titlebook.db"),
      "Ledger RocksDB directory")(
      "log-level,l", po::value<std::string>(&log_level)->default_value("info"),
      "trace, debug, info, warn, error, critical or off")(
      "log-file",
      po::value<std::string>(&log_file)->default_value("titlebook.log"),
      "Log file path");

  auto hidden = po::options_description{};
  hidden.add_options()("function", po::value<std::string>(&function))(
      "args", po::value<std::vector<std::string>>(&args));

  auto positional = po::positional_options_description{};
  positional.add("function", 1).add("args", -1);

  auto command_line = po::options_description{};
  command_line.add(general).add(settings).add(hidden);
  auto visible = po::options_description{};
  visible.add(general).add(settings);

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(command_line)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.contains("config")) {
      auto config = std::ifstream{vm["config"].as<std::string>()};
      if (!config.good()) {
        std::cerr << "cannot open config file '"
                  << vm["config"].as<std::string>() << "'" << std::endl;
        return 1;
      }
      po::store(po::parse_config_file(config, settings), vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << std::endl << visible << std::endl;
    return 1;
  }

  if (vm.contains("help") || function.empty()) {
    std::cout << "Usage: titlebook [options] <function> [args...]" << std::endl
              << "Functions: initLedger, query <key>," << std::endl
              << "  createParticipant <id> <first_name> <last_name>,"
              << std::endl
              << "  createAsset <id> <value> <owner_id>," << std::endl
              << "  transferAsset <transferer_id> <transferee_id> <asset_id>"
              << std::endl
              << visible << std::endl;
    return vm.contains("help") ? 0 : 1;
  }

  auto level = titlebook::common::parse_log_level(log_level);
  if (!level) {
    std::cerr << "invalid value '" << log_level << "' for option --log-level"
              << std::endl
              << visible << std::endl;
    return 1;
  }
  configure_logging(log_file,
                    vm.contains("verbose") ? spdlog::level::debug : *level);

  auto encoder = encoder_t{};
  auto storage = titlebook::storage::make_storage<
      titlebook::storage::rocksdb_storage_tag>(db_path);
  auto engine = titlebook::execution::engine{encoder, storage};

  auto invocation = titlebook::schema::invocation_t{
      .function = function, .args = args};
  auto result = engine.invoke(invocation);

  auto exit_code = 0;
  if (result.code != 0) {
    std::cerr << "error " << result.code << " (" << result.log
              << "): " << result.info << std::endl;
    exit_code = 1;
  } else if (function == "query") {
    print_record(encoder, result.data);
  } else {
    auto info = engine.info();
    std::cout << "committed height=" << info.height << " state_root="
              << titlebook::schema::to_hex(titlebook::schema::bytes_view_t{
                     info.state_root.data(), info.state_root.size()})
              << std::endl;
  }

  spdlog::shutdown();
  return exit_code;
}
