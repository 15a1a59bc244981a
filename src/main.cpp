#include <cpptrace/cpptrace.hpp>

#include <filesystem>
#include <memory>
#include <string>

#include "command_line_parser.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "node.hpp"
#include "settings_manager.hpp"

int main(int argc, char** argv){
  try {
    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(std::filesystem::current_path() / ".config" / "settings.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0])
                               ? std::filesystem::path(argv[0]).filename().string()
                               : "chunkmesh");
    std::string error;
    if(!parser.parse(argc, argv, *settings, error)) {
      init_logging(false);
      print_err(nullptr, "{}", error);
      parser.usage();
      return 2;
    }
    if(settings->help_requested()) {
      init_logging(false);
      parser.usage();
      return 0;
    }

    init_logging(settings->get<bool>("verbose"), settings->get<std::string>("log_file"));
    auto logger = std::make_shared<Logger>("chunkmesh");
    if(settings->get<bool>("verbose")) {
      logger->debug("Verbose logging enabled");
    }

    auto problems = settings->validate();
    if(!problems.empty()) {
      for(const auto& problem : problems) {
        logger->print_err("{}", problem);
      }
      parser.usage();
      return 2;
    }

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    Node node(settings, logger);
    return node.run();
  } catch(const TransferError& e) {
    Logger logger("chunkmesh");
    logger.error("{} error: {}", error_kind_name(e.kind()), e.what());
    cpptrace::generate_trace().print();
    return 1;
  } catch(const std::exception& e) {
    Logger logger("chunkmesh");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
