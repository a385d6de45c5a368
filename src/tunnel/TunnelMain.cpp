#include <cxxopts.hpp>

#include "ActionConfig.hpp"
#include "ActionInvoker.hpp"
#include "ActionRegistryWatcher.hpp"
#include "LocalRpcServer.hpp"
#include "LogHandler.hpp"
#include "ProtocolDispatcher.hpp"
#include "RegistrySwapGate.hpp"
#include "SimpleIni.h"
#include "TunnelSession.hpp"
#include "WebSocketTransport.hpp"
#include "sago/platform_folders.h"

using namespace tt;

namespace {
const string DEFAULT_RELAY = "wss://relay.tooltunnel.dev";

struct Settings {
  string relay = DEFAULT_RELAY;
  int port = 0;
  bool watch = true;
  uint64_t maxLogSize = LogFileOptions().maxLogSize;
};

void printActions(const ActionRegistry& registry) {
  for (const auto& action : registry.getActions()) {
    CLOG(INFO, "stdout") << "  - " << action.name << " (" << action.kindName()
                         << ")" << (action.description.empty() ? "" : ": ")
                         << action.description << endl;
  }
}

int validateManifest(const string& configPath) {
  ActionManifest manifest;
  try {
    manifest = ActionConfig::load(configPath);
  } catch (const ActionConfigException& ace) {
    CLOG(INFO, "stdout") << "Invalid manifest " << configPath << ": "
                         << ace.what() << endl;
    return 1;
  }
  CLOG(INFO, "stdout") << configPath << " is valid" << endl;
  CLOG(INFO, "stdout") << "Name: " << manifest.registry->getName() << endl;
  CLOG(INFO, "stdout") << "Version: " << manifest.registry->getVersion()
                       << endl;
  CLOG(INFO, "stdout") << "Actions: " << manifest.registry->size() << endl;
  printActions(*manifest.registry);
  return 0;
}

int initManifest(const string& configPath) {
  if (fs::exists(configPath)) {
    CLOG(INFO, "stdout") << configPath << " already exists" << endl;
    return 1;
  }
  ofstream out(configPath);
  out << ActionConfig::sampleManifest();
  out.close();
  if (out.fail()) {
    CLOG(INFO, "stdout") << "Could not write " << configPath << ": "
                         << strerror(errno) << endl;
    return 1;
  }
  CLOG(INFO, "stdout") << "Created " << configPath << endl;
  CLOG(INFO, "stdout") << "Edit it to add your actions, then run: tooltunnel"
                       << endl;
  return 0;
}

int serveLocal(shared_ptr<ProtocolDispatcher> dispatcher, int port) {
  LocalRpcServer server(dispatcher);
  try {
    port = server.bind("0.0.0.0", port);
  } catch (const std::runtime_error& re) {
    CLOG(INFO, "stdout") << re.what() << endl;
    return 1;
  }
  CLOG(INFO, "stdout") << "Serving locally on http://localhost:" << port
                       << "/mcp" << endl;
  server.listen();
  return 0;
}

int serveTunnel(shared_ptr<ProtocolDispatcher> dispatcher,
                const string& relay) {
  auto registry = dispatcher->getRegistry();
  shared_ptr<WebSocketTransport> transport(new WebSocketTransport());
  TunnelSession session(transport, relay, dispatcher, TT_VERSION,
                        int(registry->size()));
  session.onClientConnected([](const string& clientIp) {
    CLOG(INFO, "stdout") << "Client connected from " << clientIp << endl;
  });

  string tunnelUrl;
  try {
    tunnelUrl = session.connect();
  } catch (const TunnelConnectException& tce) {
    if (tce.getReason() == TunnelConnectException::VERSION_REJECTED) {
      CLOG(INFO, "stdout")
          << "This version of tooltunnel (" << TT_VERSION
          << ") is no longer accepted by the relay. Please upgrade." << endl;
    } else {
      CLOG(INFO, "stdout") << "Could not connect to " << relay << ": "
                           << tce.what() << endl;
    }
    return 1;
  }

  CLOG(INFO, "stdout") << "Tunnel ready: " << tunnelUrl << endl;
  CLOG(INFO, "stdout") << "Serving " << registry->size()
                       << " actions:" << endl;
  printActions(*registry);

  try {
    session.wait();
  } catch (const TunnelSessionException& tse) {
    CLOG(INFO, "stdout") << "Tunnel closed: " << tse.what() << endl;
    session.close();
    return 1;
  }
  CLOG(INFO, "stdout") << "Tunnel closed by relay" << endl;
  session.close();
  return 0;
}

void loadSettingsFile(const string& cfgfilename, bool required,
                      const cxxopts::ParseResult& result, Settings* settings,
                      el::Configurations* defaultConf) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(cfgfilename.c_str());
  if (rc != 0) {
    if (required) {
      STFATAL << "Invalid config file: " << cfgfilename;
    }
    return;
  }

  const char* relay = ini.GetValue("Networking", "relay", NULL);
  if (relay) {
    settings->relay = string(relay);
  }
  const char* portString = ini.GetValue("Networking", "port", NULL);
  if (portString) {
    settings->port = atoi(portString);
  }

  // read verbose level (prioritize command line option over cfgfile)
  const char* vlevel = ini.GetValue("Debug", "verbose", NULL);
  if (!result.count("verbose") && vlevel) {
    el::Loggers::setVerboseLevel(atoi(vlevel));
  }

  const char* silent = ini.GetValue("Debug", "silent", NULL);
  if (silent && atoi(silent) != 0) {
    defaultConf->setGlobally(el::ConfigurationType::Enabled, "false");
  }

  const char* logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && strtoull(logsize, NULL, 10) != 0) {
    settings->maxLogSize = strtoull(logsize, NULL, 10);
  }
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  tt::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, tt::InterruptSignalHandler);

  cxxopts::Options options(
      "tooltunnel", "Expose local actions to remote callers through a relay");
  int exitCode = 0;
  try {
    options.positional_help("[run|validate|init|version]");

    options.add_options()         //
        ("h,help", "Print help")  //
        ("command", "run, validate, init or version",
         cxxopts::value<std::string>()->default_value("run"))  //
        ("c,config", "Action manifest (JSON, or YAML for .yaml/.yml)",
         cxxopts::value<std::string>()->default_value("tooltunnel.json"))  //
        ("relay", "Relay to connect to",
         cxxopts::value<std::string>())  //
        ("local", "Serve over local HTTP instead of the relay")  //
        ("port", "Port for --local (defaults to the manifest's)",
         cxxopts::value<int>())  //
        ("cfgfile", "Location of the settings file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("no-watch", "Do not reload the manifest when it changes")  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ("l,logdir", "Base directory for log files.",
         cxxopts::value<std::string>()->default_value(
             GetTempDirectory()))                   //
        ("logtostdout", "Write log to stdout")  //
        ;

    options.parse_positional({"command"});
    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }

    string command = result["command"].as<string>();
    string configPath = result["config"].as<string>();
    if (command == "version") {
      CLOG(INFO, "stdout") << "tooltunnel version " << TT_VERSION << endl;
      exit(0);
    }
    if (command == "init") {
      exit(initManifest(configPath));
    }
    if (command == "validate") {
      exit(validateManifest(configPath));
    }
    if (command != "run") {
      CLOG(INFO, "stdout") << "Unknown command: " << command << "\n" << endl;
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(1);
    }

    el::Loggers::setVerboseLevel(result["verbose"].as<int>());

    Settings settings;
    string cfgfilename = result["cfgfile"].as<string>();
    if (!cfgfilename.empty()) {
      loadSettingsFile(cfgfilename, true, result, &settings, &defaultConf);
    } else {
      string defaultCfgfile =
          sago::getConfigHome() + "/tooltunnel/tooltunnel.ini";
      if (fs::exists(defaultCfgfile)) {
        loadSettingsFile(defaultCfgfile, false, result, &settings,
                         &defaultConf);
      }
    }
    if (result.count("relay")) {
      settings.relay = result["relay"].as<string>();
    }
    if (result.count("port")) {
      settings.port = result["port"].as<int>();
    }
    if (result.count("no-watch")) {
      settings.watch = false;
    }

    LogFileOptions logOptions;
    logOptions.directory = result["logdir"].as<string>();
    logOptions.toStdout = result.count("logtostdout") > 0;
    logOptions.captureStderr = !logOptions.toStdout;
    logOptions.maxLogSize = settings.maxLogSize;
    string logPath;
    try {
      logPath = LogHandler::setupLogFiles(&defaultConf, logOptions);
    } catch (const LogFileException& lfe) {
      CLOG(INFO, "stdout") << lfe.what() << endl;
      exit(1);
    }
    el::Loggers::reconfigureLogger("default", defaultConf);
    VLOG(1) << "Logging to " << logPath;
    // set thread name
    el::Helpers::setThreadName("tooltunnel-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    ActionManifest manifest;
    try {
      manifest = ActionConfig::load(configPath);
    } catch (const ActionConfigException& ace) {
      CLOG(INFO, "stdout") << "Could not load " << configPath << ": "
                           << ace.what() << endl;
      CLOG(INFO, "stdout") << "Run 'tooltunnel init' to create one." << endl;
      exit(1);
    }
    LOG(INFO) << "Loaded " << manifest.registry->size() << " actions from "
              << configPath;

    shared_ptr<RegistrySwapGate> registryGate(
        new RegistrySwapGate(manifest.registry));
    shared_ptr<ProcessInvoker> processInvoker(
        new ProcessInvoker(make_shared<SubprocessUtils>()));
    shared_ptr<ActionRunner> runner(
        new ActionRunner(processInvoker, make_shared<HttpInvoker>()));
    shared_ptr<ProtocolDispatcher> dispatcher(
        new ProtocolDispatcher(registryGate, runner));

    unique_ptr<ActionRegistryWatcher> watcher;
    if (settings.watch) {
      watcher.reset(new ActionRegistryWatcher(
          configPath, [dispatcher](const ActionManifest& reloaded) {
            dispatcher->updateRegistry(reloaded.registry);
            CLOG(INFO, "stdout")
                << "Reloaded " << reloaded.registry->size() << " actions"
                << endl;
          }));
      watcher->start();
    }

    if (result.count("local")) {
      int port = settings.port ? settings.port : manifest.port;
      exitCode = serveLocal(dispatcher, port);
    } else {
      exitCode = serveTunnel(dispatcher, settings.relay);
    }

    if (watcher) {
      watcher->stop();
    }
  } catch (cxxopts::OptionException& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return exitCode;
}
