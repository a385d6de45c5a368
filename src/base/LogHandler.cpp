#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace tt {
el::Configurations LogHandler::setupLogHandler(int* argc, char*** argv) {
  // Verbosity comes from cxxopts / the settings file, not easylogging's own
  // argument parsing
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations defaultConf;
  defaultConf.setToDefault();
  // %thread prints the name set with el::Helpers::setThreadName
  defaultConf.setGlobally(el::ConfigurationType::Format,
                          "[%level %datetime %thread %fbase:%line] %msg");
  defaultConf.setGlobally(el::ConfigurationType::Enabled, "true");
  defaultConf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  defaultConf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  defaultConf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  defaultConf.set(el::Level::Verbose, el::ConfigurationType::Format,
                  "[%levshort%vlevel %datetime %thread %fbase:%line] %msg");
  return defaultConf;
}

void LogHandler::setupStdoutLogger() {
  el::Logger* stdoutLogger = el::Loggers::getLogger("stdout");
  el::Configurations stdoutConf;
  stdoutConf.setToDefault();
  stdoutConf.setGlobally(el::ConfigurationType::Format, "%msg");
  stdoutConf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  stdoutConf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger(stdoutLogger, stdoutConf);
}

string LogHandler::logFileName(const string& prefix, const string& tag) {
  time_t rawtime = time(NULL);
  struct tm timeinfo;
  localtime_r(&rawtime, &timeinfo);
  char buffer[32];
  strftime(buffer, sizeof(buffer), "%Y-%m-%d_%H-%M-%S", &timeinfo);
  string name = prefix;
  if (!tag.empty()) {
    name += "-" + tag;
  }
  return name + "-" + buffer + ".log";
}

string LogHandler::setupLogFiles(el::Configurations* defaultConf,
                                 const LogFileOptions& options) {
  string logPath =
      createLogFile(options.directory, logFileName(options.prefix, ""));

  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  defaultConf->setGlobally(el::ConfigurationType::Filename, logPath);
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
  defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize,
                           to_string(options.maxLogSize));
  defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput,
                           options.toStdout ? "true" : "false");

  if (options.captureStderr) {
    string stderrPath = createLogFile(options.directory,
                                      logFileName(options.prefix, "stderr"));
    FILE* stderrStream = freopen(stderrPath.c_str(), "w", stderr);
    if (!stderrStream) {
      throw LogFileException("Cannot redirect stderr to " + stderrPath + ": " +
                             strerror(errno));
    }
    setvbuf(stderrStream, NULL, _IOLBF, BUFSIZ);
  }
  return logPath;
}

void LogHandler::rolloutHandler(const char* filename, std::size_t size) {
  // The log file is closed while this runs, so nothing here may log
  string previous = string(filename) + ".1";
  std::error_code ec;
  fs::rename(filename, previous, ec);
  if (ec) {
    fs::remove(filename, ec);
  }
}

string LogHandler::createLogFile(const string& directory,
                                 const string& filename) {
  std::error_code ec;
  fs::create_directories(directory, ec);
  if (ec) {
    throw LogFileException("Cannot create log directory " + directory + ": " +
                           ec.message());
  }
  string path = directory + "/" + filename;
  int fd = ::open(path.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  if (fd == -1) {
    throw LogFileException("Cannot create log file " + path + ": " +
                           strerror(errno));
  }
  ::close(fd);
  return path;
}
}  // namespace tt
