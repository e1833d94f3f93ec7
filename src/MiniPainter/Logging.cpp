#include <MiniPainter/Logging.hpp>
#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <algorithm>
#include <cctype>
#include <memory>

namespace MiniPainter {

bool parseLogLevel(const std::string& name, plog::Severity& out){
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if(s == "none") out = plog::none;
    else if(s == "fatal") out = plog::fatal;
    else if(s == "error") out = plog::error;
    else if(s == "warning" || s == "warn") out = plog::warning;
    else if(s == "info") out = plog::info;
    else if(s == "debug") out = plog::debug;
    else if(s == "verbose") out = plog::verbose;
    else return false;
    return true;
}

void initLogging(plog::Severity level, const std::string& logFile){
    // Console goes to stderr; stdout is reserved for command output.
    static plog::ConsoleAppender<plog::TxtFormatter> consoleAppender(plog::streamStdErr);
    static std::unique_ptr<plog::RollingFileAppender<plog::TxtFormatter>> fileAppender;

    if(plog::get()){
        plog::get()->setMaxSeverity(level);
        return;
    }

    plog::Logger<PLOG_DEFAULT_INSTANCE_ID>& logger = plog::init(level, &consoleAppender);
    if(!logFile.empty()){
        fileAppender.reset(new plog::RollingFileAppender<plog::TxtFormatter>(logFile.c_str(), 1024 * 1024, 3));
        logger.addAppender(fileAppender.get());
    }
    PLOGI << "plog initialized (" << plog::severityToString(level) << " -> stderr"
          << (logFile.empty() ? std::string() : ", " + logFile) << ")";
}

} // namespace MiniPainter
