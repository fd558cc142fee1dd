#include "SessionConfig.hpp"

#include "SimpleIni.h"

namespace uex {
namespace {
double parseSeconds(const char* key, const char* value) {
  try {
    return stod(value);
  } catch (const std::exception&) {
    throw std::runtime_error(string("Invalid value for ") + key + ": " + value);
  }
}
}  // namespace

string SessionConfig::unescape(const string& value) {
  string s;
  for (size_t a = 0; a < value.size(); a++) {
    if (value[a] != '\\' || a + 1 == value.size()) {
      s.push_back(value[a]);
      continue;
    }
    char c = value[++a];
    switch (c) {
      case 'r':
        s.push_back('\r');
        break;
      case 'n':
        s.push_back('\n');
        break;
      case 't':
        s.push_back('\t');
        break;
      case '\\':
        s.push_back('\\');
        break;
      default:
        s.push_back('\\');
        s.push_back(c);
        break;
    }
  }
  return s;
}

SessionConfig SessionConfig::loadFromIni(const string& path) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + path);
  }

  SessionConfig config;
  const char* timeoutString = ini.GetValue("Session", "timeout", NULL);
  if (timeoutString) {
    double t = parseSeconds("timeout", timeoutString);
    if (t > 0) {
      config.timeout = Seconds(t);
    }
  }
  const char* eolString = ini.GetValue("Session", "eol", NULL);
  if (eolString) {
    config.eol = unescape(eolString);
  }
  const char* delayString = ini.GetValue("Session", "send_delay", NULL);
  if (delayString) {
    double d = parseSeconds("send_delay", delayString);
    if (d > 0) {
      config.sendDelay = Seconds(d);
    }
  }
  const char* sliceString = ini.GetValue("Session", "poll_slice", NULL);
  if (sliceString) {
    double s = parseSeconds("poll_slice", sliceString);
    if (s <= 0) {
      throw std::runtime_error("poll_slice must be positive");
    }
    config.pollSlice = Seconds(s);
  }
  long chunkSize = ini.GetLongValue("Session", "read_chunk_size",
                                    long(config.readChunkSize));
  if (chunkSize <= 0) {
    throw std::runtime_error("read_chunk_size must be positive");
  }
  config.readChunkSize = size_t(chunkSize);
  const char* graceString =
      ini.GetValue("Session", "close_grace_period", NULL);
  if (graceString) {
    config.closeGracePeriod =
        Seconds(std::max(0.0, parseSeconds("close_grace_period", graceString)));
  }

  // read verbose level
  const char* vlevel = ini.GetValue("Debug", "verbose", NULL);
  if (vlevel) {
    config.verbose = atoi(vlevel);
    el::Loggers::setVerboseLevel(config.verbose);
  }
  VLOG(1) << "Loaded session config from " << path;
  return config;
}
}  // namespace uex
