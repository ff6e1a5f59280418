#ifndef __TT_HEADERS__
#define __TT_HEADERS__

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "easylogging++.h"
#include "sago/platform_folders.h"
#include "ust.hpp"

using namespace std;
namespace fs = std::filesystem;

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << errno << "): " << strerror(errno);

#ifndef TT_VERSION
#define TT_VERSION "unknown"
#endif

namespace tt {
/** @brief Identifier of a pane, as assigned by the host. */
typedef int64_t PaneId;
/** @brief Identifier of a tab, as assigned by the host. */
typedef int64_t TabId;
/** @brief Identifier of a window, as assigned by the host. */
typedef int64_t WindowId;

/** @brief Sentinel meaning "no pane tracked". */
const PaneId NO_PANE = -1;

template <typename Out>
inline void split(const std::string &s, char delim, Out result) {
  std::stringstream ss;
  ss.str(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    *(result++) = item;
  }
}

inline std::vector<std::string> split(const std::string &s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

inline string trim(const string &s) {
  const char *ws = " \t\r\n";
  auto start = s.find_first_not_of(ws);
  if (start == string::npos) return "";
  auto end = s.find_last_not_of(ws);
  return s.substr(start, end - start + 1);
}

inline string toUpper(string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return s;
}

inline string toLower(string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

inline string GetTempDirectory() {
  const char *tmpDir = ::getenv("TMPDIR");
  if (tmpDir && tmpDir[0] == '/') {
    string retval(tmpDir);
    if (retval.back() != '/') {
      retval.push_back('/');
    }
    return retval;
  }
  return "/tmp/";
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}

inline void InterruptSignalHandler(int signum) {
  STERROR << "Got interrupt";
  CLOG(INFO, "stdout") << endl
                       << "Got interrupt (perhaps ctrl+c?).  Exiting." << endl;
  ::exit(signum);
}
}  // namespace tt

#endif  // __TT_HEADERS__
